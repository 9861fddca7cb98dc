//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/core/lightweight_test.hpp>
#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <iterator>
#include <string_view>
#include <vector>

#include "pgwire/client_errc.hpp"
#include "pgwire/protocol/async.hpp"
#include "pgwire/protocol/copy.hpp"
#include "pgwire/protocol/messages.hpp"
#include "pgwire/protocol/notice_error.hpp"
#include "pgwire/protocol/query.hpp"
#include "pgwire/protocol/terminate.hpp"

using namespace pgwire;
using boost::system::error_code;

namespace {

//
// Serialization
//
void test_serialize_query()
{
    std::vector<unsigned char> buff;
    BOOST_TEST_EQ(protocol::serialize(protocol::query{"SELECT 1"}, buff), error_code());
    const unsigned char expected[] = {'Q', 0x00, 0x00, 0x00, 0x0d, 'S', 'E', 'L', 'E', 'C', 'T', ' ', '1', 0x00};
    BOOST_TEST_ALL_EQ(buff.begin(), buff.end(), std::begin(expected), std::end(expected));
}

void test_serialize_copy_data()
{
    const unsigned char payload[] = {'1', '\t', 'a', '\n'};
    std::vector<unsigned char> buff;
    BOOST_TEST_EQ(protocol::serialize(protocol::copy_data{payload}, buff), error_code());
    const unsigned char expected[] = {'d', 0x00, 0x00, 0x00, 0x08, '1', '\t', 'a', '\n'};
    BOOST_TEST_ALL_EQ(buff.begin(), buff.end(), std::begin(expected), std::end(expected));
}

void test_serialize_copy_data_empty()
{
    std::vector<unsigned char> buff;
    BOOST_TEST_EQ(protocol::serialize(protocol::copy_data{}, buff), error_code());
    const unsigned char expected[] = {'d', 0x00, 0x00, 0x00, 0x04};
    BOOST_TEST_ALL_EQ(buff.begin(), buff.end(), std::begin(expected), std::end(expected));
}

void test_serialize_copy_done()
{
    std::vector<unsigned char> buff;
    BOOST_TEST_EQ(protocol::serialize(protocol::copy_done{}, buff), error_code());
    const unsigned char expected[] = {'c', 0x00, 0x00, 0x00, 0x04};
    BOOST_TEST_ALL_EQ(buff.begin(), buff.end(), std::begin(expected), std::end(expected));
}

void test_serialize_copy_fail()
{
    std::vector<unsigned char> buff;
    BOOST_TEST_EQ(protocol::serialize(protocol::copy_fail{"abort"}, buff), error_code());
    const unsigned char expected[] = {'f', 0x00, 0x00, 0x00, 0x0a, 'a', 'b', 'o', 'r', 't', 0x00};
    BOOST_TEST_ALL_EQ(buff.begin(), buff.end(), std::begin(expected), std::end(expected));
}

// Messages are appended to the buffer
void test_serialize_several()
{
    std::vector<unsigned char> buff;
    BOOST_TEST_EQ(protocol::serialize(protocol::copy_done{}, buff), error_code());
    BOOST_TEST_EQ(protocol::serialize(protocol::terminate{}, buff), error_code());
    const unsigned char expected[] = {'c', 0x00, 0x00, 0x00, 0x04, 'X', 0x00, 0x00, 0x00, 0x04};
    BOOST_TEST_ALL_EQ(buff.begin(), buff.end(), std::begin(expected), std::end(expected));
}

//
// Parsing
//
void test_parse_notification_response()
{
    const unsigned char body[] = {0x00, 0x00, 0x00, 0x2a, 'c', 'h', 0x00, 'h', 'i', 0x00};
    protocol::any_backend_message msg;
    BOOST_TEST_EQ(protocol::parse('A', body, msg), error_code());
    const auto* notif = boost::variant2::get_if<protocol::notification_response>(&msg);
    BOOST_TEST(notif != nullptr);
    if (notif)
    {
        BOOST_TEST_EQ(notif->process_id, 42);
        BOOST_TEST_EQ(notif->channel_name, "ch");
        BOOST_TEST_EQ(notif->payload, "hi");
    }
    BOOST_TEST(protocol::is_async_message(msg));
}

void test_parse_copy_in_response()
{
    const unsigned char body[] = {0x00, 0x00, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    protocol::any_backend_message msg;
    BOOST_TEST_EQ(protocol::parse('G', body, msg), error_code());
    const auto* res = boost::variant2::get_if<protocol::copy_in_response>(&msg);
    BOOST_TEST(res != nullptr);
    if (res)
    {
        BOOST_TEST(res->overall_fmt_code == protocol::format_code::text);
        BOOST_TEST_EQ(res->fmt_codes.size(), 3u);
        BOOST_TEST(res->fmt_codes[2] == protocol::format_code::text);
    }
    BOOST_TEST(!protocol::is_async_message(msg));
}

void test_parse_copy_out_response_binary()
{
    const unsigned char body[] = {0x01, 0x00, 0x01, 0x00, 0x01};
    protocol::any_backend_message msg;
    BOOST_TEST_EQ(protocol::parse('H', body, msg), error_code());
    const auto* res = boost::variant2::get_if<protocol::copy_out_response>(&msg);
    BOOST_TEST(res != nullptr);
    if (res)
    {
        BOOST_TEST(res->overall_fmt_code == protocol::format_code::binary);
        BOOST_TEST_EQ(res->fmt_codes.size(), 1u);
        BOOST_TEST(res->fmt_codes[0] == protocol::format_code::binary);
    }
}

void test_parse_copy_response_error()
{
    // Declares 2 format codes but contains only one
    const unsigned char body[] = {0x00, 0x00, 0x02, 0x00, 0x00};
    protocol::any_backend_message msg;
    BOOST_TEST_NE(protocol::parse('G', body, msg), error_code());

    // Invalid overall format code
    const unsigned char body2[] = {0x02, 0x00, 0x00};
    BOOST_TEST_EQ(protocol::parse('G', body2, msg), error_code(client_errc::protocol_value_error));
}

void test_parse_copy_done_extra_bytes()
{
    const unsigned char body[] = {0x00};
    protocol::any_backend_message msg;
    BOOST_TEST_EQ(protocol::parse('c', body, msg), error_code(client_errc::extra_bytes));
}

void test_parse_error_response()
{
    const unsigned char body[] = {
        'S', 'E', 'R', 'R', 'O', 'R', 0x00, 'C', '4', '2', 'P', '0', '1', 0x00,
        'M', 'b', 'a', 'd', 0x00, 'Z', 'z', 0x00, 0x00,
    };
    protocol::any_backend_message msg;
    BOOST_TEST_EQ(protocol::parse('E', body, msg), error_code());
    const auto* err = boost::variant2::get_if<protocol::error_response>(&msg);
    BOOST_TEST(err != nullptr);
    if (err)
    {
        BOOST_TEST(err->severity == std::string_view("ERROR"));
        BOOST_TEST(err->sqlstate == std::string_view("42P01"));
        BOOST_TEST(err->message == std::string_view("bad"));
    }
}

}  // namespace

int main()
{
    test_serialize_query();
    test_serialize_copy_data();
    test_serialize_copy_data_empty();
    test_serialize_copy_done();
    test_serialize_copy_fail();
    test_serialize_several();

    test_parse_notification_response();
    test_parse_copy_in_response();
    test_parse_copy_out_response_binary();
    test_parse_copy_response_error();
    test_parse_copy_done_extra_bytes();
    test_parse_error_response();

    return boost::report_errors();
}
