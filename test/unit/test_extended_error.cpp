//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert/source_location.hpp>
#include <boost/core/lightweight_test.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <string>
#include <string_view>

#include "pgwire/client_errc.hpp"
#include "pgwire/extended_error.hpp"

using namespace pgwire;
using boost::system::error_code;

namespace {

void test_throw_on_error_success()
{
    // No error, no exception
    detail::throw_on_error(error_code(), diagnostics("Ignored"), BOOST_CURRENT_LOCATION);
}

void test_throw_on_error_error()
{
    try
    {
        detail::throw_on_error(client_errc::wrong_state, diagnostics("My message"), BOOST_CURRENT_LOCATION);
        BOOST_TEST(false);
    }
    catch (const error_with_diagnostics& err)
    {
        BOOST_TEST_EQ(err.code(), error_code(client_errc::wrong_state));
        BOOST_TEST_EQ(err.get_diagnostics().message(), "My message");
        BOOST_TEST(std::string_view(err.what()).find("My message") != std::string_view::npos);
    }
}

// error_with_diagnostics can be caught as a regular system_error
void test_throw_exception_from_error()
{
    try
    {
        throw_exception_from_error(
            extended_error{.code = client_errc::value_too_big, .diag = std::string("Too big")},
            BOOST_CURRENT_LOCATION
        );
        BOOST_TEST(false);
    }
    catch (const boost::system::system_error& err)
    {
        BOOST_TEST_EQ(err.code(), error_code(client_errc::value_too_big));
    }
}

void test_category()
{
    error_code ec = client_errc::not_a_copy_query;
    BOOST_TEST_EQ(std::string_view(ec.category().name()), "pgwire.client");
    BOOST_TEST_EQ(ec.message(), "The command did not start a COPY operation");
}

}  // namespace

int main()
{
    test_throw_on_error_success();
    test_throw_on_error_error();
    test_throw_exception_from_error();
    test_category();

    return boost::report_errors();
}
