//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/core/lightweight_test.hpp>
#include <boost/system/error_code.hpp>

#include <iterator>
#include <ostream>

#include "pgwire/client_errc.hpp"
#include "pgwire/extended_error.hpp"
#include "pgwire/protocol/async.hpp"
#include "pgwire/protocol/command_complete.hpp"
#include "pgwire/protocol/connection_state.hpp"
#include "pgwire/protocol/notice_error.hpp"
#include "pgwire/protocol/ready_for_query.hpp"
#include "pgwire/protocol/startup.hpp"
#include "pgwire/protocol/startup_fsm.hpp"

using namespace pgwire;
using boost::system::error_code;
using protocol::startup_fsm;

// Operators
static const char* to_string(startup_fsm::result_type t)
{
    switch (t)
    {
        case startup_fsm::result_type::done: return "done";
        case startup_fsm::result_type::read: return "read";
        case startup_fsm::result_type::write: return "write";
        default: return "<unknown startup_fsm::result_type>";
    }
}

namespace pgwire::protocol {

std::ostream& operator<<(std::ostream& os, startup_fsm::result_type t) { return os << to_string(t); }

}  // namespace pgwire::protocol

namespace {

void test_success()
{
    protocol::startup_params params{.username = "postgres", .password = "", .database = "postgres"};
    protocol::connection_state st;
    diagnostics diag;
    startup_fsm fsm{params};

    // Initiate. The FSM asks us to write the initial message
    auto res = fsm.resume(st, diag);
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::write);
    const unsigned char expected_msg[] = {
        0x00, 0x00, 0x00, 0x29, 0x00, 0x03, 0x00, 0x00, 0x75, 0x73, 0x65, 0x72, 0x00, 0x70,
        0x6f, 0x73, 0x74, 0x67, 0x72, 0x65, 0x73, 0x00, 0x64, 0x61, 0x74, 0x61, 0x62, 0x61,
        0x73, 0x65, 0x00, 0x70, 0x6f, 0x73, 0x74, 0x67, 0x72, 0x65, 0x73, 0x00, 0x00,
    };
    BOOST_TEST_ALL_EQ(
        st.write_buffer.begin(),
        st.write_buffer.end(),
        std::begin(expected_msg),
        std::end(expected_msg)
    );

    // Write successful
    res = fsm.resume(st, diag);
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::read);

    // Server sends us an authentication success message. We still need to wait until ReadyForQuery
    res = fsm.resume(st, diag, protocol::authentication_ok{});
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::read);

    // Server sends us some parameter status messages, which are recorded
    res = fsm.resume(st, diag, protocol::parameter_status{.name = "client_encoding", .value = "utf8"});
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::read);
    res = fsm.resume(st, diag, protocol::parameter_status{.name = "in_hot_standby", .value = "off"});
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::read);
    BOOST_TEST_EQ(st.server_parameters.at("client_encoding"), "utf8");
    BOOST_TEST_EQ(st.server_parameters.at("in_hot_standby"), "off");

    // Server sends us the identifiers for cancellation
    res = fsm.resume(st, diag, protocol::backend_key_data{.process_id = 10, .secret_key = 42});
    BOOST_TEST_EQ(st.backend_process_id, 10);
    BOOST_TEST_EQ(st.backend_secret_key, 42);
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::read);

    // Server sends us ReadyForQuery
    res = fsm.resume(st, diag, protocol::ready_for_query{.status = protocol::transaction_status::idle});
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::done);
    BOOST_TEST_EQ(res.ec, error_code());
}

// The application name is sent as an additional parameter
void test_application_name()
{
    protocol::startup_params params{
        .username = "u",
        .password = "",
        .database = "",
        .application_name = "app",
    };
    protocol::connection_state st;
    diagnostics diag;
    startup_fsm fsm{params};

    auto res = fsm.resume(st, diag);
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::write);
    const unsigned char expected_msg[] = {
        0x00, 0x00, 0x00, 0x25, 0x00, 0x03, 0x00, 0x00, 'u', 's', 'e', 'r', 0x00, 'u', 0x00, 'a', 'p', 'p',
        'l',  'i',  'c',  'a',  't',  'i',  'o',  'n',  '_', 'n', 'a', 'm', 'e', 0x00, 'a', 'p', 'p', 0x00,
        0x00,
    };
    BOOST_TEST_ALL_EQ(
        st.write_buffer.begin(),
        st.write_buffer.end(),
        std::begin(expected_msg),
        std::end(expected_msg)
    );
}

// Cleartext password authentication
void test_cleartext_password()
{
    protocol::startup_params params{.username = "postgres", .password = "secret", .database = "postgres"};
    protocol::connection_state st;
    diagnostics diag;
    startup_fsm fsm{params};

    auto res = fsm.resume(st, diag);
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::write);
    res = fsm.resume(st, diag);
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::read);

    // The server asks for a password
    res = fsm.resume(st, diag, protocol::authentication_cleartext_password{});
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::write);
    const unsigned char expected_msg[] = {0x70, 0x00, 0x00, 0x00, 0x0b, 's', 'e', 'c', 'r', 'e', 't', 0x00};
    BOOST_TEST_ALL_EQ(
        st.write_buffer.begin(),
        st.write_buffer.end(),
        std::begin(expected_msg),
        std::end(expected_msg)
    );

    // Login successful
    res = fsm.resume(st, diag);
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::read);
    res = fsm.resume(st, diag, protocol::authentication_ok{});
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::read);
    res = fsm.resume(st, diag, protocol::ready_for_query{.status = protocol::transaction_status::idle});
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::done);
    BOOST_TEST_EQ(res.ec, error_code());
}

void test_error_password_required()
{
    protocol::startup_params params{.username = "postgres", .password = "", .database = "postgres"};
    protocol::connection_state st;
    diagnostics diag;
    startup_fsm fsm{params};

    fsm.resume(st, diag);
    fsm.resume(st, diag);
    auto res = fsm.resume(st, diag, protocol::authentication_cleartext_password{});
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::done);
    BOOST_TEST_EQ(res.ec, error_code(client_errc::password_required));
}

void test_error_auth_rejected()
{
    protocol::startup_params params{.username = "postgres", .password = "", .database = "postgres"};
    protocol::connection_state st;
    diagnostics diag;
    startup_fsm fsm{params};

    fsm.resume(st, diag);
    fsm.resume(st, diag);
    auto res = fsm.resume(
        st,
        diag,
        protocol::error_response{
            {.severity = "FATAL", .sqlstate = "28000", .message = "role \"postgres\" does not exist"}
    }
    );
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::done);
    BOOST_TEST_EQ(res.ec, error_code(client_errc::auth_failed));
    BOOST_TEST_EQ(diag.message(), "FATAL: 28000: role \"postgres\" does not exist");
}

void test_error_unsupported_method()
{
    protocol::startup_params params{.username = "postgres", .password = "", .database = "postgres"};
    protocol::connection_state st;
    diagnostics diag;
    startup_fsm fsm{params};

    fsm.resume(st, diag);
    fsm.resume(st, diag);
    auto res = fsm.resume(st, diag, protocol::authentication_md5_password{});
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::done);
    BOOST_TEST_EQ(res.ec, error_code(client_errc::auth_md5_password_unsupported));
}

// Messages that are not part of the handshake are a protocol violation
void test_error_unexpected_message()
{
    protocol::startup_params params{.username = "postgres", .password = "", .database = "postgres"};
    protocol::connection_state st;
    diagnostics diag;
    startup_fsm fsm{params};

    fsm.resume(st, diag);
    fsm.resume(st, diag);
    fsm.resume(st, diag, protocol::authentication_ok{});
    auto res = fsm.resume(st, diag, protocol::command_complete{.tag = "SELECT 1"});
    BOOST_TEST_EQ(res.type, startup_fsm::result_type::done);
    BOOST_TEST_EQ(res.ec, error_code(client_errc::unexpected_message));
}

}  // namespace

int main()
{
    test_success();
    test_application_name();
    test_cleartext_password();
    test_error_password_required();
    test_error_auth_rejected();
    test_error_unsupported_method();
    test_error_unexpected_message();

    return boost::report_errors();
}
