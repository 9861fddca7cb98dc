//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_MESSAGES_HPP
#define PGWIRE_PROTOCOL_MESSAGES_HPP

#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <span>

#include "pgwire/protocol/async.hpp"
#include "pgwire/protocol/command_complete.hpp"
#include "pgwire/protocol/copy.hpp"
#include "pgwire/protocol/data_row.hpp"
#include "pgwire/protocol/empty_query_response.hpp"
#include "pgwire/protocol/notice_error.hpp"
#include "pgwire/protocol/ready_for_query.hpp"
#include "pgwire/protocol/row_description.hpp"
#include "pgwire/protocol/startup.hpp"

namespace pgwire {
namespace protocol {

//
// Messages that we may receive from the backend
//
using any_backend_message = boost::variant2::variant<
    authentication_ok,
    authentication_kerberos_v5,
    authentication_cleartext_password,
    authentication_md5_password,
    authentication_gss,
    authentication_gss_continue,
    authentication_sspi,
    authentication_sasl,
    authentication_sasl_continue,
    authentication_sasl_final,
    backend_key_data,
    command_complete,
    copy_data,
    copy_done,
    copy_in_response,
    copy_out_response,
    copy_both_response,
    data_row,
    empty_query_response,
    error_response,
    negotiate_protocol_version,
    notice_response,
    notification_response,
    parameter_status,
    ready_for_query,
    row_description>;

// Parses a message given its type byte and its body (without header).
// Message types belonging to subprotocols we don't speak (e.g. extended query) yield unexpected_message
boost::system::error_code parse(
    std::uint8_t message_type,
    std::span<const unsigned char> data,
    any_backend_message& to
);

// Messages that the server may send at any time, regardless of the command being executed
inline bool is_async_message(const any_backend_message& msg)
{
    return boost::variant2::holds_alternative<notification_response>(msg) ||
           boost::variant2::holds_alternative<notice_response>(msg) ||
           boost::variant2::holds_alternative<parameter_status>(msg);
}

}  // namespace protocol
}  // namespace pgwire

#endif
