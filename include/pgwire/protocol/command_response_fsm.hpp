//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_COMMAND_RESPONSE_FSM_HPP
#define PGWIRE_PROTOCOL_COMMAND_RESPONSE_FSM_HPP

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <string>

#include "pgwire/copy_format.hpp"
#include "pgwire/extended_error.hpp"
#include "pgwire/protocol/messages.hpp"
#include "pgwire/protocol/ready_for_query.hpp"

namespace pgwire::protocol {

// Interprets the messages the server sends in response to a simple Query.
// Message-driven: the caller reads messages and passes them to resume().
//   - read: the response is not complete. Read another message
//   - copy_in: the server is waiting for CopyData. Send it, followed by CopyDone or CopyFail,
//     then keep reading and passing messages
//   - copy_out: the server will send CopyData messages. CopyData messages
//     are to be handled by the caller. Any other message must be passed to resume()
//   - done: ReadyForQuery was received. error() contains the outcome of the command
// Asynchronous messages (notices, notifications, parameter status) are accepted and ignored.
class command_response_fsm
{
public:
    enum class result_type
    {
        done,
        read,
        copy_in,
        copy_out,
    };

    struct result
    {
        result_type type;
        boost::system::error_code ec;

        result(boost::system::error_code ec) noexcept : type(result_type::done), ec(ec) {}
        result(result_type t) noexcept : type(t) {}
    };

    command_response_fsm() = default;

    result resume(const any_backend_message& msg);

    // Tag of the last CommandComplete received (e.g. "COPY 2")
    const std::string& command_tag() const noexcept { return tag_; }

    // Number of DataRow messages received
    std::size_t rows() const noexcept { return rows_; }

    // Valid after copy_in or copy_out has been returned
    const copy_format& format() const noexcept { return format_; }

    // Valid after done has been returned
    transaction_status status() const noexcept { return status_; }

    // Server diagnostics for the first error received
    const diagnostics& diag() const noexcept { return diag_; }

private:
    struct visitor;

    enum class phase
    {
        response,
        copy_in,
        copy_out,
    };

    phase phase_{phase::response};
    std::string tag_;
    std::size_t rows_{};
    copy_format format_;
    transaction_status status_{transaction_status::idle};
    boost::system::error_code stored_ec_;
    diagnostics diag_;
};

}  // namespace pgwire::protocol

#endif
