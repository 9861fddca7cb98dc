//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_PROTOCOL_STATE_HPP
#define PGWIRE_PROTOCOL_PROTOCOL_STATE_HPP

#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <string_view>

#include "pgwire/copy_format.hpp"
#include "pgwire/protocol/ready_for_query.hpp"

namespace pgwire {
namespace protocol {

//
// The phases a connection goes through. Exactly one is active at any time.
//

// No physical connection
struct closed_state
{
};

// Physical connection and startup handshake in progress
struct connecting_state
{
};

// Idle, waiting for a command
struct ready_state
{
    transaction_status status{transaction_status::idle};
};

// A simple query has been sent and its response is being read
struct executing_state
{
};

// The server is waiting for CopyData from us
struct copy_in_state
{
    copy_format format;
};

// The server is sending us CopyData
struct copy_out_state
{
    copy_format format;
};

// An I/O error or protocol violation happened. Only closing is allowed
struct broken_state
{
    boost::system::error_code reason;
};

using protocol_state = boost::variant2::variant<
    closed_state,
    connecting_state,
    ready_state,
    executing_state,
    copy_in_state,
    copy_out_state,
    broken_state>;

// Operations that the connector may be asked to perform
enum class operation
{
    connect,
    execute,
    copy_data,
    copy_done,
    copy_fail,
    read_copy_data,
    close,
};

// Human-readable names, used in diagnostics and logs
std::string_view state_name(const protocol_state& st) noexcept;
std::string_view operation_name(operation op) noexcept;

// Is op legal in st? Returns wrong_state or connection_broken if it's not.
// Never modifies the state
boost::system::error_code check_legal(const protocol_state& st, operation op) noexcept;

// The transition table. Any state change must satisfy this
bool can_transition(const protocol_state& from, const protocol_state& to) noexcept;

// The format of the copy in progress, or nullptr if the state is not a copy state
const copy_format* get_copy_format(const protocol_state& st) noexcept;

}  // namespace protocol
}  // namespace pgwire

#endif
