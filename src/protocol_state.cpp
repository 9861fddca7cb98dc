//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <array>
#include <cstddef>
#include <string_view>

#include "pgwire/client_errc.hpp"
#include "pgwire/copy_format.hpp"
#include "pgwire/protocol/protocol_state.hpp"

using namespace pgwire::protocol;
using boost::system::error_code;
using pgwire::client_errc;

namespace {

constexpr std::size_t num_states = boost::variant2::variant_size<protocol_state>::value;

// Indices into protocol_state
enum state_index : std::size_t
{
    closed = 0,
    connecting,
    ready,
    executing,
    copy_in,
    copy_out,
    broken,
};

// allowed_transitions[from][to]
constexpr bool allowed_transitions[num_states][num_states] = {
    // closed, connecting, ready, executing, copy_in, copy_out, broken
    {false, true, false, false, false, false, false},  // closed
    {true, false, true, false, false, false, true},    // connecting
    {true, false, false, true, true, true, true},      // ready
    {true, false, true, false, true, true, true},      // executing
    {true, false, true, false, false, false, true},    // copy_in
    {true, false, true, false, false, false, true},    // copy_out
    {true, false, false, false, false, false, false},  // broken
};

struct state_name_visitor
{
    std::string_view operator()(const closed_state&) const noexcept { return "Closed"; }
    std::string_view operator()(const connecting_state&) const noexcept { return "Connecting"; }
    std::string_view operator()(const ready_state&) const noexcept { return "Ready"; }
    std::string_view operator()(const executing_state&) const noexcept { return "Executing"; }
    std::string_view operator()(const copy_in_state&) const noexcept { return "CopyIn"; }
    std::string_view operator()(const copy_out_state&) const noexcept { return "CopyOut"; }
    std::string_view operator()(const broken_state&) const noexcept { return "Broken"; }
};

// The state in which each operation is legal
state_index required_state(operation op) noexcept
{
    switch (op)
    {
        case operation::connect: return closed;
        case operation::execute: return ready;
        case operation::copy_data:
        case operation::copy_done:
        case operation::copy_fail: return copy_in;
        case operation::read_copy_data: return copy_out;
        default: return closed;
    }
}

}  // namespace

std::string_view pgwire::protocol::state_name(const protocol_state& st) noexcept
{
    return boost::variant2::visit(state_name_visitor{}, st);
}

std::string_view pgwire::protocol::operation_name(operation op) noexcept
{
    switch (op)
    {
        case operation::connect: return "connect";
        case operation::execute: return "execute a command";
        case operation::copy_data: return "send copy data";
        case operation::copy_done: return "end a copy";
        case operation::copy_fail: return "cancel a copy";
        case operation::read_copy_data: return "read copy data";
        case operation::close: return "close";
        default: return "<unknown operation>";
    }
}

error_code pgwire::protocol::check_legal(const protocol_state& st, operation op) noexcept
{
    // Closing is always possible
    if (op == operation::close)
        return error_code();

    // A broken connection can only be closed
    if (st.index() == broken)
        return client_errc::connection_broken;

    return st.index() == required_state(op) ? error_code() : error_code(client_errc::wrong_state);
}

bool pgwire::protocol::can_transition(const protocol_state& from, const protocol_state& to) noexcept
{
    return allowed_transitions[from.index()][to.index()];
}

const pgwire::copy_format* pgwire::protocol::get_copy_format(const protocol_state& st) noexcept
{
    if (const auto* in = boost::variant2::get_if<copy_in_state>(&st))
        return &in->format;
    if (const auto* out = boost::variant2::get_if<copy_out_state>(&st))
        return &out->format;
    return nullptr;
}
