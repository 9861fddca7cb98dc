//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert.hpp>
#include <boost/assert/source_location.hpp>

#include <chrono>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "pgwire/command_result.hpp"
#include "pgwire/extended_error.hpp"
#include "pgwire/notification.hpp"
#include "pgwire/protocol/ready_for_query.hpp"
#include "printing.hpp"
#include "test_utils.hpp"

namespace {

struct context_frame_data
{
    boost::source_location loc;
    std::string message;
};

thread_local std::vector<context_frame_data> context;

}  // namespace

pgwire::test::context_frame::context_frame(std::string_view message, boost::source_location loc)
{
    context.push_back({loc, std::string(message)});
}

pgwire::test::context_frame::~context_frame()
{
    BOOST_ASSERT(!context.empty());
    context.pop_back();
}

void pgwire::test::print_context()
{
    BOOST_LIGHTWEIGHT_TEST_OSTREAM << "Failure occurred in the following context:\n";
    for (auto it = context.rbegin(); it != context.rend(); ++it)
        BOOST_LIGHTWEIGHT_TEST_OSTREAM << "  " << it->loc << ": " << it->message << '\n';
}

bool pgwire::test::wait_for(const std::function<bool()>& pred, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return pred();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

// --- Printing ---
std::ostream& pgwire::operator<<(std::ostream& os, const extended_error& err)
{
    return os << "{ .code=" << err.code << ", .diag=" << err.diag.message() << "}";
}

std::ostream& pgwire::operator<<(std::ostream& os, const diagnostics& diag) { return os << diag.message(); }

std::ostream& pgwire::operator<<(std::ostream& os, copy_direction value)
{
    switch (value)
    {
        case copy_direction::none: return os << "none";
        case copy_direction::in: return os << "in";
        case copy_direction::out: return os << "out";
        default: return os << "<unknown copy_direction>";
    }
}

std::ostream& pgwire::operator<<(std::ostream& os, const notification& n)
{
    return os << "{ .process_id=" << n.process_id << ", .channel=" << n.channel << ", .payload=" << n.payload
              << "}";
}

std::ostream& pgwire::protocol::operator<<(std::ostream& os, transaction_status value)
{
    return os << static_cast<char>(value);
}
