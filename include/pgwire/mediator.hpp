//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_MEDIATOR_HPP
#define PGWIRE_MEDIATOR_HPP

#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pgwire {

// Reference to the stream that controls the data flow of the active COPY.
// Non-owning: the stream belongs to the copy operation or to its caller
using copy_stream_ref = boost::variant2::variant<boost::variant2::monostate, std::istream*, std::ostream*>;

// Per-connection scratch area shared between copy operations and the connector's state logic.
// All fields are written from the thread that issues synchronous operations.
class mediator
{
public:
    static constexpr std::size_t default_copy_buffer_size = 8192u;

    // Written by copy operations (start, end, cancel). Read by the connector
    // when a command enters a COPY state
    const copy_stream_ref& copy_stream() const noexcept { return copy_stream_; }
    void set_copy_stream(copy_stream_ref ref) noexcept { copy_stream_ = ref; }
    void clear_copy_stream() noexcept { copy_stream_ = boost::variant2::monostate{}; }

    // Chunk size for COPY transfers. Zero restores the default
    std::size_t copy_buffer_size() const noexcept { return copy_buffer_size_; }
    void set_copy_buffer_size(std::size_t value) noexcept
    {
        copy_buffer_size_ = value == 0u ? default_copy_buffer_size : value;
    }

    // Written by the connector when a command completes
    std::string_view last_command_tag() const noexcept { return last_command_tag_; }
    void set_last_command_tag(std::string_view tag) { last_command_tag_ = tag; }

    // Notices received during the last exchange, formatted like diagnostics.
    // Cleared by the connector at the beginning of each exchange
    const std::vector<std::string>& notices() const noexcept { return notices_; }
    void add_notice(std::string notice) { notices_.push_back(std::move(notice)); }
    void clear_notices() noexcept { notices_.clear(); }

private:
    copy_stream_ref copy_stream_;
    std::size_t copy_buffer_size_{default_copy_buffer_size};
    std::string last_command_tag_;
    std::vector<std::string> notices_;
};

}  // namespace pgwire

#endif
