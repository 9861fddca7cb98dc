//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_READ_MESSAGE_FSM_HPP
#define PGWIRE_PROTOCOL_READ_MESSAGE_FSM_HPP

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

#include "pgwire/protocol/messages.hpp"

namespace pgwire::protocol {

// A finite-state machine type to read messages from the server.
// resume() returns a variant-like type specifying what to do next.
// Flow should be:
//   - Create a new FSM per message (they're lightweight)
//   - Call resume() passing all the bytes available in your read buffer
//   - If resume returns an error, a serious protocol violation happened. Not recoverable.
//   - If resume returns needs_more, we need to read more data from the server.
//     At least result::hint() bytes should be read. Read and resume again with your entire buffer.
//   - If resume() returns a message, a message is available. Use the message and then consume
//     result::bytes_consumed(). Remember that messages point into the network buffer, so
//     don't consume before using the message.
class read_message_fsm
{
    std::uint8_t msg_type_{};
    std::int32_t msg_size_{-1};

public:
    enum class result_type
    {
        needs_more,
        error,
        message,
    };

    class result
    {
    public:
        result(boost::system::error_code ec) noexcept : type_(result_type::error), ec_(ec) {}
        result(std::size_t hint) noexcept : type_(result_type::needs_more), size_(hint) {}
        result(const any_backend_message& msg, std::size_t bytes_consumed) noexcept
            : type_(result_type::message), msg_(msg), size_(bytes_consumed)
        {
        }

        result_type type() const { return type_; }

        boost::system::error_code error() const
        {
            BOOST_ASSERT(type_ == result_type::error);
            return ec_;
        }

        std::size_t hint() const
        {
            BOOST_ASSERT(type_ == result_type::needs_more);
            return size_;
        }

        const any_backend_message& message() const
        {
            BOOST_ASSERT(type_ == result_type::message);
            return msg_;
        }

        std::size_t bytes_consumed() const
        {
            BOOST_ASSERT(type_ == result_type::message);
            return size_;
        }

    private:
        result_type type_;
        boost::system::error_code ec_;
        any_backend_message msg_;
        std::size_t size_{};
    };

    read_message_fsm() = default;

    result resume(std::span<const unsigned char> data);
};

}  // namespace pgwire::protocol

#endif
