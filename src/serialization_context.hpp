//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_SRC_SERIALIZATION_CONTEXT_HPP
#define PGWIRE_SRC_SERIALIZATION_CONTEXT_HPP

#include <boost/assert.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>
#include <vector>

#include "pgwire/client_errc.hpp"

namespace pgwire {
namespace protocol {
namespace detail {

class serialization_context
{
    std::vector<unsigned char>& buffer_;
    static constexpr std::size_t no_message = static_cast<std::size_t>(-1);

    std::size_t header_offset_{no_message};  // where is the message header?
    std::size_t length_offset_{no_message};  // where does the length field start?
    boost::system::error_code err_;

    void begin_message(std::size_t length_offset)
    {
        length_offset_ = length_offset;

        // Add space for the message length
        add_bytes(std::array<unsigned char, 4>{});
    }

public:
    serialization_context(std::vector<unsigned char>& buff) noexcept : buffer_(buff) {}

    std::vector<unsigned char>& buffer() { return buffer_; }

    void add_error(boost::system::error_code ec)
    {
        if (!err_)
            err_ = ec;
    }

    boost::system::error_code error() const { return err_; }

    template <class IntType>
    void add_integral(IntType value)
    {
        unsigned char buff[sizeof(IntType)];
        boost::endian::endian_store<IntType, sizeof(IntType), boost::endian::order::big>(buff, value);
        add_bytes(buff);
    }

    void add_string(std::string_view s)
    {
        add_bytes({reinterpret_cast<const unsigned char*>(s.data()), s.size()});
        add_byte(0);  // NULL terminator
    }

    void add_bytes(std::span<const unsigned char> contents)
    {
        buffer_.insert(buffer_.end(), contents.begin(), contents.end());
    }

    void add_bytes(std::string_view contents)
    {
        add_bytes(std::span<const unsigned char>(
            reinterpret_cast<const unsigned char*>(contents.data()),
            contents.size()
        ));
    }

    void add_byte(unsigned char byte) { buffer_.push_back(byte); }

    void add_header(char msg_type)
    {
        // There shouldn't be an in-progress message
        BOOST_ASSERT(header_offset_ == no_message);

        // Record the header offset
        header_offset_ = buffer_.size();

        // Add the message type
        add_byte(static_cast<unsigned char>(msg_type));

        begin_message(header_offset_ + 1u);
    }

    // For messages without a type byte (StartupMessage), the length is the first field
    void add_untyped_header()
    {
        BOOST_ASSERT(header_offset_ == no_message);
        header_offset_ = buffer_.size();
        begin_message(header_offset_);
    }

    // Assumes you have called add_header or add_untyped_header at the beginning
    boost::system::error_code finalize_message()
    {
        BOOST_ASSERT(length_offset_ != no_message);

        // Compute the length to serialize. The length field counts itself, but not the type byte
        BOOST_ASSERT(buffer_.size() >= length_offset_ + 4u);
        auto size = buffer_.size() - length_offset_;

        // Check that the length doesn't exceed an int32
        if (size > static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)()))
            add_error(client_errc::value_too_big);

        // Record that we're no longer composing a message
        auto length_offset = length_offset_;
        header_offset_ = no_message;
        length_offset_ = no_message;

        // Error check
        if (err_)
            return err_;

        // Serialize the message size
        boost::endian::store_big_s32(buffer_.data() + length_offset, static_cast<std::int32_t>(size));

        // Done
        return {};
    }
};

}  // namespace detail
}  // namespace protocol
}  // namespace pgwire

#endif
