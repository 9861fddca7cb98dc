//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_HEADER_HPP
#define PGWIRE_PROTOCOL_HEADER_HPP

#include <boost/system/error_code.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace pgwire {
namespace protocol {

// Message header operations
struct message_header
{
    std::uint8_t type;  // The message type
    std::size_t size;   // Should be < INT32_MAX
};

boost::system::error_code parse_header(std::span<const unsigned char, 5> from, message_header& to);

// Might fail if length is too big
boost::system::error_code serialize_header(message_header header, std::array<unsigned char, 5>& to);

}  // namespace protocol
}  // namespace pgwire

#endif
