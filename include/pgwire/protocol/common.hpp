//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_COMMON_HPP
#define PGWIRE_PROTOCOL_COMMON_HPP

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <span>

#include "pgwire/client_errc.hpp"

namespace pgwire {
namespace protocol {

namespace detail {

inline boost::system::error_code check_empty(std::span<const unsigned char> data)
{
    return data.empty() ? boost::system::error_code() : boost::system::error_code(client_errc::extra_bytes);
}

}  // namespace detail

enum class format_code : std::int16_t
{
    text = 0,
    binary = 1,
};

}  // namespace protocol
}  // namespace pgwire

#endif
