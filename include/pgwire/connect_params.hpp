//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_CONNECT_PARAMS_HPP
#define PGWIRE_CONNECT_PARAMS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace pgwire {

struct connect_params
{
    std::string hostname{"localhost"};
    std::uint16_t port{5432};
    std::string username{"postgres"};

    // Only cleartext password authentication is supported
    std::string password;
    std::string database{"postgres"};

    // Sent as the application_name startup parameter, if present
    std::optional<std::string> application_name;

    // Chunk size used to transfer COPY data
    std::size_t copy_buffer_size{8192};

    // Start the background thread that reads notifications while the connection is idle.
    // If false, notifications are only read as part of synchronous exchanges
    bool notification_thread{true};
};

}  // namespace pgwire

#endif
