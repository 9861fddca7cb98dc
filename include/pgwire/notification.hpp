//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_NOTIFICATION_HPP
#define PGWIRE_NOTIFICATION_HPP

#include <cstdint>
#include <string>

namespace pgwire {

// A NOTIFY received from the server
struct notification
{
    // The process ID of the notifying backend process
    std::int32_t process_id{};

    // The channel that the notify has been raised on
    std::string channel;

    std::string payload;

    friend bool operator==(const notification&, const notification&) = default;
};

}  // namespace pgwire

#endif
