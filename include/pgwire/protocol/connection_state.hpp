//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_CONNECTION_STATE_HPP
#define PGWIRE_PROTOCOL_CONNECTION_STATE_HPP

#include <boost/beast/core/flat_buffer.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace pgwire::protocol {

struct connection_state
{
    // Serialized messages waiting to be written
    std::vector<unsigned char> write_buffer;

    // Read buffer
    boost::beast::flat_buffer read_buffer;

    // Size of the last message handed out by the reader. Messages point into read_buffer,
    // so these bytes are consumed just before reading the next message
    std::size_t pending_consume{};

    // The ID of the process that is managing our connection (aka connection ID)
    std::int32_t backend_process_id{};

    // A key that can be used for cancellations
    std::int32_t backend_secret_key{};

    // Values reported by ParameterStatus messages (server_version, client_encoding...)
    std::map<std::string, std::string, std::less<>> server_parameters;
};

}  // namespace pgwire::protocol

#endif
