//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_STARTUP_FSM_HPP
#define PGWIRE_PROTOCOL_STARTUP_FSM_HPP

#include <boost/system/error_code.hpp>

#include <optional>
#include <string_view>

#include "pgwire/protocol/connection_state.hpp"
#include "pgwire/protocol/messages.hpp"

namespace pgwire {

class diagnostics;

namespace protocol {

struct startup_params
{
    std::string_view username;
    std::string_view password;
    std::string_view database;
    std::optional<std::string_view> application_name;
};

// Drives the startup handshake. Message-driven: the caller performs the I/O.
//   - write: send st.write_buffer to the server, then call resume() again
//   - read: read a message and call resume() passing it
//   - done: the handshake finished. On success, the connection is ready for queries
class startup_fsm
{
public:
    enum class result_type
    {
        done,
        read,
        write,
    };

    struct result
    {
        result_type type;
        boost::system::error_code ec;

        result(boost::system::error_code ec) noexcept : type(result_type::done), ec(ec) {}
        result(result_type t) noexcept : type(t) {}
    };

    explicit startup_fsm(const startup_params& params) noexcept : params_(&params) {}

    result resume(connection_state& st, diagnostics& diag, const any_backend_message& msg = {});

private:
    int resume_point_{0};
    const startup_params* params_;
};

}  // namespace protocol
}  // namespace pgwire

#endif
