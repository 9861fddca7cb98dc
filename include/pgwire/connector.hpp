//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_CONNECTOR_HPP
#define PGWIRE_CONNECTOR_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/system/error_code.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "pgwire/command_result.hpp"
#include "pgwire/connect_params.hpp"
#include "pgwire/copy_format.hpp"
#include "pgwire/extended_error.hpp"
#include "pgwire/mediator.hpp"
#include "pgwire/notification.hpp"
#include "pgwire/notification_block.hpp"
#include "pgwire/protocol/protocol_state.hpp"

namespace pgwire {

namespace detail {
struct connector_impl;
}  // namespace detail

using notification_handler = std::function<void(const notification&)>;

// A physical connection to a PostgreSQL server, and the protocol state machine that drives it.
// Operations are synchronous. Each has an overload reporting errors through error_code + diagnostics,
// and another one throwing error_with_diagnostics.
// Operations that are not legal in the current state fail with client_errc::wrong_state
// without performing any I/O.
class connector
{
    std::unique_ptr<detail::connector_impl> impl_;

public:
    explicit connector(boost::asio::any_io_executor ex);
    connector(const connector&) = delete;
    connector& operator=(const connector&) = delete;
    connector(connector&&) noexcept;
    connector& operator=(connector&&) noexcept;

    // Closes the connection, if open
    ~connector();

    boost::asio::any_io_executor get_executor();

    // Connects the socket and performs the startup handshake. Legal only in the closed state.
    // On failure, the connector is left broken
    void connect(const connect_params& params, boost::system::error_code& err, diagnostics& diag);
    void connect(const connect_params& params);

    // Runs sql as a simple query. Legal only in the ready state.
    // If the command starts a COPY and the mediator holds a stream for it, the stream is used
    // to complete the copy. Otherwise, the connector is left in the copy_in or copy_out state
    void execute(std::string_view sql, command_result& result, boost::system::error_code& err, diagnostics& diag);
    void execute(std::string_view sql, command_result& result);

    // COPY FROM STDIN primitives. Legal only in the copy_in state
    void send_copy_data(std::span<const unsigned char> data, boost::system::error_code& err, diagnostics& diag);
    void send_copy_data(std::span<const unsigned char> data);
    void send_copy_done(boost::system::error_code& err, diagnostics& diag);
    void send_copy_done();
    void send_copy_fail(std::string_view message, boost::system::error_code& err, diagnostics& diag);
    void send_copy_fail(std::string_view message);

    // COPY TO STDOUT primitive. Legal only in the copy_out state.
    // Returns the next chunk of data, valid until the next operation on the connector,
    // or an empty optional when the copy is over (the connector is then ready)
    std::optional<std::span<const unsigned char>> read_copy_data(boost::system::error_code& err, diagnostics& diag);
    std::optional<std::span<const unsigned char>> read_copy_data();

    // Sends Terminate if possible and closes the socket. Legal in any state.
    // The connector always ends up closed
    void close(boost::system::error_code& err);
    void close();

    // State
    const protocol::protocol_state& state() const noexcept;
    std::string_view state_name() const noexcept;
    bool is_ready() const noexcept;

    // Format of the COPY in progress, or nullptr if no copy is in progress
    const pgwire::copy_format* get_copy_format() const noexcept;

    // Data sent by the server during startup
    std::int32_t backend_process_id() const noexcept;
    std::int32_t backend_secret_key() const noexcept;

    // Current value of a ParameterStatus parameter. Returns a copy, since the
    // notification thread may update the value at any time
    std::optional<std::string> server_parameter(std::string_view name) const;

    mediator& get_mediator() noexcept;
    const mediator& get_mediator() const noexcept;

    // Parks the notification thread until the returned handle is destroyed
    notification_block block_notification_thread();

    // Is any notification_block currently held?
    bool notification_thread_blocked() const noexcept;

    // Invoked for each notification received, from the notification thread
    // (or from the thread releasing the last block, if the notification thread is disabled).
    // Handlers must not call back into the connector
    void set_notification_handler(notification_handler handler);
};

}  // namespace pgwire

#endif
