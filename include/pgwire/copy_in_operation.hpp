//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_COPY_IN_OPERATION_HPP
#define PGWIRE_COPY_IN_OPERATION_HPP

#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "pgwire/copy_streams.hpp"
#include "pgwire/extended_error.hpp"
#include "pgwire/mediator.hpp"

namespace pgwire {

class connector;

// Drives a single COPY ... FROM STDIN.
// If a source stream is supplied, start() sends all its contents and completes the copy.
// Otherwise, start() leaves the copy open and copy_stream() returns a stream to write the data to.
// The copy is finished by end(), or aborted by cancel(). The destructor cancels an active copy.
// Neither copyable nor movable, since the mediator refers to the operation's stream.
class copy_in_operation
{
    connector& conn_;
    std::string command_;
    boost::variant2::variant<boost::variant2::monostate, std::istream*, std::unique_ptr<copy_in_stream>> stream_;

    copy_stream_ref stream_ref() const noexcept;
    void finish() noexcept;

public:
    copy_in_operation(connector& conn, std::string command);
    copy_in_operation(connector& conn, std::string command, std::istream& source);
    copy_in_operation(const copy_in_operation&) = delete;
    copy_in_operation& operator=(const copy_in_operation&) = delete;
    ~copy_in_operation();

    // Legal only if the connector is ready
    void start(boost::system::error_code& err, diagnostics& diag);
    void start();

    // Is the connector in COPY IN mode, driven by this operation?
    bool is_active() const noexcept;

    // The engine-owned stream to write COPY data to, or nullptr
    std::ostream* copy_stream() noexcept;

    // The caller-supplied source, or nullptr
    std::istream* source() const noexcept;

    // Format of the data the server expects. Sentinel values if !is_active()
    bool is_binary() const noexcept;
    bool field_is_binary(int field) const noexcept;
    int field_count() const noexcept;

    std::size_t copy_buffer_size() const noexcept;
    void set_copy_buffer_size(std::size_t value) noexcept;

    const std::string& command() const noexcept { return command_; }

    // Flushes pending data and completes the copy. A no-op on the wire if !is_active()
    void end(boost::system::error_code& err, diagnostics& diag);
    void end();

    // Aborts the copy. The server's reply (an error containing message) is reported
    // as client_errc::exec_server_error. A no-op on the wire if !is_active()
    void cancel(std::string_view message, boost::system::error_code& err, diagnostics& diag);
    void cancel(std::string_view message);
};

}  // namespace pgwire

#endif
