//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_COPY_OUT_OPERATION_HPP
#define PGWIRE_COPY_OUT_OPERATION_HPP

#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <istream>
#include <memory>
#include <ostream>
#include <string>

#include "pgwire/copy_streams.hpp"
#include "pgwire/extended_error.hpp"
#include "pgwire/mediator.hpp"

namespace pgwire {

class connector;

// Drives a single COPY ... TO STDOUT.
// If a sink stream is supplied, start() writes all the data to it and completes the copy.
// Otherwise, start() leaves the copy open and copy_stream() returns a stream to read the data from.
class copy_out_operation
{
    connector& conn_;
    std::string command_;
    boost::variant2::variant<boost::variant2::monostate, std::ostream*, std::unique_ptr<copy_out_stream>> stream_;

    copy_stream_ref stream_ref() const noexcept;
    void finish() noexcept;

public:
    copy_out_operation(connector& conn, std::string command);
    copy_out_operation(connector& conn, std::string command, std::ostream& sink);
    copy_out_operation(const copy_out_operation&) = delete;
    copy_out_operation& operator=(const copy_out_operation&) = delete;
    ~copy_out_operation();

    // Legal only if the connector is ready
    void start(boost::system::error_code& err, diagnostics& diag);
    void start();

    // Is the connector in COPY OUT mode, driven by this operation?
    bool is_active() const noexcept;

    // The engine-owned stream to read COPY data from, or nullptr
    std::istream* copy_stream() noexcept;

    // The caller-supplied sink, or nullptr
    std::ostream* sink() const noexcept;

    bool is_binary() const noexcept;
    bool field_is_binary(int field) const noexcept;
    int field_count() const noexcept;

    const std::string& command() const noexcept { return command_; }

    // Discards any data not read yet and waits for the command to complete.
    // A no-op on the wire if !is_active()
    void end(boost::system::error_code& err, diagnostics& diag);
    void end();
};

}  // namespace pgwire

#endif
