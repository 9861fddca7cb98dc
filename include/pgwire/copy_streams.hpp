//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_COPY_STREAMS_HPP
#define PGWIRE_COPY_STREAMS_HPP

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <istream>
#include <ostream>
#include <streambuf>
#include <vector>

#include "pgwire/extended_error.hpp"

namespace pgwire {

class connector;

namespace detail {

class copy_in_buffer final : public std::streambuf
{
    connector& conn_;
    std::vector<char> buff_;
    boost::system::error_code err_;
    diagnostics diag_;

    bool send_pending();

protected:
    int_type overflow(int_type ch) override;
    int sync() override;

public:
    copy_in_buffer(connector& conn, std::size_t buffer_size);

    boost::system::error_code error() const noexcept { return err_; }
    const diagnostics& diag() const noexcept { return diag_; }
};

class copy_out_buffer final : public std::streambuf
{
    connector& conn_;
    std::vector<char> buff_;
    boost::system::error_code err_;
    diagnostics diag_;

protected:
    int_type underflow() override;

public:
    explicit copy_out_buffer(connector& conn) : conn_(conn) {}

    boost::system::error_code error() const noexcept { return err_; }
    const diagnostics& diag() const noexcept { return diag_; }
};

}  // namespace detail

// Writable stream created by copy_in_operation when no source is supplied.
// Writes are buffered, and each full buffer (and each flush) is sent as a CopyData message.
// If sending fails, badbit is set and error() reports why.
class copy_in_stream : public std::ostream
{
    detail::copy_in_buffer buff_;

public:
    copy_in_stream(connector& conn, std::size_t buffer_size) : std::ostream(nullptr), buff_(conn, buffer_size)
    {
        rdbuf(&buff_);
    }

    boost::system::error_code error() const noexcept { return buff_.error(); }
    const diagnostics& diag() const noexcept { return buff_.diag(); }
};

// Readable stream created by copy_out_operation when no sink is supplied.
// Each CopyData message received is made available for reading. The end of the copy is EOF.
class copy_out_stream : public std::istream
{
    detail::copy_out_buffer buff_;

public:
    explicit copy_out_stream(connector& conn) : std::istream(nullptr), buff_(conn) { rdbuf(&buff_); }

    boost::system::error_code error() const noexcept { return buff_.error(); }
    const diagnostics& diag() const noexcept { return buff_.diag(); }
};

}  // namespace pgwire

#endif
