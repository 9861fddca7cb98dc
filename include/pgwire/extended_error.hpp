//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_EXTENDED_ERROR_HPP
#define PGWIRE_EXTENDED_ERROR_HPP

#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <string>
#include <string_view>

#include "pgwire/protocol/notice_error.hpp"

namespace pgwire {

class diagnostics
{
    std::string msg_;

public:
    diagnostics() noexcept = default;

    diagnostics(std::string msg) noexcept : msg_(std::move(msg)) {}

    diagnostics(const protocol::error_notice_fields& msg) { assign(msg); }

    // Formats a server error or notice as "<severity>: <sqlstate>: <message>"
    void assign(const protocol::error_notice_fields& msg);

    void assign(std::string msg) { msg_ = std::move(msg); }

    void clear() noexcept { msg_.clear(); }

    std::string_view message() const { return msg_; }

    friend bool operator==(const diagnostics& lhs, const diagnostics& rhs) noexcept = default;
};

struct extended_error
{
    boost::system::error_code code;
    diagnostics diag;

    friend bool operator==(const extended_error& lhs, const extended_error& rhs) noexcept = default;
};

// Thrown by the throwing overloads of connector and copy operation functions
class error_with_diagnostics : public boost::system::system_error
{
    diagnostics diag_;

public:
    error_with_diagnostics(const boost::system::error_code& code, const diagnostics& diag)
        : boost::system::system_error(code, std::string(diag.message())), diag_(diag)
    {
    }

    const diagnostics& get_diagnostics() const noexcept { return diag_; }
};

// Make extended_error interoperable with boost::system::result
void throw_exception_from_error(const extended_error& err, boost::source_location loc);

namespace detail {

// Throws error_with_diagnostics if ec contains an error
void throw_on_error(boost::system::error_code ec, const diagnostics& diag, boost::source_location loc);

}  // namespace detail

}  // namespace pgwire

#endif
