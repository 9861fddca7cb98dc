//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>

#include <string>

#include "pgwire/client_errc.hpp"
#include "pgwire/extended_error.hpp"
#include "pgwire/protocol/notice_error.hpp"

using namespace pgwire;

namespace {

static const char* error_to_string(client_errc error)
{
    switch (error)
    {
        case client_errc::incomplete_message: return "An incomplete message was received from the server";
        case client_errc::extra_bytes: return "Unexpected extra bytes at the end of a message were received";
        case client_errc::protocol_value_error:
            return "An unexpected value was found in a server-received message";
        case client_errc::value_too_big: return "A value exceeds the maximum size allowed by the protocol";
        case client_errc::unexpected_message:
            return "The server sent a message that is not valid in the current protocol state";
        case client_errc::auth_failed: return "The server rejected the authentication request";
        case client_errc::auth_kerberos_v5_unsupported:
            return "The server requested Kerberos V5 authentication, which is not supported";
        case client_errc::auth_md5_password_unsupported:
            return "The server requested MD5 password authentication, which is not supported";
        case client_errc::auth_gss_unsupported:
            return "The server requested GSSAPI authentication, which is not supported";
        case client_errc::auth_sspi_unsupported:
            return "The server requested SSPI authentication, which is not supported";
        case client_errc::auth_sasl_unsupported:
            return "The server requested SASL authentication, which is not supported";
        case client_errc::password_required:
            return "The server requested a password, but none was provided";
        case client_errc::exec_server_error: return "The server returned an error while executing a command";
        case client_errc::wrong_state:
            return "The operation is not allowed in the current state of the connection";
        case client_errc::connection_broken: return "The connection is broken and can't be used anymore";
        case client_errc::not_a_copy_query: return "The command did not start a COPY operation";
        case client_errc::copy_source_failed: return "Reading from the COPY source stream failed";
        case client_errc::copy_sink_failed: return "Writing to the COPY sink stream failed";
        default: return "<unknown pgwire client error>";
    }
}

class client_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "pgwire.client"; }
    std::string message(int ev) const final override { return error_to_string(static_cast<client_errc>(ev)); }
};

static client_category g_clicat;

}  // namespace

const boost::system::error_category& pgwire::get_client_category() { return g_clicat; }

void diagnostics::assign(const protocol::error_notice_fields& err)
{
    msg_ = err.severity.value_or(err.localized_severity.value_or("<Server error with unknown severity>"));
    msg_ += ": ";
    msg_ += err.sqlstate.value_or("<unknown SQLSTATE>");
    msg_ += ": ";
    msg_ += err.message.value_or("<unknown error>");
    if (err.detail.has_value())
    {
        msg_ += " (";
        msg_ += *err.detail;
        msg_ += ")";
    }
}

void pgwire::throw_exception_from_error(const extended_error& err, boost::source_location loc)
{
    boost::throw_exception(error_with_diagnostics(err.code, err.diag), loc);
}

void pgwire::detail::throw_on_error(
    boost::system::error_code ec,
    const diagnostics& diag,
    boost::source_location loc
)
{
    if (ec)
        boost::throw_exception(error_with_diagnostics(ec, diag), loc);
}
