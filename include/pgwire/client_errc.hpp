//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_CLIENT_ERRC_HPP
#define PGWIRE_CLIENT_ERRC_HPP

#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>

namespace pgwire {

const boost::system::error_category& get_client_category();

enum class client_errc : int
{
    /// An incomplete message was received from the server (indicates a deserialization error or
    /// packet mismatch).
    incomplete_message = 1,

    /// An unexpected value was found in a server-received message (indicates a deserialization
    /// error or packet mismatch).
    protocol_value_error,

    /// Unexpected extra bytes at the end of a message were received (indicates a deserialization
    /// error or packet mismatch).
    extra_bytes,

    // You passed a collection whose size exceeds a protocol max
    value_too_big,

    // We got a message type that wasn't supposed to appear in the state we are.
    // This is a protocol violation.
    unexpected_message,

    // The server rejected our login
    auth_failed,

    // We don't support this authentication method yet
    auth_kerberos_v5_unsupported,

    // We don't support this authentication method yet
    auth_md5_password_unsupported,

    // We don't support this authentication method yet
    auth_gss_unsupported,

    // We don't support this authentication method yet
    auth_sspi_unsupported,

    // We don't support this authentication method yet
    auth_sasl_unsupported,

    // The server asked for a password, but connect_params::password is empty
    password_required,

    // The server returned an error during the execution of a command
    exec_server_error,

    // The operation is not legal in the connection's current protocol state.
    // The state is not modified.
    wrong_state,

    // A previous I/O error or protocol violation left the connection unusable.
    // Close it and connect again.
    connection_broken,

    // A copy operation was started with a command that didn't start a COPY in the expected direction
    not_a_copy_query,

    // The stream supplied as the source of a COPY IN failed while being read.
    // The COPY was aborted
    copy_source_failed,

    // The stream supplied as the sink of a COPY OUT failed while being written
    copy_sink_failed,
};

/// Creates an \ref error_code from a \ref client_errc.
inline boost::system::error_code make_error_code(client_errc error)
{
    return boost::system::error_code(static_cast<int>(error), get_client_category());
}

}  // namespace pgwire

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::pgwire::client_errc>
{
    static constexpr bool value = true;
};

}  // namespace system
}  // namespace boost

#endif
