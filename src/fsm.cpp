//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "coroutine.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/copy_format.hpp"
#include "pgwire/extended_error.hpp"
#include "pgwire/protocol/command_response_fsm.hpp"
#include "pgwire/protocol/connection_state.hpp"
#include "pgwire/protocol/header.hpp"
#include "pgwire/protocol/messages.hpp"
#include "pgwire/protocol/read_message_fsm.hpp"
#include "pgwire/protocol/startup.hpp"
#include "pgwire/protocol/startup_fsm.hpp"

using namespace pgwire::protocol;
using boost::system::error_code;
using pgwire::client_errc;

read_message_fsm::result read_message_fsm::resume(std::span<const unsigned char> data)
{
    if (msg_size_ == -1)
    {
        // Header. Ensure we have enough data
        if (data.size() < 5u)
            return result(static_cast<std::size_t>(5u - data.size()));

        // Do the parsing
        message_header header{};
        if (auto ec = parse_header(std::span<const unsigned char, 5>(data.data(), 5u), header))
            return ec;

        // Record the header fields to signal that we're done with the header
        msg_type_ = header.type;
        msg_size_ = static_cast<std::int32_t>(header.size);
    }

    // Body. Ensure we have enough data. The header is not discarded
    // until the message is fully parsed for simplicity
    BOOST_ASSERT(msg_size_ != -1);
    const auto expected_size = static_cast<std::size_t>(msg_size_) + 5u;
    if (data.size() < expected_size)
        return result(static_cast<std::size_t>(expected_size - data.size()));

    // Do the parsing
    any_backend_message msg;
    if (auto ec = parse(msg_type_, data.subspan(5, expected_size - 5), msg))
        return ec;
    return result(msg, expected_size);
}

namespace {

struct startup_visitor
{
    pgwire::diagnostics& diag;

    error_code operator()(const error_response& err) const
    {
        diag.assign(err);
        return client_errc::auth_failed;
    }

    error_code operator()(const authentication_ok&) const { return error_code(); }

    error_code operator()(const authentication_kerberos_v5&) const
    {
        return client_errc::auth_kerberos_v5_unsupported;
    }

    error_code operator()(const authentication_md5_password&) const
    {
        return client_errc::auth_md5_password_unsupported;
    }

    error_code operator()(const authentication_gss&) const { return client_errc::auth_gss_unsupported; }

    error_code operator()(const authentication_sspi&) const { return client_errc::auth_sspi_unsupported; }

    error_code operator()(const authentication_sasl&) const { return client_errc::auth_sasl_unsupported; }

    template <class T>
    error_code operator()(const T&) const
    {
        return client_errc::unexpected_message;
    }
};

error_code compose_startup_message(const startup_params& params, std::vector<unsigned char>& to)
{
    std::array<std::pair<std::string_view, std::string_view>, 1> extra_params;
    std::size_t num_extra_params = 0u;
    if (params.application_name.has_value())
        extra_params[num_extra_params++] = {"application_name", *params.application_name};

    to.clear();
    return serialize(
        startup_message{
            .user = params.username,
            .database = params.database.empty() ? std::optional<std::string_view>()
                                                : std::string_view(params.database),
            .params = std::span(extra_params.data(), num_extra_params),
        },
        to
    );
}

void record_parameter(connection_state& st, const parameter_status& msg)
{
    st.server_parameters.insert_or_assign(std::string(msg.name), std::string(msg.value));
}

}  // namespace

startup_fsm::result startup_fsm::resume(connection_state& st, diagnostics& diag, const any_backend_message& msg)
{
    switch (resume_point_)
    {
        PGWIRE_CORO_INITIAL

        // Compose the startup message
        if (auto ec = compose_startup_message(*params_, st.write_buffer))
            return ec;

        // Write it
        PGWIRE_YIELD(resume_point_, 1, result_type::write)

        // Authentication exchange
        while (true)
        {
            // Read the server's response
            PGWIRE_YIELD(resume_point_, 2, result_type::read)

            // Notices may arrive at any time
            if (boost::variant2::holds_alternative<notice_response>(msg))
                continue;

            if (boost::variant2::holds_alternative<authentication_cleartext_password>(msg))
            {
                // The server wants a password, in clear text
                if (params_->password.empty())
                    return error_code(client_errc::password_required);
                st.write_buffer.clear();
                if (auto ec = serialize(password{params_->password}, st.write_buffer))
                    return ec;
                PGWIRE_YIELD(resume_point_, 3, result_type::write)
                continue;
            }

            // Anything else either grants or rejects access
            if (auto ec = boost::variant2::visit(startup_visitor{diag}, msg))
                return ec;
            break;
        }

        // Backend has approved our login request. Now wait until we receive ReadyForQuery
        while (true)
        {
            // Read a message
            PGWIRE_YIELD(resume_point_, 4, result_type::read)

            // Act upon it
            if (const auto* key = boost::variant2::get_if<backend_key_data>(&msg))
            {
                st.backend_process_id = key->process_id;
                st.backend_secret_key = key->secret_key;
            }
            else if (const auto* param = boost::variant2::get_if<parameter_status>(&msg))
            {
                record_parameter(st, *param);
            }
            else if (const auto* err = boost::variant2::get_if<error_response>(&msg))
            {
                diag.assign(*err);
                return error_code(client_errc::auth_failed);
            }
            else if (boost::variant2::holds_alternative<notice_response>(msg) ||
                     boost::variant2::holds_alternative<negotiate_protocol_version>(msg))
            {
                // Nothing to do. We don't request any protocol extension
            }
            else if (boost::variant2::holds_alternative<ready_for_query>(msg))
            {
                return error_code();
            }
            else
            {
                return error_code(client_errc::unexpected_message);
            }
        }
    }

    // We should never reach here
    BOOST_ASSERT(false);
    return error_code();
}

namespace {

template <class CopyResponse>
pgwire::copy_format to_copy_format(const CopyResponse& msg)
{
    std::vector<format_code> codes;
    codes.reserve(msg.fmt_codes.size());
    for (std::size_t i = 0u; i < msg.fmt_codes.size(); ++i)
        codes.push_back(msg.fmt_codes[i]);
    return pgwire::copy_format(msg.overall_fmt_code == format_code::binary, std::move(codes));
}

}  // namespace

struct command_response_fsm::visitor
{
    command_response_fsm& self;

    static result read() { return result_type::read; }

    // Asynchronous messages that might be received at any time.
    // The connector processes these before getting here
    result operator()(const notice_response&) const { return read(); }
    result operator()(const notification_response&) const { return read(); }
    result operator()(const parameter_status&) const { return read(); }

    result operator()(const row_description&) const
    {
        return self.phase_ == phase::response ? read() : error_code(client_errc::unexpected_message);
    }

    result operator()(const data_row&) const
    {
        if (self.phase_ != phase::response)
            return error_code(client_errc::unexpected_message);
        ++self.rows_;
        return read();
    }

    result operator()(empty_query_response) const { return read(); }

    result operator()(const command_complete& msg) const
    {
        // Ends the current statement. This also ends any COPY in progress
        self.tag_ = msg.tag;
        self.phase_ = phase::response;
        return read();
    }

    result operator()(const error_response& msg) const
    {
        // Only the first error is relevant. The server skips the rest of the query string after it
        if (!self.stored_ec_)
        {
            self.stored_ec_ = client_errc::exec_server_error;
            self.diag_.assign(msg);
        }
        self.phase_ = phase::response;
        return read();
    }

    result operator()(const copy_in_response& msg) const
    {
        if (self.phase_ != phase::response)
            return error_code(client_errc::unexpected_message);
        self.format_ = to_copy_format(msg);
        self.phase_ = phase::copy_in;
        return result_type::copy_in;
    }

    result operator()(const copy_out_response& msg) const
    {
        if (self.phase_ != phase::response)
            return error_code(client_errc::unexpected_message);
        self.format_ = to_copy_format(msg);
        self.phase_ = phase::copy_out;
        return result_type::copy_out;
    }

    // End of a COPY OUT data stream. CommandComplete follows
    result operator()(copy_done) const
    {
        return self.phase_ == phase::copy_out ? read() : error_code(client_errc::unexpected_message);
    }

    result operator()(ready_for_query msg) const
    {
        if (self.phase_ != phase::response)
            return error_code(client_errc::unexpected_message);
        self.status_ = msg.status;
        return self.stored_ec_;
    }

    // Anything else (including CopyData, which the caller must handle,
    // and CopyBothResponse, which is only used by replication) is a protocol violation
    template <class T>
    result operator()(const T&) const
    {
        return error_code(client_errc::unexpected_message);
    }
};

command_response_fsm::result command_response_fsm::resume(const any_backend_message& msg)
{
    return boost::variant2::visit(visitor{*this}, msg);
}
