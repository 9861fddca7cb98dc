//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/system/error_code.hpp>
#include <boost/throw_exception.hpp>
#include <boost/variant2/variant.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "parse_context.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/protocol/async.hpp"
#include "pgwire/protocol/command_complete.hpp"
#include "pgwire/protocol/common.hpp"
#include "pgwire/protocol/copy.hpp"
#include "pgwire/protocol/data_row.hpp"
#include "pgwire/protocol/empty_query_response.hpp"
#include "pgwire/protocol/header.hpp"
#include "pgwire/protocol/messages.hpp"
#include "pgwire/protocol/notice_error.hpp"
#include "pgwire/protocol/query.hpp"
#include "pgwire/protocol/ready_for_query.hpp"
#include "pgwire/protocol/row_description.hpp"
#include "pgwire/protocol/startup.hpp"
#include "pgwire/protocol/terminate.hpp"
#include "serialization_context.hpp"

using namespace pgwire::protocol;
using boost::system::error_code;
using pgwire::client_errc;

namespace {

enum class backend_message_type : char
{
    authentication_request = 'R',
    backend_key_data = 'K',
    bind_complete = '2',
    close_complete = '3',
    command_complete = 'C',
    copy_data = 'd',
    copy_done = 'c',
    copy_in_response = 'G',
    copy_out_response = 'H',
    copy_both_response = 'W',
    data_row = 'D',
    empty_query_response = 'I',
    error_response = 'E',
    negotiate_protocol_version = 'v',
    no_data = 'n',
    notice_response = 'N',
    notification_response = 'A',
    parameter_description = 't',
    parameter_status = 'S',
    parse_complete = '1',
    portal_suspended = 's',
    ready_for_query = 'Z',
    row_description = 'T',
};

enum class authentication_message_type : std::int32_t
{
    ok = 0,
    kerberos_v5 = 2,
    cleartext_password = 3,
    md5_password = 5,
    gss = 7,
    gss_continue = 8,
    sspi = 9,
    sasl = 10,
    sasl_continue = 11,
    sasl_final = 12,
};

template <class MessageType>
error_code parse_impl(std::span<const unsigned char> from, any_backend_message& to)
{
    MessageType res{};
    auto ec = pgwire::protocol::parse(from, res);
    if (ec)
        return ec;
    to = res;
    return {};
}

error_code parse_authentication_request(std::span<const unsigned char> from, any_backend_message& to)
{
    // Get the authentication request type code
    if (from.size() < 4u)
        return client_errc::incomplete_message;
    auto type = static_cast<authentication_message_type>(boost::endian::load_big_s32(from.data()));
    from = from.subspan(4);

    // Parse
    switch (type)
    {
        case authentication_message_type::ok: return parse_impl<authentication_ok>(from, to);
        case authentication_message_type::kerberos_v5: return parse_impl<authentication_kerberos_v5>(from, to);
        case authentication_message_type::cleartext_password:
            return parse_impl<authentication_cleartext_password>(from, to);
        case authentication_message_type::md5_password:
            return parse_impl<authentication_md5_password>(from, to);
        case authentication_message_type::gss: return parse_impl<authentication_gss>(from, to);
        case authentication_message_type::gss_continue:
            return parse_impl<authentication_gss_continue>(from, to);
        case authentication_message_type::sspi: return parse_impl<authentication_sspi>(from, to);
        case authentication_message_type::sasl: return parse_impl<authentication_sasl>(from, to);
        case authentication_message_type::sasl_continue:
            return parse_impl<authentication_sasl_continue>(from, to);
        case authentication_message_type::sasl_final: return parse_impl<authentication_sasl_final>(from, to);
        default: return client_errc::protocol_value_error;
    }
}

// https://www.postgresql.org/docs/current/protocol-error-fields.html
enum class error_field_type : unsigned char
{
    severity_i18n = 'S',
    severity = 'V',
    sqlstate = 'C',
    message = 'M',
    detail = 'D',
    hint = 'H',
    position = 'P',
    internal_position = 'p',
    internal_query = 'q',
    where = 'W',
    schema_name = 's',
    table_name = 't',
    column_name = 'c',
    data_type_name = 'd',
    constraint_name = 'n',
    file_name = 'F',
    line_number = 'L',
    routine = 'R',
};

void populate_field(detail::parse_context& ctx, error_field_type type, error_notice_fields& to)
{
    switch (type)
    {
        case error_field_type::severity_i18n: to.localized_severity = ctx.get_string(); break;
        case error_field_type::severity: to.severity = ctx.get_string(); break;
        case error_field_type::sqlstate: to.sqlstate = ctx.get_string(); break;
        case error_field_type::message: to.message = ctx.get_string(); break;
        case error_field_type::detail: to.detail = ctx.get_string(); break;
        case error_field_type::hint: to.hint = ctx.get_string(); break;
        case error_field_type::position: to.position = ctx.get_string(); break;
        case error_field_type::internal_position: to.internal_position = ctx.get_string(); break;
        case error_field_type::internal_query: to.internal_query = ctx.get_string(); break;
        case error_field_type::where: to.where = ctx.get_string(); break;
        case error_field_type::schema_name: to.schema_name = ctx.get_string(); break;
        case error_field_type::table_name: to.table_name = ctx.get_string(); break;
        case error_field_type::column_name: to.column_name = ctx.get_string(); break;
        case error_field_type::data_type_name: to.data_type_name = ctx.get_string(); break;
        case error_field_type::constraint_name: to.constraint_name = ctx.get_string(); break;
        case error_field_type::file_name: to.file_name = ctx.get_string(); break;
        case error_field_type::line_number: to.line_number = ctx.get_string(); break;
        case error_field_type::routine: to.routine = ctx.get_string(); break;
        default: ctx.get_string(); break;  // Skip unknown fields
    }
}

// Shared between errors and notices
error_code parse_error_notice(std::span<const unsigned char> data, error_notice_fields& to)
{
    detail::parse_context ctx(data);

    // A collection of fields, with a 1 byte header stating the field meaning, followed by a string.
    // Terminated by a NULL byte.
    while (true)
    {
        // Get the type byte. On error, this returns 0, which is OK
        unsigned char type_byte = ctx.get_byte();
        if (type_byte == 0u)
            break;

        // Populate the relevant field
        populate_field(ctx, static_cast<error_field_type>(type_byte), to);
    }

    return ctx.check();
}

bool is_valid_status(transaction_status v)
{
    switch (v)
    {
        case transaction_status::idle:
        case transaction_status::in_transaction:
        case transaction_status::failed: return true;
        default: return false;
    }
}

bool is_valid_format_code(format_code v)
{
    switch (v)
    {
        case format_code::text:
        case format_code::binary: return true;
        default: return false;
    }
}

// The size of the fixed-length fields in a field description of a RowDescription message
constexpr std::size_t field_description_fixed_size = 18u;

// Like format_code, but only in 1 byte. Used in copy messages
enum class overall_format_code : std::uint8_t
{
    text = 0,
    binary = 1,
};

bool is_valid_format_code(overall_format_code v)
{
    switch (v)
    {
        case overall_format_code::text:
        case overall_format_code::binary: return true;
        default: return false;
    }
}

// Shared between copy_in_response, copy_out_response, copy_both_response
error_code parse_copy_response(
    std::span<const unsigned char> data,
    format_code& overall_code_output,
    random_access_parsing_view<format_code>& fmt_codes_output
)
{
    detail::parse_context ctx(data);

    // Overall format code
    auto overall_code = static_cast<overall_format_code>(ctx.get_byte());
    if (!is_valid_format_code(overall_code))
    {
        ctx.add_error(client_errc::protocol_value_error);
        return ctx.check();
    }

    // If the overall format is text, subsequent codes should be text, too.
    const bool should_be_text = overall_code == overall_format_code::text;

    // Number of format codes
    auto num_items = static_cast<std::size_t>(ctx.get_nonnegative_integral<std::int16_t>());

    // Individual format codes start here
    const auto* fmt_codes_first = ctx.first();

    // Check each code
    for (std::size_t i = 0; i < num_items; ++i)
    {
        auto code = static_cast<format_code>(ctx.get_integral<std::int16_t>());
        if ((should_be_text && code != format_code::text) || !is_valid_format_code(code))
            ctx.add_error(client_errc::protocol_value_error);
    }

    // Populate the response
    overall_code_output = static_cast<format_code>(static_cast<std::int16_t>(overall_code));
    fmt_codes_output = ctx.error() ? random_access_parsing_view<format_code>()
                                   : random_access_parsing_view<format_code>(fmt_codes_first, num_items);

    return ctx.check();
}

// For messages that only have a header
error_code serialize_header_only(char header, std::vector<unsigned char>& to)
{
    std::array<unsigned char, 5> buff{};
    auto ec = serialize_header({static_cast<unsigned char>(header), 0u}, buff);
    BOOST_ASSERT(!ec);
    to.insert(to.end(), buff.begin(), buff.end());
    return ec;
}

}  // namespace

void pgwire::protocol::detail::at_range_check(std::size_t i, std::size_t collection_size)
{
    if (i >= collection_size)
        BOOST_THROW_EXCEPTION(std::out_of_range("random_access_parsing_view::at"));
}

//
// Header
//

error_code pgwire::protocol::serialize_header(message_header header, std::array<unsigned char, 5>& to)
{
    // Range check the length. It should fit an int32, counting the 4 extra bytes in the length field
    constexpr std::size_t max_size = (std::numeric_limits<std::int32_t>::max)() - 4u;
    if (header.size > max_size)
        return client_errc::value_too_big;

    // Message type
    to[0] = header.type;

    // Length, including itself
    boost::endian::store_big_s32(to.data() + 1, static_cast<std::int32_t>(header.size + 4u));

    // Done
    return {};
}

error_code pgwire::protocol::parse_header(std::span<const unsigned char, 5> from, message_header& to)
{
    // Deserialize individual fields
    unsigned char msg_type = from[0];
    auto size = boost::endian::load_big_s32(from.data() + 1u);

    // Range check the length. The actual length (4 bytes) is included in this count
    if (size < 4)
        return client_errc::protocol_value_error;

    // Done
    to = message_header{msg_type, static_cast<std::size_t>(size) - 4u};
    return {};
}

//
// Backend messages
//

error_code pgwire::protocol::parse(std::span<const unsigned char> data, backend_key_data& to)
{
    detail::parse_context ctx(data);
    to.process_id = ctx.get_integral<std::int32_t>();
    to.secret_key = ctx.get_integral<std::int32_t>();
    return ctx.check();
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, authentication_md5_password& to)
{
    detail::parse_context ctx(data);
    to.salt = ctx.get_byte_array<4>();
    return ctx.check();
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, authentication_sasl& to)
{
    detail::parse_context ctx(data);

    // This is a list of strings, terminated by a NULL byte (that is, an empty string).
    // Strings start here
    const unsigned char* mechanisms_first = ctx.first();

    // On error, get_string returns an empty string, so this is safe
    std::size_t num_items = 0u;
    while (!ctx.get_string().empty())
        ++num_items;

    // Strings end in the NULL byte - that is, one byte before what we are now.
    // The check avoids UB in case of empty messages
    const auto* current = ctx.first();
    const unsigned char* mechanisms_last = current > mechanisms_first ? current - 1 : current;

    // Set the output value
    to.mechanisms = {
        num_items,
        {mechanisms_first, mechanisms_last}
    };

    // Done
    return ctx.check();
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, command_complete& to)
{
    detail::parse_context ctx(data);
    to.tag = ctx.get_string();
    return ctx.check();
}

format_code pgwire::protocol::detail::random_access_traits<format_code>::dereference(const unsigned char* data)
{
    return static_cast<format_code>(unchecked_get_integral<std::int16_t>(data));
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, copy_in_response& to)
{
    return parse_copy_response(data, to.overall_fmt_code, to.fmt_codes);
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, copy_out_response& to)
{
    return parse_copy_response(data, to.overall_fmt_code, to.fmt_codes);
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, copy_both_response& to)
{
    return parse_copy_response(data, to.overall_fmt_code, to.fmt_codes);
}

// Each field is: Int32 size + Byte<n>
std::optional<std::span<const unsigned char>> pgwire::protocol::detail::forward_traits<
    std::optional<std::span<const unsigned char>>>::dereference(const unsigned char* data)
{
    auto size = boost::endian::load_big_s32(data);
    if (size == -1)
        return std::nullopt;
    return std::span<const unsigned char>(data + 4u, static_cast<std::size_t>(size));
}

const unsigned char* pgwire::protocol::detail::forward_traits<
    std::optional<std::span<const unsigned char>>>::advance(const unsigned char* data)
{
    auto size = boost::endian::load_big_s32(data);
    return data + 4u + (size > 0 ? size : 0);
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, data_row& to)
{
    detail::parse_context ctx(data);

    // Get the number of columns
    auto num_columns = static_cast<std::size_t>(ctx.get_nonnegative_integral<std::int16_t>());

    // The values start here, record it
    const auto* values_begin = ctx.first();

    // Iterate over all columns to check if there's any error
    for (std::size_t i = 0u; i < num_columns; ++i)
    {
        // Size of the column value
        auto value_size = ctx.get_integral<std::int32_t>();

        // -1 means NULL
        if (value_size == -1)
            continue;

        // Otherwise, the value should be positive, and indicates the value's length
        if (value_size >= 0)
            ctx.check_size_and_advance(static_cast<std::size_t>(value_size));
        else
            ctx.add_error(client_errc::protocol_value_error);
    }

    // Set the output value
    to.columns = forward_parsing_view<std::optional<std::span<const unsigned char>>>(
        num_columns,
        {values_begin, ctx.first()}
    );

    // Done
    return ctx.check();
}

std::string_view pgwire::protocol::detail::forward_traits<std::string_view>::dereference(const unsigned char* data)
{
    return detail::unchecked_get_string(data);
}

const unsigned char* pgwire::protocol::detail::forward_traits<std::string_view>::advance(const unsigned char* data)
{
    detail::unchecked_get_string(data);
    return data;
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, negotiate_protocol_version& to)
{
    detail::parse_context ctx(data);

    // Minor version
    to.minor_version = ctx.get_nonnegative_integral<std::int32_t>();

    // Number of options
    auto num_ops = static_cast<std::size_t>(ctx.get_nonnegative_integral<std::int32_t>());

    // This is where strings begin
    const auto* opts_first = ctx.first();

    // Check that all strings are well-formed
    for (std::size_t i = 0u; i < num_ops; ++i)
        ctx.get_string();

    // Set output
    to.non_recognized_options = {
        num_ops,
        {opts_first, ctx.first()}
    };

    return ctx.check();
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, error_response& to)
{
    return parse_error_notice(data, to);
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, notice_response& to)
{
    return parse_error_notice(data, to);
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, notification_response& to)
{
    detail::parse_context ctx(data);
    to.process_id = ctx.get_integral<std::int32_t>();
    to.channel_name = ctx.get_string();
    to.payload = ctx.get_string();
    return ctx.check();
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, parameter_status& to)
{
    detail::parse_context ctx(data);
    to.name = ctx.get_string();
    to.value = ctx.get_string();
    return ctx.check();
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, ready_for_query& to)
{
    detail::parse_context ctx(data);

    // The status is one byte. Get it and check that what we got is one of the valid values.
    // On error, returns a zero byte, which is not valid, either
    auto status = static_cast<transaction_status>(ctx.get_byte());
    if (!is_valid_status(status))
        ctx.add_error(client_errc::protocol_value_error);
    to.status = status;

    return ctx.check();
}

field_description pgwire::protocol::detail::forward_traits<field_description>::dereference(
    const unsigned char* data
)
{
    // Evaluation order of initializers is well defined
    return {
        detail::unchecked_get_string(data),                  // name
        detail::unchecked_get_integral<std::int32_t>(data),  // table_oid
        detail::unchecked_get_integral<std::int16_t>(data),  // column_attribute
        detail::unchecked_get_integral<std::int32_t>(data),  // type_oid
        detail::unchecked_get_integral<std::int16_t>(data),  // type_length
        detail::unchecked_get_integral<std::int32_t>(data),  // type_modifier
        static_cast<format_code>(detail::unchecked_get_integral<std::int16_t>(data)),
    };
}

const unsigned char* pgwire::protocol::detail::forward_traits<field_description>::advance(
    const unsigned char* data
)
{
    // The string is the only variable-size item. Skip it
    detail::unchecked_get_string(data);

    // Skip the fixed fields
    return data + field_description_fixed_size;
}

error_code pgwire::protocol::parse(std::span<const unsigned char> data, row_description& to)
{
    detail::parse_context ctx(data);

    // Get the number of items (Int16)
    auto num_items = static_cast<std::size_t>(ctx.get_nonnegative_integral<std::int16_t>());

    // Message to pass to the forward parsing collection starts here
    const auto* data_first = ctx.first();

    // Iterate over all items to check that the format is valid
    for (std::size_t i = 0u; i < num_items; ++i)
    {
        // The name (string) is variable size, so we must get it
        ctx.get_string();

        // Fixed fields are integrals and can't be invalid.
        // Stop before the format code field, which needs to be checked
        ctx.check_size_and_advance(field_description_fixed_size - 2u);
        auto fmt_code = static_cast<format_code>(ctx.get_integral<std::int16_t>());
        if (!is_valid_format_code(fmt_code))
            ctx.add_error(client_errc::protocol_value_error);
    }

    to.field_descriptions = {
        num_items,
        {data_first, ctx.first()}
    };

    // Done
    return ctx.check();
}

error_code pgwire::protocol::parse(
    std::uint8_t message_type,
    std::span<const unsigned char> data,
    any_backend_message& to
)
{
    switch (static_cast<backend_message_type>(message_type))
    {
        case backend_message_type::authentication_request: return parse_authentication_request(data, to);
        case backend_message_type::backend_key_data: return parse_impl<backend_key_data>(data, to);
        case backend_message_type::command_complete: return parse_impl<command_complete>(data, to);
        case backend_message_type::copy_data: return parse_impl<copy_data>(data, to);
        case backend_message_type::copy_done: return parse_impl<copy_done>(data, to);
        case backend_message_type::copy_in_response: return parse_impl<copy_in_response>(data, to);
        case backend_message_type::copy_out_response: return parse_impl<copy_out_response>(data, to);
        case backend_message_type::copy_both_response: return parse_impl<copy_both_response>(data, to);
        case backend_message_type::data_row: return parse_impl<data_row>(data, to);
        case backend_message_type::empty_query_response: return parse_impl<empty_query_response>(data, to);
        case backend_message_type::error_response: return parse_impl<error_response>(data, to);
        case backend_message_type::negotiate_protocol_version:
            return parse_impl<negotiate_protocol_version>(data, to);
        case backend_message_type::notice_response: return parse_impl<notice_response>(data, to);
        case backend_message_type::notification_response: return parse_impl<notification_response>(data, to);
        case backend_message_type::parameter_status: return parse_impl<parameter_status>(data, to);
        case backend_message_type::ready_for_query: return parse_impl<ready_for_query>(data, to);
        case backend_message_type::row_description: return parse_impl<row_description>(data, to);

        // Extended query messages. We never send the requests that produce them
        case backend_message_type::bind_complete:
        case backend_message_type::close_complete:
        case backend_message_type::no_data:
        case backend_message_type::parameter_description:
        case backend_message_type::parse_complete:
        case backend_message_type::portal_suspended: return client_errc::unexpected_message;

        default: return client_errc::protocol_value_error;
    }
}

//
// Frontend messages
//

error_code pgwire::protocol::serialize(const copy_data& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('d');
    ctx.add_bytes(msg.data);
    return ctx.finalize_message();
}

error_code pgwire::protocol::serialize(const copy_fail& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('f');
    ctx.add_string(msg.error_message);
    return ctx.finalize_message();
}

error_code pgwire::protocol::serialize(copy_done, std::vector<unsigned char>& to)
{
    return serialize_header_only('c', to);
}

error_code pgwire::protocol::serialize(terminate, std::vector<unsigned char>& to)
{
    return serialize_header_only('X', to);
}

error_code pgwire::protocol::serialize(const password& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('p');
    ctx.add_string(msg.password);
    return ctx.finalize_message();
}

error_code pgwire::protocol::serialize(query msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('Q');
    ctx.add_string(msg.query);
    return ctx.finalize_message();
}

error_code pgwire::protocol::serialize(const startup_message& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);

    // This message does not have a message type, but it does have a length.
    ctx.add_untyped_header();

    // The protocol version number. The most significant 16 bits are the major version number (3 for the
    // protocol described here). The least significant 16 bits are the minor version number (0 for the
    // protocol described here).
    ctx.add_integral(std::int32_t(196608));

    // Username
    ctx.add_string("user");
    ctx.add_string(msg.user);

    // Database, if present
    if (msg.database.has_value())
    {
        ctx.add_string("database");
        ctx.add_string(*msg.database);
    }

    // Rest of params
    for (auto param : msg.params)
    {
        ctx.add_string(param.first);
        ctx.add_string(param.second);
    }

    // Terminator
    ctx.add_byte(0);

    return ctx.finalize_message();
}
