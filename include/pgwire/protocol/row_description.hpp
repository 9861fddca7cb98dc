//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_ROW_DESCRIPTION_HPP
#define PGWIRE_PROTOCOL_ROW_DESCRIPTION_HPP

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <span>
#include <string_view>

#include "pgwire/protocol/common.hpp"
#include "pgwire/protocol/views.hpp"

namespace pgwire {
namespace protocol {

struct field_description
{
    // The field name.
    std::string_view name;

    // If the field can be identified as a column of a specific table, the object ID of the table; otherwise
    // zero.
    std::int32_t table_oid;

    // If the field can be identified as a column of a specific table, the attribute number of the column;
    // otherwise zero.
    std::int16_t column_attribute;

    // The object ID of the field's data type.
    std::int32_t type_oid;

    // The data type size (see pg_type.typlen). Note that negative values denote variable-width types.
    std::int16_t type_length;

    // The type modifier (see pg_attribute.atttypmod). The meaning of the modifier is type-specific.
    std::int32_t type_modifier;

    // The format code being used for the field.
    format_code fmt_code;
};

namespace detail {

template <>
struct forward_traits<field_description>
{
    static field_description dereference(const unsigned char* data);
    static const unsigned char* advance(const unsigned char* data);
};

}  // namespace detail

struct row_description
{
    // Information about each field
    forward_parsing_view<field_description> field_descriptions;
};
boost::system::error_code parse(std::span<const unsigned char> data, row_description& to);

}  // namespace protocol
}  // namespace pgwire

#endif
