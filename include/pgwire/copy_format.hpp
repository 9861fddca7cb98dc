//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_COPY_FORMAT_HPP
#define PGWIRE_COPY_FORMAT_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "pgwire/protocol/common.hpp"

namespace pgwire {

// The data format of an in-progress COPY, as announced by the server
// in CopyInResponse or CopyOutResponse. Immutable once the copy has started.
class copy_format
{
    bool binary_{};
    std::vector<protocol::format_code> field_formats_;

public:
    copy_format() = default;

    copy_format(bool binary, std::vector<protocol::format_code> field_formats)
        : binary_(binary), field_formats_(std::move(field_formats))
    {
    }

    // Is the overall COPY format binary (as opposed to textual)?
    bool is_binary() const noexcept { return binary_; }

    // Number of columns that will be copied
    int field_count() const noexcept { return static_cast<int>(field_formats_.size()); }

    // Is the given column in binary format? Out of range indices yield false
    bool field_is_binary(int field) const noexcept
    {
        if (field < 0 || static_cast<std::size_t>(field) >= field_formats_.size())
            return false;
        return field_formats_[static_cast<std::size_t>(field)] == protocol::format_code::binary;
    }

    const std::vector<protocol::format_code>& field_formats() const noexcept { return field_formats_; }

    friend bool operator==(const copy_format&, const copy_format&) = default;
};

}  // namespace pgwire

#endif
