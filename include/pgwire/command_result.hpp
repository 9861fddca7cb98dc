//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_COMMAND_RESULT_HPP
#define PGWIRE_COMMAND_RESULT_HPP

#include <cstddef>
#include <string>

namespace pgwire {

enum class copy_direction
{
    none,
    in,
    out,
};

// What connector::execute learnt about the command it ran
struct command_result
{
    // Tag of the last CommandComplete (e.g. "INSERT 0 1"). Empty if the command is still in a COPY
    std::string command_tag;

    // Number of rows returned by the server. Row contents are discarded
    std::size_t rows{};

    // Whether the command started a COPY, and in which direction
    copy_direction copy{copy_direction::none};
};

}  // namespace pgwire

#endif
