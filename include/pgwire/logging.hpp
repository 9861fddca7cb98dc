//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_LOGGING_HPP
#define PGWIRE_LOGGING_HPP

#include <string>

namespace pgwire {

enum class log_level
{
    // Logging disabled
    none,

    // Connection lifecycle, COPY operations, server notices and failures
    normal,

    // Everything, including protocol state transitions and messages sent and received
    debug,
};

struct log_params
{
    log_level level{log_level::normal};

    // If not empty, log records are appended to this file
    std::string file;

    // Also write log records to the console
    bool echo_messages{false};
};

// Configures the global Boost.Log core. Sinks installed by previous calls are removed
void configure_logging(const log_params& params);

}  // namespace pgwire

#endif
