//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/attributes/current_process_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/keywords/auto_flush.hpp>
#include <boost/log/keywords/file_name.hpp>
#include <boost/log/keywords/format.hpp>
#include <boost/log/keywords/open_mode.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <ios>
#include <iostream>

#include "pgwire/logging.hpp"

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

namespace {

// [timestamp] [pid] [severity] message
auto record_format()
{
    return expr::stream << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                        << "] [" << expr::attr<logging::attributes::current_process_id::value_type>("ProcessID")
                        << "] [" << logging::trivial::severity << "] " << expr::smessage;
}

}  // namespace

void pgwire::configure_logging(const log_params& params)
{
    auto core = logging::core::get();
    core->remove_all_sinks();

    if (params.level == log_level::none)
    {
        core->set_logging_enabled(false);
        return;
    }

    core->set_logging_enabled(true);
    if (params.level == log_level::debug)
        core->set_filter(logging::trivial::severity >= logging::trivial::trace);
    else
        core->set_filter(logging::trivial::severity >= logging::trivial::info);

    logging::add_common_attributes();

    if (!params.file.empty())
    {
        logging::add_file_log(
            keywords::file_name = params.file,
            keywords::open_mode = std::ios_base::out | std::ios_base::app,
            keywords::auto_flush = true,
            keywords::format = record_format()
        );
    }

    if (params.echo_messages)
        logging::add_console_log(std::clog, keywords::format = record_format());
}
