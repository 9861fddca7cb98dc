//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/core/lightweight_test.hpp>
#include <boost/log/trivial.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

#include "pgwire/logging.hpp"

using namespace pgwire;

namespace {

std::string log_file_name(const char* suffix)
{
    return "pgwire_test_logging_" + std::to_string(::getpid()) + suffix + ".log";
}

std::string read_file(const std::string& name)
{
    std::ifstream is(name);
    std::ostringstream os;
    os << is.rdbuf();
    return os.str();
}

// Records at the configured level are written with the common attributes
void test_normal()
{
    auto fname = log_file_name("_normal");
    configure_logging({.level = log_level::normal, .file = fname});
    BOOST_LOG_TRIVIAL(info) << "Connected to localhost";
    BOOST_LOG_TRIVIAL(debug) << "Connection state Ready -> Executing";
    configure_logging({.level = log_level::none});

    auto contents = read_file(fname);
    BOOST_TEST(contents.find("[info] Connected to localhost") != std::string::npos);
    BOOST_TEST(contents.find("Executing") == std::string::npos);
    std::remove(fname.c_str());
}

void test_debug()
{
    auto fname = log_file_name("_debug");
    configure_logging({.level = log_level::debug, .file = fname});
    BOOST_LOG_TRIVIAL(debug) << "Connection state Ready -> Executing";
    configure_logging({.level = log_level::none});

    auto contents = read_file(fname);
    BOOST_TEST(contents.find("[debug] Connection state Ready -> Executing") != std::string::npos);
    std::remove(fname.c_str());
}

// Nothing is written once logging is disabled
void test_none()
{
    auto fname = log_file_name("_none");
    configure_logging({.level = log_level::normal, .file = fname});
    configure_logging({.level = log_level::none});
    BOOST_LOG_TRIVIAL(error) << "Should not appear";

    auto contents = read_file(fname);
    BOOST_TEST(contents.find("Should not appear") == std::string::npos);
    std::remove(fname.c_str());
}

}  // namespace

int main()
{
    test_normal();
    test_debug();
    test_none();

    return boost::report_errors();
}
