//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/io_context.hpp>

#include <exception>
#include <iostream>
#include <sstream>

#include "pgwire/command_result.hpp"
#include "pgwire/connector.hpp"
#include "pgwire/copy_in_operation.hpp"
#include "pgwire/copy_out_operation.hpp"
#include "pgwire/extended_error.hpp"
#include "pgwire/logging.hpp"
#include "pgwire/notification.hpp"

namespace asio = boost::asio;
using namespace pgwire;

static void run()
{
    asio::io_context ctx;

    // Log to the console
    configure_logging({.level = log_level::normal, .echo_messages = true});

    // Create a connector, and get notified when somebody loads data
    connector conn{ctx.get_executor()};
    conn.set_notification_handler([](const notification& n) {
        std::cout << "Notification on " << n.channel << ": " << n.payload << std::endl;
    });

    // Connect
    conn.connect({.hostname = "localhost", .username = "postgres", .password = "", .database = "postgres"});
    std::cout << "Startup complete\n";

    // Setup
    command_result result;
    conn.execute("CREATE TEMPORARY TABLE mytable (id INT, name TEXT)", result);
    conn.execute("LISTEN loads", result);

    // Load data using the stream provided by the operation
    {
        copy_in_operation op(conn, "COPY mytable FROM STDIN");
        op.start();
        auto& os = *op.copy_stream();
        for (int i = 0; i < 10; ++i)
            os << i << '\t' << "name_" << i << '\n';
        op.end();
        std::cout << "Loaded: " << conn.get_mediator().last_command_tag() << '\n';
    }

    // Load data from a stream we own
    {
        std::istringstream source("100\tfirst\n101\tsecond\n");
        copy_in_operation op(conn, "COPY mytable FROM STDIN", source);
        op.start();
        std::cout << "Loaded: " << conn.get_mediator().last_command_tag() << '\n';
    }

    conn.execute("NOTIFY loads, 'mytable'", result);

    // Dump everything
    copy_out_operation dump(conn, "COPY mytable TO STDOUT", std::cout);
    dump.start();

    conn.close();
    std::cout << "Done\n";
}

int main()
{
    try
    {
        run();
    }
    catch (const error_with_diagnostics& err)
    {
        std::cerr << "Error: " << err.what() << ", server diagnostics: " << err.get_diagnostics().message()
                  << std::endl;
        return 1;
    }
    catch (const std::exception& err)
    {
        std::cerr << "Error: " << err.what() << std::endl;
        return 1;
    }
}
