//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert/source_location.hpp>
#include <boost/log/trivial.hpp>
#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include "pgwire/client_errc.hpp"
#include "pgwire/command_result.hpp"
#include "pgwire/connector.hpp"
#include "pgwire/copy_format.hpp"
#include "pgwire/copy_out_operation.hpp"
#include "pgwire/extended_error.hpp"
#include "pgwire/notification_block.hpp"

using namespace pgwire;
using boost::system::error_code;

namespace {

using owned_stream = std::unique_ptr<copy_out_stream>;

}  // namespace

copy_out_operation::copy_out_operation(connector& conn, std::string command)
    : conn_(conn), command_(std::move(command))
{
}

copy_out_operation::copy_out_operation(connector& conn, std::string command, std::ostream& sink)
    : conn_(conn), command_(std::move(command)), stream_(&sink)
{
}

copy_out_operation::~copy_out_operation()
{
    if (is_active())
    {
        error_code err;
        diagnostics diag;
        end(err, diag);
        if (err)
            BOOST_LOG_TRIVIAL(warning) << "Error finishing COPY OUT: " << err.message() << " " << diag.message();
    }
    else
    {
        finish();
    }
}

copy_stream_ref copy_out_operation::stream_ref() const noexcept
{
    if (const auto* sink = boost::variant2::get_if<std::ostream*>(&stream_))
        return *sink;
    if (const auto* owned = boost::variant2::get_if<owned_stream>(&stream_))
        return static_cast<std::istream*>(owned->get());
    return boost::variant2::monostate{};
}

void copy_out_operation::finish() noexcept
{
    auto& med = conn_.get_mediator();
    auto ref = stream_ref();
    if (!boost::variant2::holds_alternative<boost::variant2::monostate>(ref) && med.copy_stream() == ref)
        med.clear_copy_stream();
    if (boost::variant2::holds_alternative<owned_stream>(stream_))
        stream_ = boost::variant2::monostate{};
}

void copy_out_operation::start(error_code& err, diagnostics& diag)
{
    err.clear();
    diag.clear();

    if (!conn_.is_ready())
    {
        err = client_errc::wrong_state;
        diag.assign("Copy can only start in Ready state, not in " + std::string(conn_.state_name()));
        return;
    }

    finish();

    auto& med = conn_.get_mediator();
    med.set_copy_stream(stream_ref());
    BOOST_LOG_TRIVIAL(info) << "Starting COPY OUT: " << command_;

    command_result result;
    conn_.execute(command_, result, err, diag);
    if (err)
    {
        finish();
        return;
    }

    if (result.copy != copy_direction::out)
    {
        if (result.copy == copy_direction::in)
        {
            // The server answers CopyFail with an error, which is expected here
            conn_.send_copy_fail("not a COPY OUT query", err, diag);
            if (err && err != client_errc::exec_server_error)
            {
                finish();
                return;
            }
        }
        err = client_errc::not_a_copy_query;
        diag.assign("Not a COPY OUT query: " + command_);
        finish();
        return;
    }

    // With a sink, execute() already received all the data
    if (boost::variant2::holds_alternative<std::ostream*>(stream_))
    {
        finish();
        return;
    }

    stream_ = std::make_unique<copy_out_stream>(conn_);
    med.set_copy_stream(stream_ref());
}

void copy_out_operation::start()
{
    error_code err;
    diagnostics diag;
    start(err, diag);
    detail::throw_on_error(err, diag, BOOST_CURRENT_LOCATION);
}

bool copy_out_operation::is_active() const noexcept
{
    const auto* owned = boost::variant2::get_if<owned_stream>(&stream_);
    return owned && *owned && boost::variant2::holds_alternative<protocol::copy_out_state>(conn_.state()) &&
           conn_.get_mediator().copy_stream() == stream_ref();
}

std::istream* copy_out_operation::copy_stream() noexcept
{
    auto* owned = boost::variant2::get_if<owned_stream>(&stream_);
    return owned ? owned->get() : nullptr;
}

std::ostream* copy_out_operation::sink() const noexcept
{
    const auto* sink = boost::variant2::get_if<std::ostream*>(&stream_);
    return sink ? *sink : nullptr;
}

bool copy_out_operation::is_binary() const noexcept
{
    const auto* fmt = is_active() ? conn_.get_copy_format() : nullptr;
    return fmt ? fmt->is_binary() : false;
}

bool copy_out_operation::field_is_binary(int field) const noexcept
{
    const auto* fmt = is_active() ? conn_.get_copy_format() : nullptr;
    return fmt ? fmt->field_is_binary(field) : false;
}

int copy_out_operation::field_count() const noexcept
{
    const auto* fmt = is_active() ? conn_.get_copy_format() : nullptr;
    return fmt ? fmt->field_count() : -1;
}

void copy_out_operation::end(error_code& err, diagnostics& diag)
{
    struct finish_guard
    {
        copy_out_operation& self;
        ~finish_guard() { self.finish(); }
    } guard{*this};

    err.clear();
    diag.clear();
    if (!is_active())
        return;

    // Unread data is discarded
    auto blk = conn_.block_notification_thread();
    while (conn_.read_copy_data(err, diag))
        ;
}

void copy_out_operation::end()
{
    error_code err;
    diagnostics diag;
    end(err, diag);
    detail::throw_on_error(err, diag, BOOST_CURRENT_LOCATION);
}
