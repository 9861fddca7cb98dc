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

#include <cstddef>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "pgwire/client_errc.hpp"
#include "pgwire/command_result.hpp"
#include "pgwire/connector.hpp"
#include "pgwire/copy_format.hpp"
#include "pgwire/copy_in_operation.hpp"
#include "pgwire/extended_error.hpp"
#include "pgwire/notification_block.hpp"

using namespace pgwire;
using boost::system::error_code;

namespace {

using owned_stream = std::unique_ptr<copy_in_stream>;

}  // namespace

copy_in_operation::copy_in_operation(connector& conn, std::string command)
    : conn_(conn), command_(std::move(command))
{
}

copy_in_operation::copy_in_operation(connector& conn, std::string command, std::istream& source)
    : conn_(conn), command_(std::move(command)), stream_(&source)
{
}

copy_in_operation::~copy_in_operation()
{
    if (is_active())
    {
        error_code err;
        diagnostics diag;
        cancel("COPY IN operation destroyed while active", err, diag);

        // The server reporting the cancellation is the expected outcome
        if (err && err != client_errc::exec_server_error)
            BOOST_LOG_TRIVIAL(warning) << "Error cancelling COPY IN: " << err.message() << " " << diag.message();
    }
    else
    {
        finish();
    }
}

copy_stream_ref copy_in_operation::stream_ref() const noexcept
{
    if (const auto* source = boost::variant2::get_if<std::istream*>(&stream_))
        return *source;
    if (const auto* owned = boost::variant2::get_if<owned_stream>(&stream_))
        return static_cast<std::ostream*>(owned->get());
    return boost::variant2::monostate{};
}

void copy_in_operation::finish() noexcept
{
    auto& med = conn_.get_mediator();
    auto ref = stream_ref();
    if (!boost::variant2::holds_alternative<boost::variant2::monostate>(ref) && med.copy_stream() == ref)
        med.clear_copy_stream();
    if (boost::variant2::holds_alternative<owned_stream>(stream_))
        stream_ = boost::variant2::monostate{};
}

void copy_in_operation::start(error_code& err, diagnostics& diag)
{
    err.clear();
    diag.clear();

    if (!conn_.is_ready())
    {
        err = client_errc::wrong_state;
        diag.assign("Copy can only start in Ready state, not in " + std::string(conn_.state_name()));
        return;
    }

    // A previous run of this operation may have left a stream behind
    finish();

    auto& med = conn_.get_mediator();
    med.set_copy_stream(stream_ref());
    BOOST_LOG_TRIVIAL(info) << "Starting COPY IN: " << command_;

    command_result result;
    conn_.execute(command_, result, err, diag);
    if (err)
    {
        finish();
        return;
    }

    if (result.copy != copy_direction::in)
    {
        if (result.copy == copy_direction::out)
        {
            // Discard the data so the connection gets back to ready
            while (conn_.read_copy_data(err, diag))
                ;
            if (err)
            {
                finish();
                return;
            }
        }
        err = client_errc::not_a_copy_query;
        diag.assign("Not a COPY IN query: " + command_);
        finish();
        return;
    }

    // With a source, execute() already sent all the data
    if (boost::variant2::holds_alternative<std::istream*>(stream_))
    {
        finish();
        return;
    }

    stream_ = std::make_unique<copy_in_stream>(conn_, med.copy_buffer_size());
    med.set_copy_stream(stream_ref());
}

void copy_in_operation::start()
{
    error_code err;
    diagnostics diag;
    start(err, diag);
    detail::throw_on_error(err, diag, BOOST_CURRENT_LOCATION);
}

bool copy_in_operation::is_active() const noexcept
{
    const auto* owned = boost::variant2::get_if<owned_stream>(&stream_);
    return owned && *owned && boost::variant2::holds_alternative<protocol::copy_in_state>(conn_.state()) &&
           conn_.get_mediator().copy_stream() == stream_ref();
}

std::ostream* copy_in_operation::copy_stream() noexcept
{
    auto* owned = boost::variant2::get_if<owned_stream>(&stream_);
    return owned ? owned->get() : nullptr;
}

std::istream* copy_in_operation::source() const noexcept
{
    const auto* source = boost::variant2::get_if<std::istream*>(&stream_);
    return source ? *source : nullptr;
}

bool copy_in_operation::is_binary() const noexcept
{
    const auto* fmt = is_active() ? conn_.get_copy_format() : nullptr;
    return fmt ? fmt->is_binary() : false;
}

bool copy_in_operation::field_is_binary(int field) const noexcept
{
    const auto* fmt = is_active() ? conn_.get_copy_format() : nullptr;
    return fmt ? fmt->field_is_binary(field) : false;
}

int copy_in_operation::field_count() const noexcept
{
    const auto* fmt = is_active() ? conn_.get_copy_format() : nullptr;
    return fmt ? fmt->field_count() : -1;
}

std::size_t copy_in_operation::copy_buffer_size() const noexcept { return conn_.get_mediator().copy_buffer_size(); }

void copy_in_operation::set_copy_buffer_size(std::size_t value) noexcept
{
    conn_.get_mediator().set_copy_buffer_size(value);
}

void copy_in_operation::end(error_code& err, diagnostics& diag)
{
    struct finish_guard
    {
        copy_in_operation& self;
        ~finish_guard() { self.finish(); }
    } guard{*this};

    err.clear();
    diag.clear();
    if (!is_active())
        return;

    auto blk = conn_.block_notification_thread();
    auto& stream = *boost::variant2::get<owned_stream>(stream_);
    stream.flush();
    if (stream.error())
    {
        err = stream.error();
        diag = stream.diag();
        return;
    }
    conn_.send_copy_done(err, diag);
}

void copy_in_operation::end()
{
    error_code err;
    diagnostics diag;
    end(err, diag);
    detail::throw_on_error(err, diag, BOOST_CURRENT_LOCATION);
}

void copy_in_operation::cancel(std::string_view message, error_code& err, diagnostics& diag)
{
    struct finish_guard
    {
        copy_in_operation& self;
        ~finish_guard() { self.finish(); }
    } guard{*this};

    err.clear();
    diag.clear();
    if (!is_active())
        return;

    // Buffered data is discarded
    auto blk = conn_.block_notification_thread();
    BOOST_LOG_TRIVIAL(info) << "Cancelling COPY IN: " << message;
    conn_.send_copy_fail(message, err, diag);
}

void copy_in_operation::cancel(std::string_view message)
{
    error_code err;
    diagnostics diag;
    cancel(message, err, diag);
    detail::throw_on_error(err, diag, BOOST_CURRENT_LOCATION);
}
