//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/assert.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/log/trivial.hpp>
#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "notification_listener.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/command_result.hpp"
#include "pgwire/connect_params.hpp"
#include "pgwire/connector.hpp"
#include "pgwire/extended_error.hpp"
#include "pgwire/mediator.hpp"
#include "pgwire/notification.hpp"
#include "pgwire/protocol/command_response_fsm.hpp"
#include "pgwire/protocol/connection_state.hpp"
#include "pgwire/protocol/copy.hpp"
#include "pgwire/protocol/messages.hpp"
#include "pgwire/protocol/protocol_state.hpp"
#include "pgwire/protocol/query.hpp"
#include "pgwire/protocol/read_message_fsm.hpp"
#include "pgwire/protocol/startup_fsm.hpp"
#include "pgwire/protocol/terminate.hpp"

using namespace pgwire;
using boost::system::error_code;
namespace asio = boost::asio;

namespace {

constexpr std::size_t min_read_size = 512u;

std::span<const unsigned char> readable_bytes(const boost::beast::flat_buffer& buff)
{
    auto data = buff.data();
    return {static_cast<const unsigned char*>(data.data()), data.size()};
}

}  // namespace

struct pgwire::detail::connector_impl
{
    asio::ip::tcp::socket sock;
    protocol::connection_state st;
    protocol::protocol_state state;
    protocol::command_response_fsm response_fsm;
    pgwire::mediator med;
    notification_listener listener;

    explicit connector_impl(asio::any_io_executor ex) : sock(std::move(ex)) {}

    ~connector_impl() { listener.stop(); }

    void transition_to(protocol::protocol_state next)
    {
        BOOST_ASSERT(protocol::can_transition(state, next));
        BOOST_LOG_TRIVIAL(debug) << "Connection state " << protocol::state_name(state) << " -> "
                                 << protocol::state_name(next);
        state = std::move(next);
        listener.set_idle(boost::variant2::holds_alternative<protocol::ready_state>(state));
    }

    void mark_broken(error_code ec)
    {
        if (boost::variant2::holds_alternative<protocol::broken_state>(state))
            return;
        BOOST_LOG_TRIVIAL(warning) << "Connection broken: " << ec.message();
        transition_to(protocol::broken_state{ec});
    }

    // Checks that op can be performed in the current state
    bool check(protocol::operation op, error_code& err, diagnostics& diag) const
    {
        err = protocol::check_legal(state, op);
        if (!err)
            return true;

        std::string msg{"Cannot "};
        msg += protocol::operation_name(op);
        msg += " in state ";
        msg += protocol::state_name(state);
        if (const auto* broken = boost::variant2::get_if<protocol::broken_state>(&state))
        {
            msg += " (";
            msg += broken->reason.message();
            msg += ")";
        }
        diag.assign(std::move(msg));
        return false;
    }

    // Failures in I/O or message parsing leave the connection unusable
    void fail(error_code ec, error_code& err)
    {
        mark_broken(ec);
        err = ec;
    }

    error_code write_pending()
    {
        error_code ec;
        asio::write(sock, asio::buffer(st.write_buffer), ec);
        st.write_buffer.clear();
        return ec;
    }

    // Asynchronous messages can arrive at any time. on_listener is true when
    // called from the notification thread, which must not touch the mediator
    void handle_async(const protocol::any_backend_message& msg, bool on_listener)
    {
        if (const auto* n = boost::variant2::get_if<protocol::notification_response>(&msg))
        {
            notification notif{n->process_id, std::string(n->channel_name), std::string(n->payload)};
            if (on_listener)
                listener.deliver(notif);
            else
                listener.defer(std::move(notif));
        }
        else if (const auto* notice = boost::variant2::get_if<protocol::notice_response>(&msg))
        {
            diagnostics formatted(*notice);
            BOOST_LOG_TRIVIAL(info) << "Server notice: " << formatted.message();
            if (!on_listener)
                med.add_notice(std::string(formatted.message()));
        }
        else if (const auto* param = boost::variant2::get_if<protocol::parameter_status>(&msg))
        {
            BOOST_LOG_TRIVIAL(debug) << "Server parameter " << param->name << " = " << param->value;
            st.server_parameters.insert_or_assign(std::string(param->name), std::string(param->value));
        }
    }

    // Frames the next message in the read buffer, discarding the previous one
    protocol::read_message_fsm::result next_buffered_message()
    {
        st.read_buffer.consume(std::exchange(st.pending_consume, 0u));
        return protocol::read_message_fsm().resume(readable_bytes(st.read_buffer));
    }

    error_code read_some(std::size_t hint)
    {
        error_code ec;
        auto buff = st.read_buffer.prepare((std::max)(hint, min_read_size));
        std::size_t bytes_read = sock.read_some(buff, ec);
        st.read_buffer.commit(bytes_read);
        return ec;
    }

    // Reads the next message for the synchronous path. Asynchronous messages are handled here.
    // The message points into the read buffer, and is valid until the next read
    error_code read_message(protocol::any_backend_message& msg)
    {
        while (true)
        {
            auto res = next_buffered_message();
            switch (res.type())
            {
                case protocol::read_message_fsm::result_type::error: return res.error();
                case protocol::read_message_fsm::result_type::needs_more:
                    if (auto ec = read_some(res.hint()))
                        return ec;
                    break;
                case protocol::read_message_fsm::result_type::message:
                    st.pending_consume = res.bytes_consumed();
                    if (protocol::is_async_message(res.message()))
                    {
                        handle_async(res.message(), false);
                        break;
                    }
                    msg = res.message();
                    return error_code();
            }
        }
    }

    // Runs on the notification thread
    error_code pump(bool read_socket, bool& stalled)
    {
        stalled = false;
        if (read_socket)
        {
            if (auto ec = read_some(min_read_size))
                return ec;
        }

        while (true)
        {
            auto res = next_buffered_message();
            switch (res.type())
            {
                case protocol::read_message_fsm::result_type::error: return res.error();
                case protocol::read_message_fsm::result_type::needs_more: return error_code();
                case protocol::read_message_fsm::result_type::message:
                    if (!protocol::is_async_message(res.message()))
                    {
                        // Leave it for the synchronous path
                        stalled = true;
                        return error_code();
                    }
                    st.pending_consume = res.bytes_consumed();
                    handle_async(res.message(), true);
                    break;
            }
        }
    }

    // ReadyForQuery was received: record the outcome
    void complete(error_code ec, command_result* result, error_code& err, diagnostics& diag)
    {
        if (ec && ec != client_errc::exec_server_error)
        {
            fail(ec, err);
            return;
        }

        transition_to(protocol::ready_state{response_fsm.status()});
        med.set_last_command_tag(response_fsm.command_tag());
        if (result)
        {
            result->command_tag = response_fsm.command_tag();
            result->rows = response_fsm.rows();
        }
        if (ec)
        {
            err = ec;
            diag = response_fsm.diag();
        }
    }

    // Sends a caller-supplied COPY source. On failure, the copy is aborted
    // and the error is reported once the server acknowledges it
    error_code send_source(std::istream& source, bool& source_failed)
    {
        std::vector<char> chunk(med.copy_buffer_size());
        source_failed = false;
        try
        {
            while (true)
            {
                source.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                auto n = static_cast<std::size_t>(source.gcount());
                if (n > 0u)
                {
                    protocol::copy_data msg{{reinterpret_cast<const unsigned char*>(chunk.data()), n}};
                    if (auto ec = protocol::serialize(msg, st.write_buffer))
                        return ec;
                    if (auto ec = write_pending())
                        return ec;
                }
                if (source.eof())
                    break;
                if (source.fail())
                {
                    source_failed = true;
                    break;
                }
            }
        }
        catch (const std::exception& e)
        {
            BOOST_LOG_TRIVIAL(warning) << "COPY source stream threw an exception: " << e.what();
            source_failed = true;
        }

        error_code ec;
        if (source_failed)
        {
            BOOST_LOG_TRIVIAL(warning) << "COPY source stream failed, aborting the copy";
            ec = protocol::serialize(protocol::copy_fail{"COPY source stream failed"}, st.write_buffer);
        }
        else
        {
            ec = protocol::serialize(protocol::copy_done{}, st.write_buffer);
        }
        return ec ? ec : write_pending();
    }

    // Reads the response to a query, until ReadyForQuery or the start of a COPY
    // that must be driven by the caller
    void run_response(command_result* result, error_code& err, diagnostics& diag)
    {
        // Stream failures are reported after the server completes the command
        error_code stream_err;

        while (true)
        {
            protocol::any_backend_message msg;
            if (auto ec = read_message(msg))
            {
                fail(ec, err);
                return;
            }

            // CopyData is data, rather than protocol flow
            if (const auto* data = boost::variant2::get_if<protocol::copy_data>(&msg))
            {
                auto* sink = boost::variant2::get_if<std::ostream*>(&med.copy_stream());
                if (!boost::variant2::holds_alternative<protocol::copy_out_state>(state) || !sink)
                {
                    fail(client_errc::unexpected_message, err);
                    return;
                }
                if (!stream_err)
                {
                    try
                    {
                        (*sink)->write(reinterpret_cast<const char*>(data->data.data()), data->data.size());
                        if (!**sink)
                            stream_err = client_errc::copy_sink_failed;
                    }
                    catch (const std::exception& e)
                    {
                        BOOST_LOG_TRIVIAL(warning) << "COPY sink stream threw an exception: " << e.what();
                        stream_err = client_errc::copy_sink_failed;
                    }
                }
                continue;
            }

            auto res = response_fsm.resume(msg);
            switch (res.type)
            {
                case protocol::command_response_fsm::result_type::read: break;
                case protocol::command_response_fsm::result_type::copy_in:
                {
                    transition_to(protocol::copy_in_state{response_fsm.format()});
                    if (result)
                        result->copy = copy_direction::in;
                    auto* source = boost::variant2::get_if<std::istream*>(&med.copy_stream());
                    if (!source)
                        return;  // The caller sends the data
                    bool source_failed = false;
                    if (auto ec = send_source(**source, source_failed))
                    {
                        fail(ec, err);
                        return;
                    }
                    if (source_failed)
                        stream_err = client_errc::copy_source_failed;
                    break;
                }
                case protocol::command_response_fsm::result_type::copy_out:
                    transition_to(protocol::copy_out_state{response_fsm.format()});
                    if (result)
                        result->copy = copy_direction::out;
                    if (!boost::variant2::holds_alternative<std::ostream*>(med.copy_stream()))
                        return;  // The caller reads the data
                    break;
                case protocol::command_response_fsm::result_type::done:
                    complete(res.ec, result, err, diag);
                    if (stream_err && !boost::variant2::holds_alternative<protocol::broken_state>(state))
                    {
                        err = stream_err;
                        diag.assign(
                            stream_err == client_errc::copy_source_failed
                                ? "Reading from the COPY source stream failed"
                                : "Writing to the COPY sink stream failed"
                        );
                    }
                    return;
            }
        }
    }

    void connect(const connect_params& params, error_code& err, diagnostics& diag)
    {
        if (!check(protocol::operation::connect, err, diag))
            return;
        transition_to(protocol::connecting_state{});
        BOOST_LOG_TRIVIAL(info) << "Connecting to " << params.hostname << ":" << params.port;

        // Physical connect
        error_code ec;
        asio::ip::tcp::resolver resolv(sock.get_executor());
        auto endpoints = resolv.resolve(params.hostname, std::to_string(params.port), ec);
        if (!ec)
            asio::connect(sock, endpoints, ec);
        if (ec)
        {
            fail(ec, err);
            return;
        }

        // Startup handshake
        protocol::startup_params startup{
            .username = params.username,
            .password = params.password,
            .database = params.database,
            .application_name = params.application_name ? std::optional<std::string_view>(*params.application_name)
                                                        : std::nullopt,
        };
        protocol::startup_fsm fsm(startup);
        protocol::any_backend_message msg;
        while (true)
        {
            auto res = fsm.resume(st, diag, msg);
            if (res.type == protocol::startup_fsm::result_type::done)
            {
                ec = res.ec;
                break;
            }
            else if (res.type == protocol::startup_fsm::result_type::write)
            {
                ec = write_pending();
            }
            else
            {
                BOOST_ASSERT(res.type == protocol::startup_fsm::result_type::read);
                ec = read_message(msg);
            }
            if (ec)
                break;
        }
        if (ec)
        {
            fail(ec, err);
            return;
        }

        med.set_copy_buffer_size(params.copy_buffer_size);
        transition_to(protocol::ready_state{});
        BOOST_LOG_TRIVIAL(info) << "Connected to " << params.hostname << ":" << params.port << ", backend process "
                                << st.backend_process_id;

        if (params.notification_thread)
        {
            listener.start(
                sock.native_handle(),
                [this](bool read_socket, bool& stalled) { return pump(read_socket, stalled); },
                ec
            );
            if (ec)
                BOOST_LOG_TRIVIAL(warning) << "Could not start the notification thread: " << ec.message();
        }
    }

    void execute(std::string_view sql, command_result& result, error_code& err, diagnostics& diag)
    {
        result = command_result{};
        if (!check(protocol::operation::execute, err, diag))
            return;
        med.clear_notices();
        response_fsm = protocol::command_response_fsm();

        // Compose the query
        st.write_buffer.clear();
        if (auto ec = protocol::serialize(protocol::query{sql}, st.write_buffer))
        {
            st.write_buffer.clear();
            err = ec;
            return;
        }

        transition_to(protocol::executing_state{});
        BOOST_LOG_TRIVIAL(debug) << "Executing: " << sql;
        if (auto ec = write_pending())
        {
            fail(ec, err);
            return;
        }
        run_response(&result, err, diag);
    }

    void send_copy_data(std::span<const unsigned char> data, error_code& err, diagnostics& diag)
    {
        if (!check(protocol::operation::copy_data, err, diag))
            return;
        st.write_buffer.clear();
        if (auto ec = protocol::serialize(protocol::copy_data{data}, st.write_buffer))
        {
            st.write_buffer.clear();
            err = ec;
            return;
        }
        if (auto ec = write_pending())
            fail(ec, err);
    }

    // Sends CopyDone or CopyFail, and waits for the command to complete
    template <class Message>
    void finish_copy_in(protocol::operation op, const Message& msg, error_code& err, diagnostics& diag)
    {
        if (!check(op, err, diag))
            return;
        st.write_buffer.clear();
        if (auto ec = protocol::serialize(msg, st.write_buffer))
        {
            st.write_buffer.clear();
            err = ec;
            return;
        }
        if (auto ec = write_pending())
        {
            fail(ec, err);
            return;
        }
        run_response(nullptr, err, diag);
    }

    std::optional<std::span<const unsigned char>> read_copy_data(error_code& err, diagnostics& diag)
    {
        if (!check(protocol::operation::read_copy_data, err, diag))
            return std::nullopt;

        while (true)
        {
            protocol::any_backend_message msg;
            if (auto ec = read_message(msg))
            {
                fail(ec, err);
                return std::nullopt;
            }

            if (const auto* data = boost::variant2::get_if<protocol::copy_data>(&msg))
                return data->data;

            auto res = response_fsm.resume(msg);
            if (res.type == protocol::command_response_fsm::result_type::done)
            {
                complete(res.ec, nullptr, err, diag);
                return std::nullopt;
            }
            else if (res.type != protocol::command_response_fsm::result_type::read)
            {
                // A new COPY can't start before the current one is finished
                fail(client_errc::unexpected_message, err);
                return std::nullopt;
            }
        }
    }

    void close(error_code& err)
    {
        listener.stop();
        if (boost::variant2::holds_alternative<protocol::closed_state>(state))
            return;

        // Say goodbye if the server is still listening to us
        if (sock.is_open() && !boost::variant2::holds_alternative<protocol::broken_state>(state) &&
            !boost::variant2::holds_alternative<protocol::connecting_state>(state))
        {
            st.write_buffer.clear();
            err = protocol::serialize(protocol::terminate{}, st.write_buffer);
            if (!err)
                err = write_pending();
        }

        error_code ec;
        sock.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        sock.close(ec);
        if (ec && !err)
            err = ec;

        st.read_buffer.clear();
        st.write_buffer.clear();
        st.pending_consume = 0u;
        st.server_parameters.clear();
        med.clear_copy_stream();
        transition_to(protocol::closed_state{});
        BOOST_LOG_TRIVIAL(info) << "Connection closed";
    }
};

//
// connector
//

connector::connector(asio::any_io_executor ex) : impl_(std::make_unique<detail::connector_impl>(std::move(ex))) {}

connector::connector(connector&&) noexcept = default;

connector& connector::operator=(connector&& rhs) noexcept
{
    if (this != &rhs)
    {
        if (impl_)
        {
            error_code ec;
            impl_->close(ec);
        }
        impl_ = std::move(rhs.impl_);
    }
    return *this;
}

connector::~connector()
{
    if (impl_)
    {
        error_code ec;
        impl_->close(ec);
        if (ec)
            BOOST_LOG_TRIVIAL(debug) << "Error closing the connection: " << ec.message();
    }
}

asio::any_io_executor connector::get_executor() { return impl_->sock.get_executor(); }

void connector::connect(const connect_params& params, error_code& err, diagnostics& diag)
{
    err.clear();
    diag.clear();
    notification_block blk(impl_->listener);
    impl_->connect(params, err, diag);
}

void connector::connect(const connect_params& params)
{
    error_code err;
    diagnostics diag;
    connect(params, err, diag);
    detail::throw_on_error(err, diag, BOOST_CURRENT_LOCATION);
}

void connector::execute(std::string_view sql, command_result& result, error_code& err, diagnostics& diag)
{
    err.clear();
    diag.clear();
    notification_block blk(impl_->listener);
    impl_->execute(sql, result, err, diag);
}

void connector::execute(std::string_view sql, command_result& result)
{
    error_code err;
    diagnostics diag;
    execute(sql, result, err, diag);
    detail::throw_on_error(err, diag, BOOST_CURRENT_LOCATION);
}

void connector::send_copy_data(std::span<const unsigned char> data, error_code& err, diagnostics& diag)
{
    err.clear();
    diag.clear();
    notification_block blk(impl_->listener);
    impl_->send_copy_data(data, err, diag);
}

void connector::send_copy_data(std::span<const unsigned char> data)
{
    error_code err;
    diagnostics diag;
    send_copy_data(data, err, diag);
    detail::throw_on_error(err, diag, BOOST_CURRENT_LOCATION);
}

void connector::send_copy_done(error_code& err, diagnostics& diag)
{
    err.clear();
    diag.clear();
    notification_block blk(impl_->listener);
    impl_->finish_copy_in(protocol::operation::copy_done, protocol::copy_done{}, err, diag);
}

void connector::send_copy_done()
{
    error_code err;
    diagnostics diag;
    send_copy_done(err, diag);
    detail::throw_on_error(err, diag, BOOST_CURRENT_LOCATION);
}

void connector::send_copy_fail(std::string_view message, error_code& err, diagnostics& diag)
{
    err.clear();
    diag.clear();
    notification_block blk(impl_->listener);
    impl_->finish_copy_in(protocol::operation::copy_fail, protocol::copy_fail{message}, err, diag);
}

void connector::send_copy_fail(std::string_view message)
{
    error_code err;
    diagnostics diag;
    send_copy_fail(message, err, diag);
    detail::throw_on_error(err, diag, BOOST_CURRENT_LOCATION);
}

std::optional<std::span<const unsigned char>> connector::read_copy_data(error_code& err, diagnostics& diag)
{
    err.clear();
    diag.clear();
    notification_block blk(impl_->listener);
    return impl_->read_copy_data(err, diag);
}

std::optional<std::span<const unsigned char>> connector::read_copy_data()
{
    error_code err;
    diagnostics diag;
    auto res = read_copy_data(err, diag);
    detail::throw_on_error(err, diag, BOOST_CURRENT_LOCATION);
    return res;
}

void connector::close(error_code& err)
{
    err.clear();
    impl_->close(err);
}

void connector::close()
{
    error_code err;
    close(err);
    detail::throw_on_error(err, diagnostics(), BOOST_CURRENT_LOCATION);
}

const protocol::protocol_state& connector::state() const noexcept { return impl_->state; }

std::string_view connector::state_name() const noexcept { return protocol::state_name(impl_->state); }

bool connector::is_ready() const noexcept
{
    return boost::variant2::holds_alternative<protocol::ready_state>(impl_->state);
}

const copy_format* connector::get_copy_format() const noexcept { return protocol::get_copy_format(impl_->state); }

std::int32_t connector::backend_process_id() const noexcept { return impl_->st.backend_process_id; }

std::int32_t connector::backend_secret_key() const noexcept { return impl_->st.backend_secret_key; }

std::optional<std::string> connector::server_parameter(std::string_view name) const
{
    // The notification thread may update these, so copy while it's parked
    notification_block blk(impl_->listener);
    auto it = impl_->st.server_parameters.find(name);
    if (it == impl_->st.server_parameters.end())
        return std::nullopt;
    return it->second;
}

mediator& connector::get_mediator() noexcept { return impl_->med; }

const mediator& connector::get_mediator() const noexcept { return impl_->med; }

notification_block connector::block_notification_thread() { return notification_block(impl_->listener); }

bool connector::notification_thread_blocked() const noexcept { return impl_->listener.blocked(); }

void connector::set_notification_handler(notification_handler handler)
{
    impl_->listener.set_handler(std::move(handler));
}
