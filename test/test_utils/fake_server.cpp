//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/write.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/system/system_error.hpp>

#include <cstdint>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "fake_server.hpp"

using namespace pgwire::test;
namespace asio = boost::asio;

namespace {

// Composes a backend message
class message_writer
{
    std::string buff_;

public:
    explicit message_writer(char type)
    {
        buff_.push_back(type);
        buff_.append(4u, '\0');
    }

    message_writer& int32(std::int32_t value)
    {
        auto be = boost::endian::native_to_big(value);
        buff_.append(reinterpret_cast<const char*>(&be), 4u);
        return *this;
    }

    message_writer& int16(std::int16_t value)
    {
        auto be = boost::endian::native_to_big(value);
        buff_.append(reinterpret_cast<const char*>(&be), 2u);
        return *this;
    }

    message_writer& byte(char value)
    {
        buff_.push_back(value);
        return *this;
    }

    message_writer& string(std::string_view value)
    {
        buff_.append(value);
        buff_.push_back('\0');
        return *this;
    }

    message_writer& bytes(std::string_view value)
    {
        buff_.append(value);
        return *this;
    }

    std::string finish()
    {
        auto len = boost::endian::native_to_big(static_cast<std::int32_t>(buff_.size() - 1u));
        std::memcpy(buff_.data() + 1, &len, 4u);
        return std::move(buff_);
    }
};

std::int32_t read_length(const unsigned char* data)
{
    std::int32_t res;
    std::memcpy(&res, data, 4u);
    return boost::endian::big_to_native(res);
}

std::string error_fields(char severity_code, std::string_view severity, std::string_view sqlstate, std::string_view message)
{
    message_writer writer(severity_code);
    writer.byte('S').string(severity);
    writer.byte('V').string(severity);
    writer.byte('C').string(sqlstate);
    writer.byte('M').string(message);
    writer.byte('\0');
    return writer.finish();
}

}  // namespace

//
// fake_session
//

void fake_session::record(const frontend_message& msg)
{
    std::lock_guard<std::mutex> lock(mtx_);
    received_.push_back(msg);
}

frontend_message fake_session::read_startup()
{
    unsigned char len_buff[4];
    asio::read(sock_, asio::buffer(len_buff));
    auto len = read_length(len_buff);
    if (len < 4)
        throw std::runtime_error("Invalid startup message length");
    frontend_message res;
    res.body.resize(static_cast<std::size_t>(len) - 4u);
    asio::read(sock_, asio::buffer(res.body));
    record(res);
    return res;
}

frontend_message fake_session::read_message()
{
    unsigned char header[5];
    asio::read(sock_, asio::buffer(header));
    auto len = read_length(header + 1);
    if (len < 4)
        throw std::runtime_error("Invalid message length");
    frontend_message res;
    res.type = static_cast<char>(header[0]);
    res.body.resize(static_cast<std::size_t>(len) - 4u);
    asio::read(sock_, asio::buffer(res.body));
    record(res);
    return res;
}

std::string fake_session::expect_query()
{
    auto msg = read_message();
    if (msg.type != 'Q')
        throw std::runtime_error(std::string("Expected a Query message, got ") + msg.type);

    // Strip the NULL terminator
    if (!msg.body.empty())
        msg.body.pop_back();
    return msg.body;
}

copy_in_result fake_session::read_copy_in()
{
    copy_in_result res;
    while (true)
    {
        auto msg = read_message();
        switch (msg.type)
        {
            case 'd':
                res.data += msg.body;
                ++res.messages;
                break;
            case 'c': res.done = true; return res;
            case 'f':
                res.fail_message = msg.body;
                if (!res.fail_message.empty())
                    res.fail_message.pop_back();
                return res;
            default: throw std::runtime_error(std::string("Unexpected message during COPY IN: ") + msg.type);
        }
    }
}

void fake_session::expect_terminate()
{
    while (true)
    {
        try
        {
            auto msg = read_message();
            if (msg.type == 'X')
                return;
        }
        catch (const boost::system::system_error& err)
        {
            if (err.code() == asio::error::eof)
                return;
            throw;
        }
    }
}

void fake_session::send_raw(std::string_view bytes) { asio::write(sock_, asio::buffer(bytes)); }

void fake_session::send_auth_ok() { send_raw(message_writer('R').int32(0).finish()); }

void fake_session::send_auth_cleartext_password() { send_raw(message_writer('R').int32(3).finish()); }

void fake_session::send_parameter_status(std::string_view name, std::string_view value)
{
    send_raw(message_writer('S').string(name).string(value).finish());
}

void fake_session::send_backend_key_data(std::int32_t process_id, std::int32_t secret_key)
{
    send_raw(message_writer('K').int32(process_id).int32(secret_key).finish());
}

void fake_session::send_ready_for_query(char status) { send_raw(message_writer('Z').byte(status).finish()); }

void fake_session::send_command_complete(std::string_view tag)
{
    send_raw(message_writer('C').string(tag).finish());
}

void fake_session::send_row_description(std::string_view column_name)
{
    message_writer writer('T');
    writer.int16(1).string(column_name).int32(0).int16(0).int32(25).int16(-1).int32(-1).int16(0);
    send_raw(writer.finish());
}

void fake_session::send_data_row(std::string_view value)
{
    message_writer writer('D');
    writer.int16(1).int32(static_cast<std::int32_t>(value.size())).bytes(value);
    send_raw(writer.finish());
}

void fake_session::send_empty_query_response() { send_raw(message_writer('I').finish()); }

void fake_session::send_error(std::string_view sqlstate, std::string_view message)
{
    send_raw(error_fields('E', "ERROR", sqlstate, message));
}

void fake_session::send_notice(std::string_view message) { send_raw(error_fields('N', "NOTICE", "00000", message)); }

void fake_session::send_notification(std::int32_t process_id, std::string_view channel, std::string_view payload)
{
    send_raw(message_writer('A').int32(process_id).string(channel).string(payload).finish());
}

void fake_session::send_copy_in_response(bool binary, const std::vector<std::int16_t>& field_formats)
{
    message_writer writer('G');
    writer.byte(binary ? 1 : 0).int16(static_cast<std::int16_t>(field_formats.size()));
    for (auto fmt : field_formats)
        writer.int16(fmt);
    send_raw(writer.finish());
}

void fake_session::send_copy_out_response(bool binary, const std::vector<std::int16_t>& field_formats)
{
    message_writer writer('H');
    writer.byte(binary ? 1 : 0).int16(static_cast<std::int16_t>(field_formats.size()));
    for (auto fmt : field_formats)
        writer.int16(fmt);
    send_raw(writer.finish());
}

void fake_session::send_copy_data(std::string_view data) { send_raw(message_writer('d').bytes(data).finish()); }

void fake_session::send_copy_done() { send_raw(message_writer('c').finish()); }

void fake_session::handshake()
{
    read_startup();
    send_auth_ok();
    send_parameter_status("server_version", "16.0");
    send_parameter_status("client_encoding", "UTF8");
    send_backend_key_data(fake_server::backend_process_id, fake_server::backend_secret_key);
    send_ready_for_query();
}

void fake_session::reply_copy_fail(std::string_view message)
{
    std::string msg{"COPY from stdin failed: "};
    msg += message;
    send_error("57014", msg);
    send_ready_for_query();
}

//
// fake_server
//

fake_server::fake_server() : acceptor_(ctx_)
{
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), 0);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
}

fake_server::~fake_server()
{
    if (thread_.joinable())
        thread_.join();
}

unsigned short fake_server::port() const { return acceptor_.local_endpoint().port(); }

pgwire::connect_params fake_server::params() const
{
    connect_params res;
    res.hostname = "127.0.0.1";
    res.port = port();
    res.username = "postgres";
    res.database = "postgres";
    return res;
}

void fake_server::run(std::function<void(fake_session&)> script)
{
    thread_ = std::thread([this, script = std::move(script)] {
        try
        {
            asio::ip::tcp::socket sock(ctx_);
            acceptor_.accept(sock);
            fake_session sess(std::move(sock), received_, mtx_);
            script(sess);
        }
        catch (const std::exception& err)
        {
            error_ = err.what();
        }
    });
}

void fake_server::join()
{
    if (thread_.joinable())
        thread_.join();
}

std::vector<frontend_message> fake_server::received()
{
    std::lock_guard<std::mutex> lock(mtx_);
    return received_;
}
