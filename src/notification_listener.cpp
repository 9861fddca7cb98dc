//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/log/trivial.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>

#include <cerrno>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "notification_listener.hpp"
#include "pgwire/notification.hpp"
#include "pgwire/notification_block.hpp"

using pgwire::detail::notification_listener;
using boost::system::error_code;

notification_listener::~notification_listener() { stop(); }

void notification_listener::start(int socket_fd, pump_function pump, error_code& ec)
{
    ec.clear();

    std::unique_lock<std::mutex> lock(mtx_);
    if (running_)
        return;

    // A previous thread that stopped on its own
    if (thread_.joinable())
    {
        thread_.join();
        close_pipe();
    }

    // Self-pipe used to interrupt poll()
    if (::pipe2(wake_fds_, O_NONBLOCK | O_CLOEXEC) != 0)
    {
        ec = error_code(errno, boost::system::system_category());
        return;
    }

    socket_fd_ = socket_fd;
    pump_ = std::move(pump);
    stop_ = false;
    stalled_ = false;
    parked_ = false;
    running_ = true;
    thread_ = std::thread([this] { run(); });
}

void notification_listener::stop() noexcept
{
    {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!thread_.joinable())
            return;
        stop_ = true;
        cv_.notify_all();
    }
    wake();
    thread_.join();

    std::unique_lock<std::mutex> lock(mtx_);
    close_pipe();
    pump_ = nullptr;
    socket_fd_ = -1;
}

void notification_listener::acquire()
{
    std::unique_lock<std::mutex> lock(mtx_);
    ++block_requests_;
    if (!running_)
        return;

    // Interrupt poll() and wait until the thread is out of the pump function
    wake();
    cv_.wait(lock, [this] { return parked_ || !running_; });
}

void notification_listener::release() noexcept
{
    std::unique_lock<std::mutex> lock(mtx_);
    if (--block_requests_ > 0)
        return;

    // The synchronous path may have consumed whatever stalled the thread
    stalled_ = false;

    if (running_)
        cv_.notify_all();
    else
        deliver_pending(lock);
}

void notification_listener::set_idle(bool value)
{
    std::unique_lock<std::mutex> lock(mtx_);
    idle_ = value;
    cv_.notify_all();
}

void notification_listener::set_handler(handler_type handler)
{
    std::unique_lock<std::mutex> lock(mtx_);
    handler_ = std::move(handler);
}

void notification_listener::defer(notification n)
{
    std::unique_lock<std::mutex> lock(mtx_);
    pending_.push_back(std::move(n));
}

void notification_listener::deliver(const notification& n)
{
    handler_type handler;
    {
        std::unique_lock<std::mutex> lock(mtx_);
        handler = handler_;
    }
    invoke(handler, n);
}

void notification_listener::invoke(const handler_type& handler, const notification& n) noexcept
{
    BOOST_LOG_TRIVIAL(debug) << "Notification received on channel " << n.channel << " from backend "
                             << n.process_id;
    if (!handler)
        return;
    try
    {
        handler(n);
    }
    catch (const std::exception& err)
    {
        BOOST_LOG_TRIVIAL(warning) << "Notification handler threw an exception: " << err.what();
    }
}

// Called with the lock held. Releases it while running handlers
void notification_listener::deliver_pending(std::unique_lock<std::mutex>& lock)
{
    while (!pending_.empty())
    {
        auto batch = std::move(pending_);
        pending_.clear();
        auto handler = handler_;
        lock.unlock();
        for (const auto& n : batch)
            invoke(handler, n);
        lock.lock();
    }
}

void notification_listener::run()
{
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stop_)
    {
        // Notifications read by the synchronous path go first, in arrival order
        if (block_requests_ == 0 && !pending_.empty())
        {
            deliver_pending(lock);
            continue;
        }

        // Park until we're allowed to use the socket
        if (block_requests_ > 0 || !idle_ || stalled_)
        {
            parked_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this] {
                return stop_ || (block_requests_ == 0 && ((idle_ && !stalled_) || !pending_.empty()));
            });
            parked_ = false;
            continue;
        }

        // Process anything that the synchronous path left in the buffer, then wait for more
        lock.unlock();
        bool stalled = false;
        auto ec = pump_(false, stalled);
        bool readable = !ec && !stalled && wait_readable();
        lock.lock();
        drain_wake_pipe();

        if (!ec && readable && !stop_ && block_requests_ == 0 && idle_)
        {
            lock.unlock();
            ec = pump_(true, stalled);
            lock.lock();
        }

        if (ec)
        {
            BOOST_LOG_TRIVIAL(warning) << "Notification thread stopped listening: " << ec.message();
            break;
        }
        if (stalled)
            stalled_ = true;
    }

    parked_ = false;
    running_ = false;
    cv_.notify_all();
}

bool notification_listener::wait_readable() noexcept
{
    pollfd fds[2]{};
    fds[0].fd = socket_fd_;
    fds[0].events = POLLIN;
    fds[1].fd = wake_fds_[0];
    fds[1].events = POLLIN;

    int res = ::poll(fds, 2, -1);
    if (res <= 0)
        return false;  // EINTR. The caller re-evaluates its state

    return (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

void notification_listener::wake() noexcept
{
    if (wake_fds_[1] == -1)
        return;
    const unsigned char byte = 0;
    // A full pipe already guarantees a wake-up
    if (::write(wake_fds_[1], &byte, 1) < 0 && errno != EAGAIN)
        BOOST_LOG_TRIVIAL(warning) << "Could not wake the notification thread, errno " << errno;
}

void notification_listener::drain_wake_pipe() noexcept
{
    unsigned char buff[64];
    while (::read(wake_fds_[0], buff, sizeof(buff)) > 0)
    {
    }
}

void notification_listener::close_pipe() noexcept
{
    for (int& fd : wake_fds_)
    {
        if (fd != -1)
        {
            ::close(fd);
            fd = -1;
        }
    }
}

//
// notification_block
//

pgwire::notification_block::notification_block(detail::notification_listener& listener) : listener_(&listener)
{
    listener.acquire();
}

void pgwire::notification_block::release() noexcept
{
    if (listener_)
    {
        listener_->release();
        listener_ = nullptr;
    }
}
