//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_SRC_NOTIFICATION_LISTENER_HPP
#define PGWIRE_SRC_NOTIFICATION_LISTENER_HPP

#include <boost/system/error_code.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "pgwire/notification.hpp"

namespace pgwire::detail {

// Background thread that reads asynchronous messages from the connection's socket
// while no synchronous exchange is in progress.
//
// The socket is owned by the connector. The thread only calls the pump function
// when the connection is idle and no block is held. Synchronous exchanges call acquire(),
// which doesn't return until the thread is parked outside the pump function.
class notification_listener
{
public:
    // Processes asynchronous messages. If read_socket is true, performs a single read first.
    // Sets stalled if a message for the synchronous path is next in the read buffer
    using pump_function = std::function<boost::system::error_code(bool read_socket, bool& stalled)>;
    using handler_type = std::function<void(const notification&)>;

    notification_listener() = default;
    notification_listener(const notification_listener&) = delete;
    notification_listener& operator=(const notification_listener&) = delete;
    ~notification_listener();

    // Launches the thread, which waits for socket_fd to become readable
    void start(int socket_fd, pump_function pump, boost::system::error_code& ec);

    // Stops and joins the thread. Must not be called from a handler
    void stop() noexcept;

    void acquire();
    void release() noexcept;
    bool blocked() const noexcept { return block_requests_.load() > 0; }

    // Only an idle connection may be read by the thread
    void set_idle(bool value);

    void set_handler(handler_type handler);

    // A notification read by the synchronous path. Delivered once the last block is released
    void defer(notification n);

    // A notification read by the thread itself. Delivered immediately
    void deliver(const notification& n);

private:
    void run();
    bool wait_readable() noexcept;
    void wake() noexcept;
    void drain_wake_pipe() noexcept;
    void deliver_pending(std::unique_lock<std::mutex>& lock);
    void invoke(const handler_type& handler, const notification& n) noexcept;
    void close_pipe() noexcept;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::thread thread_;
    pump_function pump_;
    handler_type handler_;
    std::vector<notification> pending_;
    std::atomic<int> block_requests_{0};
    bool parked_{false};
    bool idle_{false};
    bool stalled_{false};
    bool stop_{false};
    bool running_{false};
    int socket_fd_{-1};
    int wake_fds_[2]{-1, -1};
};

}  // namespace pgwire::detail

#endif
