//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_NOTIFICATION_BLOCK_HPP
#define PGWIRE_NOTIFICATION_BLOCK_HPP

namespace pgwire {

namespace detail {
class notification_listener;
}  // namespace detail

// Scoped exclusive use of the connection's socket. While at least one block is held,
// the notification thread is parked and doesn't touch the socket.
// Obtained through connector::block_notification_thread(). Move-only.
class notification_block
{
    detail::notification_listener* listener_{};

public:
    notification_block() = default;

    // Does not return until the notification thread is parked
    explicit notification_block(detail::notification_listener& listener);

    notification_block(const notification_block&) = delete;
    notification_block& operator=(const notification_block&) = delete;

    notification_block(notification_block&& rhs) noexcept : listener_(rhs.listener_) { rhs.listener_ = nullptr; }
    notification_block& operator=(notification_block&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release();
            listener_ = rhs.listener_;
            rhs.listener_ = nullptr;
        }
        return *this;
    }

    ~notification_block() { release(); }

    bool owns_block() const noexcept { return listener_ != nullptr; }

    // Releases the block early. Notifications queued meanwhile are delivered
    // once the last block is released
    void release() noexcept;
};

}  // namespace pgwire

#endif
