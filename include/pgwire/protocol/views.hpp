//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_VIEWS_HPP
#define PGWIRE_PROTOCOL_VIEWS_HPP

// Views that deserialize fields while iterating, avoiding copies.
// Not to be instantiated by the user with arbitrary types.
// Implemented in terms of internal traits that the library specializes for the types that might appear in
// messages. Avoids code duplication

#include <boost/assert.hpp>

#include <cstddef>
#include <iterator>
#include <span>

namespace pgwire {
namespace protocol {

namespace detail {

template <class T>
struct forward_traits;

template <class T>
struct random_access_traits;

void at_range_check(std::size_t i, std::size_t collection_size);

}  // namespace detail

// View over a serialized collection of items of variable size
template <class T>
class forward_parsing_view
{
    std::size_t size_{};                   // number of items
    std::span<const unsigned char> data_;  // serialized items

public:
    class iterator
    {
        const unsigned char* data_{};  // pointer into the serialized collection

        iterator(const unsigned char* data) noexcept : data_(data) {}
        T dereference() const { return detail::forward_traits<T>::dereference(data_); }
        void advance() { data_ = detail::forward_traits<T>::advance(data_); }

        friend class forward_parsing_view;

    public:
        using value_type = T;
        using reference = T;
        using pointer = T;
        using difference_type = std::ptrdiff_t;
        using iterator_category = std::forward_iterator_tag;

        iterator() = default;

        iterator& operator++() noexcept
        {
            advance();
            return *this;
        }
        iterator operator++(int) noexcept
        {
            auto res = *this;
            advance();
            return res;
        }
        reference operator*() const noexcept { return dereference(); }
        bool operator==(iterator rhs) const noexcept { return data_ == rhs.data_; }
        bool operator!=(iterator rhs) const noexcept { return !(*this == rhs); }
    };

    using const_iterator = iterator;
    using value_type = T;
    using reference = value_type;
    using const_reference = value_type;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;

    forward_parsing_view() = default;

    // data must point to the serialized items, and must be valid. parse() performs this validation.
    forward_parsing_view(std::size_t size, std::span<const unsigned char> data) noexcept
        : size_(size), data_(data)
    {
    }

    // The number of items
    std::size_t size() const { return size_; }

    // Is the range empty?
    bool empty() const { return size_ == 0u; }

    // Range functions
    iterator begin() const { return iterator(data_.data()); }
    iterator end() const { return iterator(data_.data() + data_.size()); }
};

// View over a serialized collection of fixed-size items
template <class T>
class random_access_parsing_view
{
    const unsigned char* data_{};
    std::size_t size_{};

    static constexpr std::size_t stride = sizeof(T);

public:
    using value_type = T;
    using reference = value_type;
    using const_reference = value_type;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;

    random_access_parsing_view() = default;

    // data must point to size items of sizeof(T) bytes each. parse() performs this validation.
    random_access_parsing_view(const unsigned char* data, std::size_t size) noexcept
        : data_(data), size_(size)
    {
    }

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0u; }

    T operator[](std::size_t i) const noexcept
    {
        BOOST_ASSERT(i < size_);
        return detail::random_access_traits<T>::dereference(data_ + i * stride);
    }

    T at(std::size_t i) const
    {
        detail::at_range_check(i, size_);
        return (*this)[i];
    }
};

}  // namespace protocol
}  // namespace pgwire

#endif
