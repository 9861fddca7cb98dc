//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>

#include "pgwire/connector.hpp"
#include "pgwire/copy_streams.hpp"

using namespace pgwire::detail;

copy_in_buffer::copy_in_buffer(connector& conn, std::size_t buffer_size)
    : conn_(conn), buff_((std::max)(buffer_size, std::size_t(1u)))
{
    setp(buff_.data(), buff_.data() + buff_.size());
}

bool copy_in_buffer::send_pending()
{
    // Once a send failed, the copy can't proceed
    if (err_)
        return false;

    auto size = static_cast<std::size_t>(pptr() - pbase());
    if (size == 0u)
        return true;

    conn_.send_copy_data({reinterpret_cast<const unsigned char*>(pbase()), size}, err_, diag_);
    if (err_)
        return false;
    setp(buff_.data(), buff_.data() + buff_.size());
    return true;
}

copy_in_buffer::int_type copy_in_buffer::overflow(int_type ch)
{
    if (!send_pending())
        return traits_type::eof();
    if (!traits_type::eq_int_type(ch, traits_type::eof()))
    {
        *pptr() = traits_type::to_char_type(ch);
        pbump(1);
    }
    return traits_type::not_eof(ch);
}

int copy_in_buffer::sync() { return send_pending() ? 0 : -1; }

copy_out_buffer::int_type copy_out_buffer::underflow()
{
    if (gptr() < egptr())
        return traits_type::to_int_type(*gptr());
    if (err_)
        return traits_type::eof();

    // Empty CopyData messages are legal
    while (true)
    {
        auto data = conn_.read_copy_data(err_, diag_);
        if (err_ || !data)
            return traits_type::eof();
        if (data->empty())
            continue;
        buff_.assign(data->begin(), data->end());
        setg(buff_.data(), buff_.data(), buff_.data() + buff_.size());
        return traits_type::to_int_type(*gptr());
    }
}
