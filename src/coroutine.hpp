//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_SRC_COROUTINE_HPP
#define PGWIRE_SRC_COROUTINE_HPP

// Stackless coroutine helpers for the sans-io state machines.
// Usage: switch (resume_point_) { PGWIRE_CORO_INITIAL ... PGWIRE_YIELD(resume_point_, 1, value) ... }
// Each yield point must have a unique, non-zero label.

#define PGWIRE_CORO_INITIAL case 0:

#define PGWIRE_YIELD(resume_point_var, resume_point_id, ...) \
    {                                                        \
        resume_point_var = resume_point_id;                  \
        return __VA_ARGS__;                                  \
    }                                                        \
    case resume_point_id:

#endif
