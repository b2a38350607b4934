// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/detail/core_export.hpp"

namespace evsync {

// -- templates ----------------------------------------------------------------

template <class>
class callback;

template <class>
class intrusive_ptr;

// -- classes ------------------------------------------------------------------

class action;
class count_down_latch;
class disposable;
class event_loop;
class execution_context;
class logger;
class ref_counted;
class scheduler;
class semaphore;

// -- structs ------------------------------------------------------------------

struct log_event;

// -- intrusive pointer aliases ------------------------------------------------

using event_loop_ptr = intrusive_ptr<event_loop>;
using execution_context_ptr = intrusive_ptr<execution_context>;

namespace detail {

class atomic_ref_counted;
class waiter;

using waiter_ptr = intrusive_ptr<waiter>;

} // namespace detail

} // namespace evsync
