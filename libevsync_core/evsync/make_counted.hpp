// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/intrusive_ptr.hpp"

#include <utility>

namespace evsync {

/// Constructs an object of type `T` in an `intrusive_ptr`.
/// @relates ref_counted
template <class T, class... Ts>
intrusive_ptr<T> make_counted(Ts&&... xs) {
  return intrusive_ptr<T>(new T(std::forward<Ts>(xs)...), false);
}

} // namespace evsync
