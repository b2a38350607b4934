// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <ostream>

namespace evsync::detail {

/// Enables automagical string conversion for `EVSYNC_ARG`.
template <class T>
struct single_arg_wrapper {
  const char* name;
  const T& value;
  single_arg_wrapper(const char* x, const T& y) : name(x), value(y) {
    // nop
  }
};

template <class T>
std::ostream& operator<<(std::ostream& out, const single_arg_wrapper<T>& x) {
  return out << x.name << " = " << x.value;
}

/// Used to implement `EVSYNC_ARG`.
template <class T>
single_arg_wrapper<T> make_arg_wrapper(const char* name, const T& value) {
  return {name, value};
}

} // namespace evsync::detail
