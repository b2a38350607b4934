// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <memory>
#include <utility>

namespace evsync {

/// Describes a simple callback, usually implemented via lambda expression.
/// Callbacks are used as "type-safe function objects" wherever an interface
/// requires dynamic dispatching.
template <class Signature>
class callback;

template <class Result, class... Ts>
class callback<Result(Ts...)> {
public:
  virtual ~callback() {
    // nop
  }

  virtual Result operator()(Ts...) = 0;
};

/// Smart pointer type for heap-allocated callbacks with unique ownership.
template <class Signature>
using unique_callback_ptr = std::unique_ptr<callback<Signature>>;

/// Smart pointer type for heap-allocated callbacks with shared ownership.
template <class Signature>
using shared_callback_ptr = std::shared_ptr<callback<Signature>>;

/// Utility class for wrapping a function object of type `F`.
template <class F, class Signature>
class callback_impl;

template <class F, class Result, class... Ts>
class callback_impl<F, Result(Ts...)> final : public callback<Result(Ts...)> {
public:
  callback_impl(F&& f) : f_(std::move(f)) {
    // nop
  }

  callback_impl(callback_impl&&) = default;

  callback_impl& operator=(callback_impl&&) = default;

  Result operator()(Ts... xs) override {
    return f_(std::forward<Ts>(xs)...);
  }

private:
  F f_;
};

/// Creates a heap-allocated, type-erased @ref callback with signature
/// `Signature` from the function object `fun` with unique ownership.
/// @relates callback
template <class Signature, class F>
unique_callback_ptr<Signature> make_type_erased_callback(F fun) {
  using impl_t = callback_impl<F, Signature>;
  return unique_callback_ptr<Signature>{new impl_t{std::move(fun)}};
}

/// Creates a heap-allocated, type-erased @ref callback with signature
/// `Signature` from the function object `fun` with shared ownership.
/// @relates callback
template <class Signature, class F>
shared_callback_ptr<Signature> make_shared_type_erased_callback(F fun) {
  using impl_t = callback_impl<F, Signature>;
  return std::make_shared<impl_t>(std::move(fun));
}

} // namespace evsync
