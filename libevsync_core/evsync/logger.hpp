// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/config.hpp"
#include "evsync/defaults.hpp"
#include "evsync/detail/arg_wrapper.hpp"
#include "evsync/detail/core_export.hpp"
#include "evsync/fwd.hpp"
#include "evsync/intrusive_ptr.hpp"
#include "evsync/log/level.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace evsync {

/// Captures a single event for a logger.
struct log_event {
  /// The severity level of the event.
  unsigned level;

  /// The name of the component that generated the event.
  std::string_view component;

  /// The name of the file in which the event was generated.
  const char* file_name;

  /// The line number at which the event was generated.
  int line_number;

  /// The user-defined message of the event.
  std::string message;

  /// The wall-clock time when the event was generated.
  std::chrono::system_clock::time_point timestamp;

  /// The ID of the thread that generated the event.
  std::thread::id thread_id;
};

/// Centrally logs events from all components of evsync. Per default, no logger
/// is installed and all log statements are no-ops. To enable logging, install
/// a logger via `logger::current_logger(ptr)` and configure the compile-time
/// ceiling `EVSYNC_LOG_LEVEL`.
class EVSYNC_CORE_EXPORT logger {
public:
  // -- member types -----------------------------------------------------------

  /// Combines various logging-related flags and parameters for the default
  /// logger.
  struct config {
    /// Maximum severity level for accepted events.
    unsigned verbosity = defaults::logger::verbosity;

    /// Configures whether the logger writes to `std::clog`.
    bool console = defaults::logger::console;

    /// Path to an output file. An empty path disables file output.
    std::string file_name = std::string{defaults::logger::file_name};

    /// Events from these components are dropped.
    std::vector<std::string> excluded_components;
  };

  /// Helper class to print exit trace messages on scope exit.
  class EVSYNC_CORE_EXPORT trace_exit_guard {
  public:
    trace_exit_guard() = default;

    trace_exit_guard(logger* instance, std::string_view component,
                     const char* file_name, int line_number)
      : instance_(instance),
        component_(component),
        file_name_(file_name),
        line_number_(line_number) {
      // nop
    }

    trace_exit_guard(trace_exit_guard&& other) noexcept;

    trace_exit_guard& operator=(trace_exit_guard&& other) noexcept;

    ~trace_exit_guard();

  private:
    logger* instance_ = nullptr;
    std::string_view component_;
    const char* file_name_ = nullptr;
    int line_number_ = 0;
  };

  /// Utility class for building user-defined log messages with `EVSYNC_ARG`.
  class line_builder {
  public:
    line_builder() = default;

    template <class T>
    line_builder&& operator<<(const T& x) && {
      if (!str_.empty())
        str_ += ' ';
      if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        str_ += std::string_view{x};
      } else {
        std::ostringstream out;
        out << x;
        str_ += out.str();
      }
      return std::move(*this);
    }

    std::string get() && {
      return std::move(str_);
    }

  private:
    std::string str_;
  };

  // -- constructors, destructors, and assignment operators --------------------

  virtual ~logger();

  // -- logging ----------------------------------------------------------------

  /// Logs a message.
  /// @param level Severity of the message.
  /// @param component Name of the component logging the message.
  /// @param msg The rendered message.
  /// @param file_name Source file of the logging statement.
  /// @param line_number Source line of the logging statement.
  void log(unsigned level, std::string_view component, std::string msg,
           const char* file_name, int line_number);

  /// Logs an ENTRY message with `trace` severity and returns a guard that logs
  /// the matching EXIT message when going out of scope.
  [[nodiscard]] trace_exit_guard
  log_trace(std::string_view component, std::string msg, const char* file_name,
            int line_number);

  // -- properties -------------------------------------------------------------

  /// Returns whether the logger is configured to accept input for given
  /// component and log level.
  virtual bool accepts(unsigned level, std::string_view component_name) = 0;

  // -- static utility functions -----------------------------------------------

  /// Creates the default logger with given configuration.
  static intrusive_ptr<logger> make(config cfg);

  /// Returns the process-wide logger or `nullptr` if none is installed.
  /// @thread-safe
  static logger* current_logger() noexcept;

  /// Installs `ptr` as the process-wide logger. Passing `nullptr` disables
  /// logging.
  /// @warning Applications must not replace the logger while other threads
  ///          may log, i.e., install the logger before starting any event loop.
  static void current_logger(intrusive_ptr<logger> ptr);

  // -- reference counting -----------------------------------------------------

  /// Increases the reference count of the logger.
  virtual void ref_logger() const noexcept = 0;

  /// Decreases the reference count of the logger and destroys the object
  /// if necessary.
  virtual void deref_logger() const noexcept = 0;

  friend void intrusive_ptr_add_ref(const logger* ptr) noexcept {
    ptr->ref_logger();
  }

  friend void intrusive_ptr_release(const logger* ptr) noexcept {
    ptr->deref_logger();
  }

protected:
  // -- internal logging API ---------------------------------------------------

  /// Writes an event to the output of the logger.
  /// @thread-safe
  virtual void do_log(log_event&& event) = 0;
};

} // namespace evsync

// -- macro constants ----------------------------------------------------------

/// Expands to a no-op.
#define EVSYNC_VOID_STMT static_cast<void>(0)

#ifndef EVSYNC_LOG_COMPONENT
/// Name of the current component when logging.
#  define EVSYNC_LOG_COMPONENT "evsync"
#endif // EVSYNC_LOG_COMPONENT

// -- utility macros -----------------------------------------------------------

/// Expands to `argument = <argument>` in log output.
#define EVSYNC_ARG(argument)                                                   \
  evsync::detail::make_arg_wrapper(#argument, argument)

/// Expands to `argname = <argval>` in log output.
#define EVSYNC_ARG2(argname, argval)                                           \
  evsync::detail::make_arg_wrapper(argname, argval)

// -- logging macros -----------------------------------------------------------

#define EVSYNC_LOG_IMPL(component, loglvl, message)                            \
  do {                                                                         \
    if (auto* evsync_logger_instance = evsync::logger::current_logger();       \
        evsync_logger_instance                                                 \
        && evsync_logger_instance->accepts(loglvl, component)) {               \
      evsync_logger_instance->log(                                             \
        loglvl, component,                                                     \
        (evsync::logger::line_builder{} << message).get(), __FILE__,           \
        __LINE__);                                                             \
    }                                                                          \
  } while (false)

#if EVSYNC_LOG_LEVEL < EVSYNC_LOG_LEVEL_TRACE

#  define EVSYNC_LOG_TRACE(unused) EVSYNC_VOID_STMT

#else // EVSYNC_LOG_LEVEL < EVSYNC_LOG_LEVEL_TRACE

#  define EVSYNC_LOG_TRACE(entry_message)                                      \
    evsync::logger::trace_exit_guard evsync_trace_log_auto_guard;              \
    if (auto* evsync_logger_instance = evsync::logger::current_logger();       \
        evsync_logger_instance                                                 \
        && evsync_logger_instance->accepts(EVSYNC_LOG_LEVEL_TRACE,             \
                                           EVSYNC_LOG_COMPONENT)) {            \
      evsync_trace_log_auto_guard = evsync_logger_instance->log_trace(         \
        EVSYNC_LOG_COMPONENT,                                                  \
        (evsync::logger::line_builder{} << entry_message).get(), __FILE__,     \
        __LINE__);                                                             \
    }                                                                          \
    static_cast<void>(0)

#endif // EVSYNC_LOG_LEVEL < EVSYNC_LOG_LEVEL_TRACE

#if EVSYNC_LOG_LEVEL >= EVSYNC_LOG_LEVEL_DEBUG
#  define EVSYNC_LOG_DEBUG(output)                                             \
    EVSYNC_LOG_IMPL(EVSYNC_LOG_COMPONENT, EVSYNC_LOG_LEVEL_DEBUG, output)
#else
#  define EVSYNC_LOG_DEBUG(output) EVSYNC_VOID_STMT
#endif

#if EVSYNC_LOG_LEVEL >= EVSYNC_LOG_LEVEL_INFO
#  define EVSYNC_LOG_INFO(output)                                              \
    EVSYNC_LOG_IMPL(EVSYNC_LOG_COMPONENT, EVSYNC_LOG_LEVEL_INFO, output)
#else
#  define EVSYNC_LOG_INFO(output) EVSYNC_VOID_STMT
#endif

#if EVSYNC_LOG_LEVEL >= EVSYNC_LOG_LEVEL_WARNING
#  define EVSYNC_LOG_WARNING(output)                                           \
    EVSYNC_LOG_IMPL(EVSYNC_LOG_COMPONENT, EVSYNC_LOG_LEVEL_WARNING, output)
#else
#  define EVSYNC_LOG_WARNING(output) EVSYNC_VOID_STMT
#endif

#if EVSYNC_LOG_LEVEL >= EVSYNC_LOG_LEVEL_ERROR
#  define EVSYNC_LOG_ERROR(output)                                             \
    EVSYNC_LOG_IMPL(EVSYNC_LOG_COMPONENT, EVSYNC_LOG_LEVEL_ERROR, output)
#else
#  define EVSYNC_LOG_ERROR(output) EVSYNC_VOID_STMT
#endif

#if EVSYNC_LOG_LEVEL >= EVSYNC_LOG_LEVEL_DEBUG
#  define EVSYNC_LOG_DEBUG_IF(cond, output)                                    \
    if (cond)                                                                  \
      EVSYNC_LOG_IMPL(EVSYNC_LOG_COMPONENT, EVSYNC_LOG_LEVEL_DEBUG, output);   \
    EVSYNC_VOID_STMT
#else
#  define EVSYNC_LOG_DEBUG_IF(cond, output) EVSYNC_VOID_STMT
#endif
