// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "evsync/logger.hpp"

#include "evsync/detail/atomic_ref_counted.hpp"
#include "evsync/make_counted.hpp"
#include "evsync/raise_error.hpp"

#include <algorithm>
#include <atomic>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace evsync {

namespace {

// Owns the process-wide logger.
intrusive_ptr<logger> current_logger_ptr;

// Grants lock-free read access to `current_logger_ptr`.
std::atomic<logger*> current_logger_raw_ptr;

// Guards writes to `current_logger_ptr`.
std::mutex current_logger_mtx;

// Strips the directory from `path`.
std::string_view file_name_only(const char* path) {
  std::string_view str{path};
  if (auto pos = str.find_last_of("/\\"); pos != std::string_view::npos)
    return str.substr(pos + 1);
  return str;
}

// Default logger implementation.
class default_logger : public logger, public detail::atomic_ref_counted {
public:
  explicit default_logger(config cfg) : cfg_(std::move(cfg)) {
    // nop
  }

  void init() {
    if (cfg_.file_name.empty())
      return;
    file_.open(cfg_.file_name, std::ios::out | std::ios::app);
    if (!file_)
      EVSYNC_RAISE_ERROR(std::runtime_error, "unable to open log file");
  }

  // -- properties -------------------------------------------------------------

  bool accepts(unsigned level, std::string_view component_name) override {
    if (level > cfg_.verbosity)
      return false;
    return std::none_of(cfg_.excluded_components.begin(),
                        cfg_.excluded_components.end(),
                        [=](const std::string& name) {
                          return name == component_name;
                        });
  }

  // -- reference counting -----------------------------------------------------

  void ref_logger() const noexcept override {
    ref();
  }

  void deref_logger() const noexcept override {
    deref();
  }

  // -- static utility functions -----------------------------------------------

  /// Renders the date of `x` in ISO 8601 format with milliseconds.
  static void render_date(std::ostream& out,
                          std::chrono::system_clock::time_point x) {
    namespace sc = std::chrono;
    auto secs = sc::system_clock::to_time_t(x);
    auto msecs = sc::duration_cast<sc::milliseconds>(x.time_since_epoch())
                 % 1000;
    std::tm time_buf;
#ifdef EVSYNC_WINDOWS
    localtime_s(&time_buf, &secs);
#else
    localtime_r(&secs, &time_buf);
#endif
    out << std::put_time(&time_buf, "%FT%T") << '.' << std::setw(3)
        << std::setfill('0') << msecs.count();
  }

protected:
  void do_log(log_event&& event) override {
    std::ostringstream line;
    render_date(line, event.timestamp);
    line << ' ' << log::level::name(event.level) << ' ' << event.component
         << " [" << event.thread_id << "] " << file_name_only(event.file_name)
         << ':' << event.line_number << ' ' << event.message << '\n';
    auto str = line.str();
    std::lock_guard<std::mutex> guard{mtx_};
    if (cfg_.console)
      std::clog << str << std::flush;
    if (file_.is_open())
      file_ << str << std::flush;
  }

private:
  config cfg_;
  std::mutex mtx_;
  std::ofstream file_;
};

} // namespace

// -- trace_exit_guard ---------------------------------------------------------

logger::trace_exit_guard::trace_exit_guard(trace_exit_guard&& other) noexcept
  : instance_(other.instance_),
    component_(other.component_),
    file_name_(other.file_name_),
    line_number_(other.line_number_) {
  other.instance_ = nullptr;
}

logger::trace_exit_guard&
logger::trace_exit_guard::operator=(trace_exit_guard&& other) noexcept {
  using std::swap;
  swap(instance_, other.instance_);
  swap(component_, other.component_);
  swap(file_name_, other.file_name_);
  swap(line_number_, other.line_number_);
  return *this;
}

logger::trace_exit_guard::~trace_exit_guard() {
  if (instance_)
    instance_->log(log::level::trace, component_, "EXIT", file_name_,
                   line_number_);
}

// -- logger -------------------------------------------------------------------

logger::~logger() {
  // nop
}

void logger::log(unsigned level, std::string_view component, std::string msg,
                 const char* file_name, int line_number) {
  do_log(log_event{level, component, file_name, line_number, std::move(msg),
                   std::chrono::system_clock::now(),
                   std::this_thread::get_id()});
}

logger::trace_exit_guard logger::log_trace(std::string_view component,
                                           std::string msg,
                                           const char* file_name,
                                           int line_number) {
  std::string entry = "ENTRY";
  if (!msg.empty()) {
    entry += ' ';
    entry += msg;
  }
  log(log::level::trace, component, std::move(entry), file_name, line_number);
  return {this, component, file_name, line_number};
}

intrusive_ptr<logger> logger::make(config cfg) {
  auto result = make_counted<default_logger>(std::move(cfg));
  result->init();
  return result;
}

logger* logger::current_logger() noexcept {
  return current_logger_raw_ptr.load(std::memory_order_acquire);
}

void logger::current_logger(intrusive_ptr<logger> ptr) {
  std::lock_guard<std::mutex> guard{current_logger_mtx};
  current_logger_raw_ptr.store(ptr.get(), std::memory_order_release);
  current_logger_ptr.swap(ptr);
}

} // namespace evsync
