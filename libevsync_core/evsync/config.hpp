// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "evsync/detail/build_config.hpp"

// Platform and compiler detection.

#if defined(__clang__)
#  define EVSYNC_CLANG
#elif defined(__GNUC__)
#  define EVSYNC_GCC
#elif defined(_MSC_VER)
#  define EVSYNC_MSVC
#endif

#if defined(__APPLE__)
#  define EVSYNC_MACOS
#elif defined(__linux__)
#  define EVSYNC_LINUX
#elif defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#  define EVSYNC_BSD
#elif defined(WIN32) || defined(_WIN32)
#  define EVSYNC_WINDOWS
#else
#  error Platform and/or compiler not supported
#endif

#ifdef EVSYNC_MSVC
/// Expands to a string representation of the current function name that
/// includes the full function name and its signature.
#  define EVSYNC_PRETTY_FUN __FUNCSIG__
#else
/// Expands to a string representation of the current function name that
/// includes the full function name and its signature.
#  define EVSYNC_PRETTY_FUN __PRETTY_FUNCTION__
#endif
