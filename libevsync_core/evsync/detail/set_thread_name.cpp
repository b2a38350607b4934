// This file is part of evsync, the event-loop synchronization library. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "evsync/detail/set_thread_name.hpp"

#include "evsync/config.hpp"

#ifndef EVSYNC_WINDOWS
#  include <pthread.h>
#endif // EVSYNC_WINDOWS

#if defined(EVSYNC_LINUX)
#  include <sys/prctl.h>
#elif defined(EVSYNC_BSD)
#  include <pthread_np.h>
#endif // defined(...)

#include <thread>
#include <type_traits>

namespace evsync::detail {

void set_thread_name([[maybe_unused]] const char* name) {
#ifndef EVSYNC_WINDOWS
  static_assert(std::is_same_v<std::thread::native_handle_type, pthread_t>,
                "std::thread not based on pthread_t");
#  if defined(EVSYNC_MACOS)
  pthread_setname_np(name);
#  elif defined(EVSYNC_LINUX)
  prctl(PR_SET_NAME, name, 0, 0, 0);
#  elif defined(EVSYNC_BSD)
  pthread_set_name_np(pthread_self(), name);
#  endif // defined(...)
#endif   // EVSYNC_WINDOWS
}

} // namespace evsync::detail
