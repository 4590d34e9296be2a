#include "parcel/time.h"

#include <time.h>

#include <cerrno>

namespace parcel {
/**
 * @namespace time
 * @brief Wall-clock helpers used for task and run timing.
 */
namespace time {

uint64_t NowMicros() { return NowNanos() / 1000; }

/**
 * @brief Returns the current time of the monotonic clock in nanoseconds.
 *
 * Coordinator and worker timestamps are compared against each other, so the
 * clock must not jump with wall-clock adjustments.
 */
uint64_t NowNanos() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1000000000ull +
         static_cast<uint64_t>(ts.tv_nsec);
}

void SleepForMicros(uint64_t micros) {
  timespec sleep_time;
  sleep_time.tv_sec = micros / 1000000;
  sleep_time.tv_nsec = (micros % 1000000) * 1000;
  // sleep for the remainder when interrupted by a signal (e.g. SIGCHLD)
  while (nanosleep(&sleep_time, &sleep_time) != 0 && errno == EINTR) {
  }
}

}  // namespace time
}  // namespace parcel
