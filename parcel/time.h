#ifndef PARCEL_TIME_H_
#define PARCEL_TIME_H_

#include <cstdint>

namespace parcel {
namespace time {
uint64_t NowMicros();
uint64_t NowNanos();
void SleepForMicros(uint64_t micros);
}  // namespace time
}  // namespace parcel
#endif  // PARCEL_TIME_H_
