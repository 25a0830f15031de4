#include "suid/clock.h"
#include <chrono>

namespace suid {

ClockReading SystemClock::Now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count();

    ClockReading reading;
    reading.unix_seconds = nanos / 1000000000;
    reading.nanoseconds = nanos % 1000000000;

    // 1970년 이전 시계는 나노초가 음수가 되지 않도록 보정
    if (reading.nanoseconds < 0) {
        reading.unix_seconds -= 1;
        reading.nanoseconds += 1000000000;
    }

    return reading;
}

} // namespace suid
