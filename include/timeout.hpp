#pragma once

#include <chrono>
#include <linux/time_types.h>

namespace pasture
{

template <typename Rep, typename Period>
constexpr __kernel_timespec duration_to_timespec(std::chrono::duration<Rep, Period> duration) {
    if (duration < duration.zero())
        duration = duration.zero();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanosecs = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);
    return __kernel_timespec{seconds.count(), nanosecs.count()};
}

}
