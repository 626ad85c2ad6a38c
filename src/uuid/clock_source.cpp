#include "uuid/clock_source.hpp"

#include <chrono>

namespace uuuidv7 {
uint64_t SystemClockSource::nowNanoseconds()
{
    const auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(sinceEpoch).count());
}
} // namespace uuuidv7
