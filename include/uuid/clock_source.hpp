#pragma once

#include <cstdint>

namespace uuuidv7 {
/**
 * @class ClockSource
 * @brief Источник текущего времени с наносекундным разрешением.
 *
 * Монотонность не гарантируется: системные часы могут быть переведены назад,
 * и генератор это не корректирует.
 */
class ClockSource {
public:
    virtual ~ClockSource() = default;

    /**
     * @brief Текущий момент времени
     * @return Наносекунды с начала эпохи Unix
     */
    virtual uint64_t nowNanoseconds() = 0;
};

/**
 * @class SystemClockSource
 * @brief Системные часы (std::chrono::system_clock)
 */
class SystemClockSource : public ClockSource {
public:
    uint64_t nowNanoseconds() override;
};
} // namespace uuuidv7
