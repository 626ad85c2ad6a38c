#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace uuuidv7 {
constexpr size_t UUID_SIZE = 16;

/**
 * @brief Бинарное представление UUID (16 байт, big-endian)
 *
 * Раскладка битов:
 *  - [0..47]    (48) — миллисекунды с начала эпохи Unix
 *  - [48..51]   (4)  — версия, всегда 7
 *  - [52..63]   (12) — доля миллисекунды, масштабированная в диапазон [0, 4095]
 *  - [64..65]   (2)  — вариант, всегда 0b10
 *  - [66..127]  (62) — случайные биты
 *
 * В отличие от стандартного v7 под случайные данные отводится 62 бита вместо 74:
 * 12 бит отданы под долю миллисекунды, чтобы UUID, созданные в пределах одной
 * миллисекунды, сохраняли порядок генерации. Это снижает устойчивость к коллизиям.
 */
using RawUuid = std::array<uint8_t, UUID_SIZE>;

constexpr uint8_t UUID_VERSION = 7;
constexpr uint8_t UUID_VARIANT = 0b10;

constexpr uint64_t NANOSECONDS_PER_MILLISECOND = 1'000'000;
constexpr uint64_t FRACTION_BUCKETS = 4096;
constexpr uint16_t MAX_FRACTION = static_cast<uint16_t>(FRACTION_BUCKETS - 1);

constexpr uint64_t TIMESTAMP_MASK = (uint64_t(1) << 48) - 1;
constexpr uint64_t RANDOM_MASK = (uint64_t(1) << 62) - 1;

/**
 * @struct TimestampParts
 * @brief Момент времени, разложенный на миллисекунды и долю миллисекунды
 */
struct TimestampParts {
    uint64_t milliseconds; // Миллисекунды с начала эпохи
    uint16_t fraction; // Доля миллисекунды [0, 4095]
};

/**
 * @brief Масштабирует наносекунды внутри миллисекунды в 12-битную долю
 * @param remainderNs Наносекунды, прошедшие с начала текущей миллисекунды
 * @return Значение в диапазоне [0, 4095]
 */
uint16_t scaleNanoseconds(uint64_t remainderNs);

/**
 * @brief Раскладывает момент времени в наносекундах на миллисекунды и долю
 * @param instantNs Наносекунды с начала эпохи Unix
 * @return Миллисекунды и масштабированная доля
 */
TimestampParts splitTimestamp(uint64_t instantNs);

/**
 * @brief Собирает UUID из полей
 * @param milliseconds Миллисекунды (используются младшие 48 бит)
 * @param fraction Доля миллисекунды (ограничивается значением 4095)
 * @param random Случайные биты (используются младшие 62 бита)
 * @return Бинарное представление UUID
 */
RawUuid packUuid(uint64_t milliseconds, uint16_t fraction, uint64_t random);

// Чтение полей из бинарного представления
uint64_t extractTimestamp(const RawUuid &uuid);
uint16_t extractFraction(const RawUuid &uuid);
uint8_t extractVersion(const RawUuid &uuid);
uint8_t extractVariant(const RawUuid &uuid);
uint64_t extractRandom(const RawUuid &uuid);

/**
 * @brief Проверяет, что версия и вариант соответствуют раскладке v7
 * @param uuid Проверяемый UUID
 * @return true если версия равна 7, а вариант равен 0b10
 */
bool hasV7Layout(const RawUuid &uuid);
} // namespace uuuidv7
