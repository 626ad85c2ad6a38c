#include "uuid/uuid_layout.hpp"

#include <algorithm>

namespace {
// Запись 64-битного значения в буфер в порядке big-endian
void storeBigEndian(uint64_t value, uint8_t *out, size_t bytes)
{
    for (size_t i = 0; i < bytes; i++) {
        out[bytes - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

// Чтение big-endian значения из буфера
uint64_t loadBigEndian(const uint8_t *in, size_t bytes)
{
    uint64_t value = 0;
    for (size_t i = 0; i < bytes; i++) {
        value = (value << 8) | in[i];
    }
    return value;
}
} // namespace

namespace uuuidv7 {
uint16_t scaleNanoseconds(uint64_t remainderNs)
{
    // floor(ns / (1'000'000 / 4096)) == floor(ns * 4096 / 1'000'000),
    // так как 1'000'000 / 4096 = 244.140625 представимо точно
    const auto clamped = std::min(remainderNs, NANOSECONDS_PER_MILLISECOND);
    const auto scaled = clamped * FRACTION_BUCKETS / NANOSECONDS_PER_MILLISECOND;
    return static_cast<uint16_t>(std::min<uint64_t>(scaled, MAX_FRACTION));
}

TimestampParts splitTimestamp(uint64_t instantNs)
{
    // Остаток берется от фиксированного числа наносекунд в миллисекунде
    const auto milliseconds = instantNs / NANOSECONDS_PER_MILLISECOND;
    const auto remainderNs = instantNs % NANOSECONDS_PER_MILLISECOND;
    return { milliseconds, scaleNanoseconds(remainderNs) };
}

/**
 * Байты результата:
 *  - [0..5]  — миллисекунды
 *  - [6]     — версия (старший полубайт) + старшие 4 бита доли
 *  - [7]     — младшие 8 бит доли
 *  - [8..15] — вариант (2 старших бита) + 62 случайных бита
 */
RawUuid packUuid(uint64_t milliseconds, uint16_t fraction, uint64_t random)
{
    RawUuid uuid{};
    const uint16_t frac = std::min(fraction, MAX_FRACTION);

    storeBigEndian(milliseconds & TIMESTAMP_MASK, uuid.data(), 6);

    const uint16_t versionAndFraction = static_cast<uint16_t>((UUID_VERSION << 12) | frac);
    storeBigEndian(versionAndFraction, uuid.data() + 6, 2);

    const uint64_t variantAndRandom = (uint64_t(UUID_VARIANT) << 62) | (random & RANDOM_MASK);
    storeBigEndian(variantAndRandom, uuid.data() + 8, 8);

    return uuid;
}

uint64_t extractTimestamp(const RawUuid &uuid)
{
    return loadBigEndian(uuid.data(), 6);
}

uint16_t extractFraction(const RawUuid &uuid)
{
    return static_cast<uint16_t>(loadBigEndian(uuid.data() + 6, 2) & MAX_FRACTION);
}

uint8_t extractVersion(const RawUuid &uuid)
{
    return static_cast<uint8_t>(uuid[6] >> 4);
}

uint8_t extractVariant(const RawUuid &uuid)
{
    return static_cast<uint8_t>(uuid[8] >> 6);
}

uint64_t extractRandom(const RawUuid &uuid)
{
    return loadBigEndian(uuid.data() + 8, 8) & RANDOM_MASK;
}

bool hasV7Layout(const RawUuid &uuid)
{
    return extractVersion(uuid) == UUID_VERSION && extractVariant(uuid) == UUID_VARIANT;
}
} // namespace uuuidv7
