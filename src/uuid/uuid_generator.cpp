#include "uuid/uuid_generator.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include "uuid/uuid_codec.hpp"
#include "utils/logger.hpp"

namespace {
// Количество случайных байтов, из которых берутся 62 бита
constexpr size_t RANDOM_BYTES = 8;
} // namespace

namespace uuuidv7 {
UuidGenerator::UuidGenerator()
    : UuidGenerator(std::make_shared<SystemClockSource>(), std::make_shared<SystemRandomSource>())
{
}

UuidGenerator::UuidGenerator(std::shared_ptr<ClockSource> clock,
                             std::shared_ptr<RandomSource> random)
    : clock_(std::move(clock))
    , random_(std::move(random))
{
    if (!clock_ || !random_) {
        throw std::invalid_argument("UuidGenerator: clock and random sources are required");
    }
}

std::string UuidGenerator::generate() const
{
    return UuidCodec::encode(generateRaw());
}

/**
 * Правила генерации: [tttttttt-tttt-7fff-Vrrr-rrrrrrrrrrrr]
 *  - [tttttttt-tttt] (12) — 48 бит миллисекунд с начала эпохи
 *  - [7fff] (4):
 *      - [7] — версия UUID v7
 *      - [fff] — 12 бит доли миллисекунды
 *  - [Vrrr] (4):
 *      - [V] — вариант, значение из набора [8, 9, a, b]
 *      - [rrr] — старшие случайные биты
 *  - [rrrrrrrrrrrr] (12) — оставшиеся случайные биты (всего 62 бита)
 */
RawUuid UuidGenerator::generateRaw() const
{
    // Разложение текущего времени на миллисекунды и долю миллисекунды
    const auto time = splitTimestamp(clock_->nowNanoseconds());

    // 8 случайных байтов, из них используются младшие 62 бита
    std::array<uint8_t, RANDOM_BYTES> bytes{};
    random_->fillBytes(bytes.data(), bytes.size());

    uint64_t random = 0;
    for (const auto byte : bytes) {
        random = (random << 8) | byte;
    }

    LOG_TRACE << "Генерация UUID: мс=" << time.milliseconds << ", доля=" << time.fraction;

    return packUuid(time.milliseconds, time.fraction, random);
}

uint64_t UuidGenerator::extractTimestamp(const RawUuid &uuid)
{
    return uuuidv7::extractTimestamp(uuid);
}

std::optional<uint64_t> UuidGenerator::extractTimestamp(std::string_view uuid)
{
    const auto raw = UuidCodec::decode(uuid);
    if (!raw.has_value()) {
        return std::nullopt;
    }
    return uuuidv7::extractTimestamp(*raw);
}
} // namespace uuuidv7
