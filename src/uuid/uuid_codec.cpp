#include "uuid/uuid_codec.hpp"

#include <array>

#include "utils/logger.hpp"

namespace {
// Признак символа, не являющегося шестнадцатеричной цифрой
constexpr uint8_t INVALID_NIBBLE = 0xFF;

// Полубайт -> символ
constexpr char NIBBLE_TO_HEX[] = "0123456789abcdef";

// Символ -> полубайт, для остальных символов INVALID_NIBBLE
constexpr std::array<uint8_t, 256> makeHexToNibbleTable()
{
    std::array<uint8_t, 256> table{};
    for (auto &value : table) {
        value = INVALID_NIBBLE;
    }
    for (uint8_t i = 0; i < 10; i++) {
        table['0' + i] = i;
    }
    for (uint8_t i = 0; i < 6; i++) {
        table['a' + i] = static_cast<uint8_t>(10 + i);
        table['A' + i] = static_cast<uint8_t>(10 + i);
    }
    return table;
}

constexpr auto HEX_TO_NIBBLE = makeHexToNibbleTable();

// Дефис ставится после 8, 12, 16 и 20 шестнадцатеричных символов
constexpr bool isHyphenPosition(size_t pos)
{
    return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}
} // namespace

namespace uuuidv7 {
std::string UuidCodec::encode(const RawUuid &uuid)
{
    std::string text;
    text.reserve(TEXT_LENGTH);

    for (size_t i = 0; i < uuid.size(); i++) {
        // Дефисы перед 4-м, 6-м, 8-м и 10-м байтами
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text += '-';
        }
        text += NIBBLE_TO_HEX[uuid[i] >> 4];
        text += NIBBLE_TO_HEX[uuid[i] & 0x0F];
    }

    return text;
}

std::optional<RawUuid> UuidCodec::decode(std::string_view text)
{
    if (text.size() != TEXT_LENGTH) {
        LOG_DEBUG << "UUID отклонен: неверная длина " << text.size();
        return std::nullopt;
    }

    RawUuid uuid{};
    size_t nibbleIndex = 0;

    for (size_t pos = 0; pos < TEXT_LENGTH; pos++) {
        const auto symbol = static_cast<unsigned char>(text[pos]);

        if (isHyphenPosition(pos)) {
            if (symbol != '-') {
                LOG_DEBUG << "UUID отклонен: ожидался дефис в позиции " << pos;
                return std::nullopt;
            }
            continue;
        }

        const auto nibble = HEX_TO_NIBBLE[symbol];
        if (nibble == INVALID_NIBBLE) {
            LOG_DEBUG << "UUID отклонен: недопустимый символ в позиции " << pos;
            return std::nullopt;
        }

        // Четные полубайты занимают старшую половину байта
        auto &byte = uuid[nibbleIndex / 2];
        byte = static_cast<uint8_t>(nibbleIndex % 2 == 0 ? nibble << 4 : byte | nibble);
        nibbleIndex++;
    }

    return uuid;
}

bool UuidCodec::isValidUuid(std::string_view text)
{
    return decode(text).has_value();
}
} // namespace uuuidv7
