#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "uuid/uuid_layout.hpp"

namespace uuuidv7 {
/**
 * @class UuidCodec
 * @brief Преобразует бинарное представление UUID в текстовое и обратно.
 *
 * Текстовый формат: [xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx], 36 символов,
 * шестнадцатеричные цифры и дефисы в позициях 8, 13, 18 и 23.
 */
class UuidCodec {
public:
    // Длина текстового представления UUID
    static constexpr size_t TEXT_LENGTH = 36;

    /**
     * @brief Кодирует UUID в текстовое представление (нижний регистр)
     * @param uuid Бинарное представление
     * @return Строка из 36 символов
     */
    static std::string encode(const RawUuid &uuid);

    /**
     * @brief Декодирует текстовое представление UUID
     *
     * Принимаются шестнадцатеричные цифры в любом регистре. Строка неверной длины,
     * с дефисами не на своих местах или с недопустимыми символами отклоняется целиком.
     *
     * @param text Текстовое представление
     * @return Бинарное представление или std::nullopt при ошибке формата
     */
    static std::optional<RawUuid> decode(std::string_view text);

    /**
     * @brief Проверяет корректность формата UUID.
     * @param text Проверяемый идентификатор.
     * @return true если строка может быть декодирована.
     */
    static bool isValidUuid(std::string_view text);
};
} // namespace uuuidv7
