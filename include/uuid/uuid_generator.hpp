#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "uuid/clock_source.hpp"
#include "uuid/random_source.hpp"
#include "uuid/uuid_layout.hpp"

namespace uuuidv7 {
/**
 * @class UuidGenerator
 * @brief Генерирует UUID версии 7 с точностью до долей миллисекунды.
 *
 * Старшие 60 бит UUID занимают миллисекунды и 12-битная доля миллисекунды,
 * поэтому UUID, созданные при неубывающих показаниях часов с шагом не менее
 * ~245 нс, упорядочены побайтово (и лексикографически в текстовом виде) так же,
 * как они были созданы.
 *
 * Генератор не хранит изменяемого состояния и может использоваться из нескольких
 * потоков одновременно, если это допускают источники времени и случайных данных.
 */
class UuidGenerator {
public:
    /**
     * @brief Конструктор генератора UUID с системными часами и системным ГСЧ.
     */
    UuidGenerator();

    /**
     * @brief Конструктор с явными источниками времени и случайных данных
     * @param clock Источник времени
     * @param random Источник случайных байтов
     */
    UuidGenerator(std::shared_ptr<ClockSource> clock, std::shared_ptr<RandomSource> random);

    /**
     * @brief Генерирует новый UUID в текстовом виде.
     * @return Строка из 36 символов в нижнем регистре.
     */
    std::string generate() const;

    /**
     * @brief Генерирует новый UUID в бинарном виде.
     * @return 16 байт UUID.
     * @throws std::system_error при отказе источника случайных данных
     */
    RawUuid generateRaw() const;

    /**
     * @brief Извлекает метку времени из бинарного UUID
     * @param uuid Бинарное представление
     * @return Миллисекунды с начала эпохи Unix
     */
    static uint64_t extractTimestamp(const RawUuid &uuid);

    /**
     * @brief Извлекает метку времени из текстового UUID
     * @param uuid Текстовое представление
     * @return Миллисекунды с начала эпохи Unix или std::nullopt, если формат некорректен
     */
    static std::optional<uint64_t> extractTimestamp(std::string_view uuid);

private:
    std::shared_ptr<ClockSource> clock_;
    std::shared_ptr<RandomSource> random_;
};
} // namespace uuuidv7
