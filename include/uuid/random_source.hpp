#pragma once

#include <cstddef>
#include <cstdint>

namespace uuuidv7 {
/**
 * @class RandomSource
 * @brief Источник случайных байтов.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Заполняет буфер случайными байтами
     * @param buffer Буфер для заполнения
     * @param size Количество байтов
     * @throws std::system_error если источник недоступен
     */
    virtual void fillBytes(uint8_t *buffer, size_t size) = 0;
};

/**
 * @class SystemRandomSource
 * @brief Криптографически стойкий генератор операционной системы.
 *
 * В Unix используется getrandom(2), в Windows - BCryptGenRandom.
 */
class SystemRandomSource : public RandomSource {
public:
    void fillBytes(uint8_t *buffer, size_t size) override;
};
} // namespace uuuidv7
