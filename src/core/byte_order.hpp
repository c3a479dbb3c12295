/**
 * @file byte_order.hpp
 * @brief Запись и чтение целых чисел фиксированной ширины
 *
 * Все числовые поля заголовка блока и слова SHA256 кодируются
 * в big-endian. Функции работают сдвигами, поэтому не зависят
 * от порядка байт хоста.
 *
 * @note Разворота хешей здесь нет намеренно: 32-байтные значения
 *       копируются как есть.
 */

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>

namespace proofsmith {

/**
 * @brief Concept для беззнаковых целых фиксированного размера
 */
template<typename T>
concept UnsignedInteger = std::unsigned_integral<T> &&
                          (sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);

/**
 * @brief Записать число в big-endian формате
 *
 * @tparam T Тип целого (uint16_t, uint32_t, uint64_t)
 * @param dest Указатель на буфер (минимум sizeof(T) байт)
 * @param value Значение для записи
 */
template<UnsignedInteger T>
constexpr void write_be(uint8_t* dest, T value) noexcept {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        dest[sizeof(T) - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

/**
 * @brief Прочитать число из big-endian буфера
 *
 * @tparam T Тип целого (uint16_t, uint32_t, uint64_t)
 * @param src Указатель на буфер (минимум sizeof(T) байт)
 * @return Значение в формате хоста
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T read_be(const uint8_t* src) noexcept {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | src[i]);
    }
    return value;
}

inline constexpr void write_be32(uint8_t* dest, uint32_t value) noexcept {
    write_be<uint32_t>(dest, value);
}

inline constexpr void write_be64(uint8_t* dest, uint64_t value) noexcept {
    write_be<uint64_t>(dest, value);
}

[[nodiscard]] inline constexpr uint32_t read_be32(const uint8_t* src) noexcept {
    return read_be<uint32_t>(src);
}

[[nodiscard]] inline constexpr uint64_t read_be64(const uint8_t* src) noexcept {
    return read_be<uint64_t>(src);
}

} // namespace proofsmith
