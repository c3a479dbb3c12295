/**
 * @file uint256.hpp
 * @brief 256-битное беззнаковое целое число
 *
 * Используется для target и для сравнения хеша заголовка с target.
 */

#pragma once

#include "../types.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <string>

namespace proofsmith::core {

/**
 * @brief 256-битное беззнаковое целое число
 *
 * Хранится в big-endian формате: байт 0 - старший. Поэтому SHA256 хеш
 * заголовка интерпретируется как число без какого-либо разворота, а
 * hex представление совпадает с порядком байт в памяти.
 */
class uint256 {
public:
    /// @brief Размер в байтах
    static constexpr std::size_t SIZE = 32;

    /// @brief Конструктор по умолчанию (нулевое значение)
    constexpr uint256() noexcept : data_{} {}

    /// @brief Конструктор из 32 байт big-endian
    constexpr explicit uint256(const Hash256& bytes) noexcept : data_(bytes) {}

    /// @brief Конструктор из 64-битного числа
    constexpr explicit uint256(uint64_t value) noexcept : data_{} {
        for (std::size_t i = 0; i < 8; ++i) {
            data_[SIZE - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
        }
    }

    // =========================================================================
    // Доступ к данным
    // =========================================================================

    [[nodiscard]] constexpr const uint8_t* data() const noexcept {
        return data_.data();
    }

    [[nodiscard]] constexpr uint8_t* data() noexcept {
        return data_.data();
    }

    [[nodiscard]] static constexpr std::size_t size() noexcept {
        return SIZE;
    }

    /**
     * @brief Получить байт по индексу (0 - старший)
     */
    [[nodiscard]] constexpr uint8_t operator[](std::size_t i) const noexcept {
        return data_[i];
    }

    /**
     * @brief Байты big-endian
     */
    [[nodiscard]] constexpr const Hash256& bytes() const noexcept {
        return data_;
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    // =========================================================================
    // Сравнение
    // =========================================================================

    /**
     * @brief Трёхстороннее сравнение (старшие байты сначала)
     */
    [[nodiscard]] constexpr std::strong_ordering operator<=>(
        const uint256& other
    ) const noexcept {
        for (std::size_t i = 0; i < SIZE; ++i) {
            if (data_[i] != other.data_[i]) {
                return data_[i] <=> other.data_[i];
            }
        }
        return std::strong_ordering::equal;
    }

    [[nodiscard]] constexpr bool operator==(const uint256& other) const noexcept {
        return data_ == other.data_;
    }

    // =========================================================================
    // Строковое представление
    // =========================================================================

    /**
     * @brief Hex строка, 64 символа, старшие байты сначала
     */
    [[nodiscard]] std::string to_hex() const;

    /**
     * @brief Создать из hex строки (64 символа)
     */
    [[nodiscard]] static Result<uint256> from_hex(std::string_view hex);

    // =========================================================================
    // Статические константы
    // =========================================================================

    [[nodiscard]] static constexpr uint256 zero() noexcept {
        return uint256{};
    }

    /**
     * @brief Максимальное значение (2^256 - 1)
     */
    [[nodiscard]] static constexpr uint256 max() noexcept {
        uint256 result;
        for (auto& b : result.data_) {
            b = 0xFF;
        }
        return result;
    }

private:
    Hash256 data_;
};

} // namespace proofsmith::core
