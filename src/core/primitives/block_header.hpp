/**
 * @file block_header.hpp
 * @brief 80-байтный заголовок блока
 *
 * Структура (все числа big-endian, хеши копируются как есть):
 * - version:     4 байта (int32_t)
 * - prev_hash:   32 байта
 * - merkle_root: 32 байта
 * - timestamp:   4 байта (uint32_t)
 * - nonce:       8 байт (uint64_t)
 *
 * Поля compact target в заголовке нет: target передаётся отдельно
 * и майнеру, и проверяющему.
 */

#pragma once

#include "../types.hpp"
#include "../constants.hpp"
#include "uint256.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace proofsmith::core {

/// @brief Сериализованный заголовок
using HeaderBytes = std::array<uint8_t, constants::BLOCK_HEADER_SIZE>;

/**
 * @brief Заголовок блока (80 байт)
 */
struct BlockHeader {
    /// @brief Версия блока
    int32_t version{0};

    /// @brief Хеш предыдущего блока
    Hash256 prev_hash{};

    /// @brief Корень Merkle дерева транзакций
    Hash256 merkle_root{};

    /// @brief Временная метка (Unix timestamp)
    uint32_t timestamp{0};

    /// @brief Nonce; майнер меняет только младшие 32 бита
    uint64_t nonce{0};

    // =========================================================================
    // Сериализация
    // =========================================================================

    /**
     * @brief Сериализовать заголовок в 80 байт
     */
    [[nodiscard]] HeaderBytes serialize() const noexcept;

    /**
     * @brief Сериализовать в hex (160 символов)
     */
    [[nodiscard]] std::string to_hex() const;

    /**
     * @brief Десериализовать заголовок из 80 байт
     *
     * @param data Ровно 80 байт
     */
    [[nodiscard]] static BlockHeader deserialize(
        std::span<const uint8_t, constants::BLOCK_HEADER_SIZE> data
    ) noexcept;

    /**
     * @brief Разобрать hex строку заголовка
     *
     * @param hex Ровно 160 hex символов
     * @return Result<BlockHeader> Заголовок, Length или InvalidHex
     */
    [[nodiscard]] static Result<BlockHeader> from_hex(std::string_view hex);

    // =========================================================================
    // Хеширование
    // =========================================================================

    /**
     * @brief Одинарный SHA256 от 80 байт
     */
    [[nodiscard]] Hash256 hash() const noexcept;

    /**
     * @brief Хеш как 256-битное число (big-endian)
     */
    [[nodiscard]] uint256 hash_uint256() const noexcept;

    [[nodiscard]] bool operator==(const BlockHeader&) const noexcept = default;
};

} // namespace proofsmith::core
