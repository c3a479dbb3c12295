/**
 * @file target.hpp
 * @brief Compact target и сравнение хеша с target
 *
 * Формат compact target (4 байта, оба поля big-endian):
 * - Первый байт: exponent E
 * - Следующие 3 байта: mantissa M
 *
 * target = M * 256^(E - 3)
 *
 * Допустимы только M != 0 и 3 <= E <= 34; результат должен лежать
 * строго внутри (0, 2^256).
 *
 * Пример:
 * target = "207fffff"
 * E = 0x20 = 32, M = 0x7fffff
 * target = 0x7fffff * 256^29 = 7fffff00000000...00 (64 hex символа)
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/uint256.hpp"

#include <cstdint>
#include <string_view>

namespace proofsmith::pow {

/**
 * @brief Разобранный compact target
 */
struct CompactTarget {
    uint8_t exponent{0};
    uint32_t mantissa{0};
};

/**
 * @brief Разобрать 4 байта compact target без проверки диапазона
 *
 * @param bytes Ровно 4 байта
 * @return Result<CompactTarget> Поля или Length
 */
[[nodiscard]] Result<CompactTarget> split_compact(ByteSpan bytes);

/**
 * @brief Декодировать compact target в 256-битное число
 *
 * @param bytes exponent[1] || mantissa[3]
 * @return Result<uint256> Target; Length, InvalidEncoding (M == 0 или
 *         E вне [3, 34]) или TargetOutOfRange (не помещается в 256 бит)
 */
[[nodiscard]] Result<core::uint256> decode_compact_target(ByteSpan bytes);

/**
 * @brief Декодировать compact target из hex (8 символов)
 */
[[nodiscard]] Result<core::uint256> parse_compact_target(std::string_view hex);

/**
 * @brief Проверить, что хеш удовлетворяет target
 *
 * Хеш интерпретируется как big-endian 256-битное число.
 *
 * @return true если hash <= target
 */
[[nodiscard]] bool meets_target(const Hash256& hash, const core::uint256& target) noexcept;

} // namespace proofsmith::pow
