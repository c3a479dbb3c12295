/**
 * @file target.cpp
 * @brief Реализация декодирования compact target
 */

#include "target.hpp"
#include "../core/constants.hpp"
#include "../core/hex.hpp"

#include <format>

namespace proofsmith::pow {

Result<CompactTarget> split_compact(ByteSpan bytes) {
    if (bytes.size() != constants::COMPACT_TARGET_SIZE) {
        return Err<CompactTarget>(
            ErrorCode::Length,
            std::format("Compact target должен быть {} байта, получено {}",
                        constants::COMPACT_TARGET_SIZE, bytes.size())
        );
    }

    CompactTarget compact;
    compact.exponent = bytes[0];
    compact.mantissa = (static_cast<uint32_t>(bytes[1]) << 16) |
                       (static_cast<uint32_t>(bytes[2]) << 8) |
                       static_cast<uint32_t>(bytes[3]);
    return compact;
}

Result<core::uint256> decode_compact_target(ByteSpan bytes) {
    auto compact = split_compact(bytes);
    if (!compact) {
        return std::unexpected(compact.error());
    }

    const uint8_t exponent = compact->exponent;
    const uint32_t mantissa = compact->mantissa;

    if (mantissa == 0) {
        return Err<core::uint256>(
            ErrorCode::InvalidEncoding,
            "Мантисса compact target равна нулю"
        );
    }
    if (exponent < constants::COMPACT_MIN_EXPONENT ||
        exponent > constants::COMPACT_MAX_EXPONENT) {
        return Err<core::uint256>(
            ErrorCode::InvalidEncoding,
            std::format("Экспонента compact target вне диапазона [{}, {}]: {}",
                        constants::COMPACT_MIN_EXPONENT,
                        constants::COMPACT_MAX_EXPONENT, exponent)
        );
    }

    // Байт мантиссы с весом 256^k лежит по индексу 31 - k (big-endian).
    // Младший байт мантиссы имеет вес 256^(E - 3).
    Hash256 target{};
    const std::size_t shift = static_cast<std::size_t>(exponent) - 3;
    for (std::size_t i = 0; i < 3; ++i) {
        const auto byte = static_cast<uint8_t>(mantissa >> (8 * i));
        const std::size_t weight = shift + i;
        if (weight >= core::uint256::SIZE) {
            if (byte != 0) {
                return Err<core::uint256>(
                    ErrorCode::TargetOutOfRange,
                    std::format("Target 0x{:06x} * 256^{} не помещается в 256 бит",
                                mantissa, shift)
                );
            }
            continue;
        }
        target[core::uint256::SIZE - 1 - weight] = byte;
    }

    core::uint256 result{target};
    if (result.is_zero()) {
        return Err<core::uint256>(ErrorCode::TargetOutOfRange, "Target равен нулю");
    }
    return result;
}

Result<core::uint256> parse_compact_target(std::string_view text) {
    if (text.size() != constants::COMPACT_TARGET_SIZE * 2) {
        return Err<core::uint256>(
            ErrorCode::Length,
            std::format("Compact target должен быть {} hex символов, получено {}",
                        constants::COMPACT_TARGET_SIZE * 2, text.size())
        );
    }

    auto bytes = hex::decode(text);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return decode_compact_target(*bytes);
}

bool meets_target(const Hash256& hash, const core::uint256& target) noexcept {
    return core::uint256{hash} <= target;
}

} // namespace proofsmith::pow
