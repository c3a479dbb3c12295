/**
 * @file uint256.cpp
 * @brief Реализация 256-битного целого числа
 */

#include "uint256.hpp"
#include "../hex.hpp"

namespace proofsmith::core {

std::string uint256::to_hex() const {
    return hex::encode(data_);
}

Result<uint256> uint256::from_hex(std::string_view text) {
    auto bytes = hex::decode_hash(text, "uint256");
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return uint256{*bytes};
}

} // namespace proofsmith::core
