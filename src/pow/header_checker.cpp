/**
 * @file header_checker.cpp
 * @brief Реализация проверки заголовка
 */

#include "header_checker.hpp"
#include "target.hpp"
#include "../core/hex.hpp"
#include "../merkle/merkle_tree.hpp"

#include <format>

namespace proofsmith::pow {

Result<Verdict> check_header(
    const core::BlockHeader& header,
    std::span<const Hash256> leaves,
    const core::uint256& target
) {
    auto root = merkle::compute_merkle_root(leaves);
    if (!root) {
        return std::unexpected(root.error());
    }

    Verdict verdict;

    if (header.merkle_root != *root) {
        verdict.reject(
            ErrorCode::RootMismatch,
            std::format("Merkle root не совпадает: ожидается {}, в заголовке {}",
                        hex::encode(*root), hex::encode(header.merkle_root))
        );
    }

    const Hash256 digest = header.hash();
    if (!meets_target(digest, target)) {
        verdict.reject(
            ErrorCode::PowInsufficient,
            std::format("Хеш заголовка {} больше target {}",
                        hex::encode(digest), target.to_hex())
        );
    }

    if (verdict.accepted()) {
        verdict.note(std::format("Merkle root: {}", hex::encode(*root)));
        verdict.note(std::format("Block hash: {}", hex::encode(digest)));
        verdict.note(std::format("Target:     {}", target.to_hex()));
    }
    return verdict;
}

} // namespace proofsmith::pow
