/**
 * @file merkle_tree.cpp
 * @brief Реализация построения Merkle дерева
 */

#include "merkle_tree.hpp"
#include "../crypto/sha256.hpp"

#include <cstring>

namespace proofsmith::merkle {

Hash256 merkle_parent(const Hash256& left, const Hash256& right) noexcept {
    std::array<uint8_t, 64> combined;
    std::memcpy(combined.data(), left.data(), 32);
    std::memcpy(combined.data() + 32, right.data(), 32);
    return crypto::sha256(combined);
}

Level pad_level(std::span<const Hash256> level) {
    Level padded(level.begin(), level.end());
    if (padded.size() > 1 && padded.size() % 2 != 0) {
        padded.push_back(padded.back());
    }
    return padded;
}

Level next_level(std::span<const Hash256> level) {
    Level padded = pad_level(level);

    Level parents;
    parents.reserve(padded.size() / 2);
    for (std::size_t i = 0; i + 1 < padded.size(); i += 2) {
        parents.push_back(merkle_parent(padded[i], padded[i + 1]));
    }
    return parents;
}

Result<Hash256> compute_merkle_root(std::span<const Hash256> leaves) {
    if (leaves.empty()) {
        return Err<Hash256>(
            ErrorCode::EmptyInput,
            "Невозможно вычислить Merkle root пустого списка"
        );
    }

    Level level(leaves.begin(), leaves.end());
    while (level.size() > 1) {
        level = next_level(level);
    }
    return level.front();
}

std::size_t tree_height(std::size_t leaf_count) noexcept {
    std::size_t height = 0;
    while (leaf_count > 1) {
        leaf_count = (leaf_count + 1) / 2;
        ++height;
    }
    return height;
}

} // namespace proofsmith::merkle
