/**
 * @file proof.cpp
 * @brief Реализация генератора доказательства включения
 */

#include "proof.hpp"
#include "merkle_tree.hpp"
#include "../core/hex.hpp"

#include <algorithm>
#include <format>

namespace proofsmith::merkle {

// =============================================================================
// ProofWalker
// =============================================================================

ProofWalker::ProofWalker(std::span<const Hash256> leaves, std::size_t index)
    : level_(leaves.begin(), leaves.end())
    , index_(index)
    , node_(leaves[index]) {}

const Hash256& ProofWalker::sibling() const noexcept {
    // Последний узел нечётного уровня объединяется сам с собой
    if (level_.size() % 2 != 0 && index_ == level_.size() - 1) {
        return level_[index_];
    }
    return level_[index_ ^ 1];
}

void ProofWalker::ascend(const Hash256& sibling) {
    Hash256 parent = (index_ % 2 == 0)
        ? merkle_parent(node_, sibling)
        : merkle_parent(sibling, node_);

    Level parents = next_level(level_);
    std::size_t parent_index = index_ / 2;

    if (parent_index >= parents.size() || parents[parent_index] != parent) {
        throw ConsistencyError(std::format(
            "Родитель на уровне {} (индекс {}) не совпал с перестроенным уровнем",
            depth_ + 1, parent_index
        ));
    }

    level_ = std::move(parents);
    index_ = parent_index;
    node_ = parent;
    ++depth_;
}

// =============================================================================
// Генератор
// =============================================================================

std::optional<std::size_t> find_leaf(
    std::span<const Hash256> leaves,
    const Hash256& value
) noexcept {
    auto it = std::find(leaves.begin(), leaves.end(), value);
    if (it == leaves.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(leaves.begin(), it));
}

Result<InclusionProof> build_inclusion_proof(
    std::span<const Hash256> leaves,
    std::size_t index
) {
    if (leaves.empty()) {
        return Err<InclusionProof>(
            ErrorCode::EmptyInput,
            "Невозможно построить доказательство для пустого списка"
        );
    }
    if (index >= leaves.size()) {
        return Err<InclusionProof>(
            ErrorCode::TargetNotFound,
            std::format("Индекс листа {} вне списка из {} элементов",
                        index, leaves.size())
        );
    }

    InclusionProof proof;
    proof.leaf_index = index;
    proof.siblings.reserve(tree_height(leaves.size()));

    ProofWalker walker(leaves, index);
    while (!walker.at_root()) {
        Hash256 sibling = walker.sibling();
        proof.siblings.push_back(sibling);
        walker.ascend(sibling);
    }
    proof.root = walker.node();

    return proof;
}

Result<InclusionProof> build_inclusion_proof(
    std::span<const Hash256> leaves,
    const Hash256& target
) {
    if (leaves.empty()) {
        return Err<InclusionProof>(
            ErrorCode::EmptyInput,
            "Невозможно построить доказательство для пустого списка"
        );
    }

    auto index = find_leaf(leaves, target);
    if (!index) {
        return Err<InclusionProof>(
            ErrorCode::TargetNotFound,
            std::format("Требуемый txid не найден в списке: {}", hex::encode(target))
        );
    }
    return build_inclusion_proof(leaves, *index);
}

} // namespace proofsmith::merkle
