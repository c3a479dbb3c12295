/**
 * @file verifier.cpp
 * @brief Реализация верификатора доказательства включения
 */

#include "verifier.hpp"
#include "merkle_tree.hpp"
#include "proof.hpp"
#include "../core/hex.hpp"
#include "../crypto/sha256.hpp"

#include <algorithm>
#include <format>

namespace proofsmith::merkle {

// =============================================================================
// Фабрики
// =============================================================================

Verifier Verifier::replay(std::vector<Hash256> leaves, const Hash256& target) {
    Verifier verifier(VerifyMode::Replay);
    verifier.leaves_ = std::move(leaves);
    verifier.target_ = target;
    return verifier;
}

Verifier Verifier::committed(std::vector<Hash256> reference_digests) {
    Verifier verifier(VerifyMode::CommittedDigest);
    verifier.references_ = std::move(reference_digests);
    return verifier;
}

Result<Verdict> Verifier::verify(const ProofClaim& claim) const {
    switch (mode_) {
        case VerifyMode::Replay:
            return verify_replay(claim);
        case VerifyMode::CommittedDigest:
            return verify_committed(claim);
    }
    return Err<Verdict>(ErrorCode::ConfigInvalidValue, "Неизвестный режим проверки");
}

// =============================================================================
// Режим Replay
// =============================================================================

Result<Verdict> Verifier::verify_replay(const ProofClaim& claim) const {
    if (leaves_.empty()) {
        return Err<Verdict>(ErrorCode::EmptyInput, "Список txid пуст");
    }

    auto index = find_leaf(leaves_, target_);
    if (!index) {
        return Err<Verdict>(
            ErrorCode::TargetNotFound,
            std::format("Требуемый txid не найден в списке блока: {}",
                        hex::encode(target_))
        );
    }

    Verdict verdict;
    ProofWalker walker(leaves_, *index);

    for (std::size_t step = 0; step < claim.siblings.size(); ++step) {
        if (walker.at_root()) {
            // Позиция в файле: строка 1 - корень, sibling'и с 2-й строки
            verdict.reject(
                ErrorCode::ProofTooLong,
                std::format("Доказательство содержит лишние элементы после корня "
                            "(первый лишний: позиция {}, строка {})",
                            step, step + 2)
            );
            return verdict;
        }

        const Hash256& submitted = claim.siblings[step];
        const Hash256& expected = walker.sibling();
        if (submitted != expected) {
            verdict.reject(
                ErrorCode::ProofMismatch,
                std::format("Несовпадение доказательства на уровне {}.\n"
                            "Ожидался sibling: {}\n"
                            "Получен         : {}",
                            step, hex::encode(expected), hex::encode(submitted))
            );
            return verdict;
        }

        walker.ascend(submitted);
    }

    // Полный пересчёт нужен и для сообщения, и для сверки
    Hash256 full_root = *compute_merkle_root(leaves_);

    if (!walker.at_root()) {
        verdict.reject(
            ErrorCode::ProofTooShort,
            std::format("Доказательство слишком короткое: для этой высоты дерева "
                        "ожидается {} sibling(ов), получено {}.\n"
                        "Полный корень: {}",
                        tree_height(leaves_.size()), claim.siblings.size(),
                        hex::encode(full_root))
        );
        return verdict;
    }

    // Все sibling'и уже совпали с истинными: расхождение с полным пересчётом
    // означает дефект проверяющего кода, а не ответа. Неверный присланный
    // корень ниже даёт RootMismatch.
    const Hash256& computed = walker.node();
    if (computed != full_root) {
        throw ConsistencyError(std::format(
            "Корень по пути доказательства {} не совпал с полным пересчётом {}",
            hex::encode(computed), hex::encode(full_root)
        ));
    }

    if (claim.root != computed) {
        verdict.reject(
            ErrorCode::RootMismatch,
            std::format("Merkle root не совпадает.\n"
                        "Ожидался: {}\n"
                        "Получен : {}",
                        hex::encode(computed), hex::encode(claim.root))
        );
        return verdict;
    }

    verdict.note(std::format("Merkle root: {}", hex::encode(computed)));
    verdict.note(std::format("Проверено уровней: {}", walker.depth()));
    return verdict;
}

// =============================================================================
// Режим CommittedDigest
// =============================================================================

Result<Verdict> Verifier::verify_committed(const ProofClaim& claim) const {
    if (references_.empty()) {
        return Err<Verdict>(
            ErrorCode::EmptyInput,
            "Список опубликованных дайджестов пуст"
        );
    }

    Verdict verdict;

    if (commit_digest(claim.root) != references_.front()) {
        verdict.reject(
            ErrorCode::RootMismatch,
            std::format("Дайджест корня не совпадает (корень {})",
                        hex::encode(claim.root))
        );
    }

    const std::size_t expected_len = references_.size() - 1;
    const std::size_t got_len = claim.siblings.size();

    if (got_len < expected_len) {
        verdict.reject(
            ErrorCode::ProofTooShort,
            std::format("Длина доказательства {}, ожидается {}", got_len, expected_len)
        );
    } else if (got_len > expected_len) {
        verdict.reject(
            ErrorCode::ProofTooLong,
            std::format("Длина доказательства {}, ожидается {}", got_len, expected_len)
        );
    }

    // Каждая позиция проверяется независимо, без раннего выхода
    const std::size_t common = std::min(expected_len, got_len);
    for (std::size_t i = 0; i < common; ++i) {
        if (commit_digest(claim.siblings[i]) != references_[i + 1]) {
            verdict.reject(
                ErrorCode::DigestMismatch,
                std::format("Позиция {}: дайджест sibling'а {} не совпадает",
                            i, hex::encode(claim.siblings[i]))
            );
        }
    }

    if (verdict.accepted()) {
        verdict.note(std::format("Merkle root: {}", hex::encode(claim.root)));
        verdict.note(std::format("Проверено позиций: {}", common));
    }
    return verdict;
}

// =============================================================================
// Committed digest
// =============================================================================

Hash256 commit_digest(const Hash256& value) noexcept {
    return crypto::sha256(value);
}

std::vector<Hash256> commit_reference(
    const Hash256& root,
    std::span<const Hash256> siblings
) {
    std::vector<Hash256> refs;
    refs.reserve(siblings.size() + 1);
    refs.push_back(commit_digest(root));
    for (const auto& sibling : siblings) {
        refs.push_back(commit_digest(sibling));
    }
    return refs;
}

} // namespace proofsmith::merkle
