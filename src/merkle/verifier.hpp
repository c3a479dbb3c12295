/**
 * @file verifier.hpp
 * @brief Проверка доказательства включения
 *
 * Два режима за одним интерфейсом Verifier:
 *
 * 1. Replay (прозрачная проверка): верификатор знает все листья,
 *    повторяет подъём от листа к корню и сравнивает каждый присланный
 *    sibling с истинным. Останавливается на первом отказе и сообщает
 *    полный контекст (уровень, ожидаемое и присланное значение).
 *
 * 2. CommittedDigest (проверка без раскрытия ответа): верификатор
 *    знает только SHA256 от правильного корня и от каждого правильного
 *    sibling'а. Проверяются все позиции, в отчёт попадает каждая
 *    несовпавшая.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/verdict.hpp"

#include <span>
#include <string_view>
#include <vector>

namespace proofsmith::merkle {

/**
 * @brief Режим проверки
 */
enum class VerifyMode {
    Replay,           ///< Повтор по авторитетному списку листьев
    CommittedDigest   ///< Сравнение дайджестов присланных значений
};

/**
 * @brief Название режима для логов
 */
[[nodiscard]] constexpr std::string_view to_string(VerifyMode mode) noexcept {
    switch (mode) {
        case VerifyMode::Replay: return "replay";
        case VerifyMode::CommittedDigest: return "committed-digest";
    }
    return "unknown";
}

/**
 * @brief Присланный на проверку ответ
 */
struct ProofClaim {
    /// @brief Заявленный корень
    Hash256 root{};

    /// @brief Заявленные sibling'и от листа к корню
    std::vector<Hash256> siblings;
};

/**
 * @brief Верификатор доказательства включения
 *
 * @code
 * auto verifier = merkle::Verifier::replay(leaves, required_txid);
 * auto verdict = verifier.verify(claim);
 * if (verdict && verdict->accepted()) { ... }
 * @endcode
 */
class Verifier {
public:
    /**
     * @brief Верификатор с авторитетным списком листьев
     *
     * @param leaves Листья дерева в порядке блока
     * @param target Значение листа, для которого прислано доказательство
     */
    [[nodiscard]] static Verifier replay(std::vector<Hash256> leaves, const Hash256& target);

    /**
     * @brief Верификатор с опубликованными дайджестами
     *
     * @param reference_digests SHA256 корня, затем SHA256 каждого sibling'а
     */
    [[nodiscard]] static Verifier committed(std::vector<Hash256> reference_digests);

    /**
     * @brief Режим верификатора
     */
    [[nodiscard]] VerifyMode mode() const noexcept { return mode_; }

    /**
     * @brief Проверить присланный ответ
     *
     * @param claim Корень и sibling'и
     * @return Result<Verdict> Вердикт; ошибка, если проверку нельзя
     *         провести (пустой ввод, лист не найден)
     * @throws ConsistencyError при внутреннем противоречии (режим Replay)
     */
    [[nodiscard]] Result<Verdict> verify(const ProofClaim& claim) const;

private:
    explicit Verifier(VerifyMode mode) noexcept : mode_(mode) {}

    [[nodiscard]] Result<Verdict> verify_replay(const ProofClaim& claim) const;
    [[nodiscard]] Result<Verdict> verify_committed(const ProofClaim& claim) const;

    VerifyMode mode_;
    std::vector<Hash256> leaves_;
    Hash256 target_{};
    std::vector<Hash256> references_;
};

// =============================================================================
// Committed digest
// =============================================================================

/**
 * @brief Дайджест значения для публикации: SHA256 от 32 байт
 */
[[nodiscard]] Hash256 commit_digest(const Hash256& value) noexcept;

/**
 * @brief Построить список дайджестов для режима CommittedDigest
 *
 * @param root Правильный корень
 * @param siblings Правильные sibling'и от листа к корню
 * @return std::vector<Hash256> Дайджест корня, затем дайджесты sibling'ов
 */
[[nodiscard]] std::vector<Hash256> commit_reference(
    const Hash256& root,
    std::span<const Hash256> siblings
);

} // namespace proofsmith::merkle
