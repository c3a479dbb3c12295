/**
 * @file proof.hpp
 * @brief Доказательство включения (Merkle proof)
 *
 * Доказательство - список sibling'ов от листа к корню. Ориентация
 * определяется индексом узла на каждом уровне:
 * - последний узел нечётного уровня: sibling = сам узел, parent = H(node || node)
 * - иначе sibling = level[i ^ 1]; чётный i - узел слева, нечётный - справа
 */

#pragma once

#include "../core/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace proofsmith::merkle {

/**
 * @brief Доказательство включения листа
 */
struct InclusionProof {
    /// @brief Корень дерева
    Hash256 root{};

    /// @brief Sibling'и от листа к корню
    std::vector<Hash256> siblings;

    /// @brief Индекс листа в исходном списке
    std::size_t leaf_index{0};
};

/**
 * @brief Подъём от листа к корню по уровням дерева
 *
 * Хранит текущий уровень целиком: следующий уровень строится из полного
 * уровня, а не только из отслеживаемого узла. На каждом шаге родитель,
 * вычисленный по правилу ориентации, сверяется с узлом перестроенного
 * уровня; расхождение - ConsistencyError.
 *
 * Используется и генератором, и верификатором (режим Replay).
 */
class ProofWalker {
public:
    /**
     * @brief Начать подъём от листа
     *
     * @param leaves Все листья дерева (не пустой список)
     * @param index Индекс отслеживаемого листа (< leaves.size())
     */
    ProofWalker(std::span<const Hash256> leaves, std::size_t index);

    /**
     * @brief Достигнут ли корень (уровень из одного узла)
     */
    [[nodiscard]] bool at_root() const noexcept { return level_.size() == 1; }

    /**
     * @brief Истинный sibling текущего узла
     *
     * @pre !at_root()
     */
    [[nodiscard]] const Hash256& sibling() const noexcept;

    /**
     * @brief Подняться на уровень выше
     *
     * @param sibling Sibling, с которым объединяется текущий узел
     * @throws ConsistencyError если родитель не совпал с перестроенным уровнем
     */
    void ascend(const Hash256& sibling);

    /**
     * @brief Текущий узел (на корневом уровне - корень)
     */
    [[nodiscard]] const Hash256& node() const noexcept { return node_; }

    /**
     * @brief Индекс текущего узла в его уровне
     */
    [[nodiscard]] std::size_t index() const noexcept { return index_; }

    /**
     * @brief Номер текущего уровня (0 - листья)
     */
    [[nodiscard]] std::size_t depth() const noexcept { return depth_; }

private:
    Level level_;
    std::size_t index_;
    std::size_t depth_{0};
    Hash256 node_;
};

/**
 * @brief Найти первое вхождение значения в списке листьев
 */
[[nodiscard]] std::optional<std::size_t> find_leaf(
    std::span<const Hash256> leaves,
    const Hash256& value
) noexcept;

/**
 * @brief Построить доказательство для листа по индексу
 *
 * @param leaves Листья дерева
 * @param index Индекс листа
 * @return Result<InclusionProof> Доказательство, EmptyInput или TargetNotFound
 */
[[nodiscard]] Result<InclusionProof> build_inclusion_proof(
    std::span<const Hash256> leaves,
    std::size_t index
);

/**
 * @brief Построить доказательство для листа по значению
 *
 * @param leaves Листья дерева
 * @param target Значение листа (первое вхождение)
 * @return Result<InclusionProof> Доказательство, EmptyInput или TargetNotFound
 */
[[nodiscard]] Result<InclusionProof> build_inclusion_proof(
    std::span<const Hash256> leaves,
    const Hash256& target
);

} // namespace proofsmith::merkle
