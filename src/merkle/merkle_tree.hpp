/**
 * @file merkle_tree.hpp
 * @brief Построение Merkle дерева
 *
 * Правила:
 * - parent = SHA256(left || right), одинарный хеш от 64 байт
 * - уровень нечётного размера (> 1) дополняется копией последнего узла
 * - дополненный уровень определяет индексы родителей
 *
 * Дерево целиком не хранится: каждый следующий уровень строится
 * из предыдущего по требованию.
 */

#pragma once

#include "../core/types.hpp"

#include <cstddef>
#include <span>

namespace proofsmith::merkle {

/**
 * @brief Объединить два узла
 *
 * @param left Левый узел
 * @param right Правый узел
 * @return Hash256 SHA256(left || right)
 */
[[nodiscard]] Hash256 merkle_parent(const Hash256& left, const Hash256& right) noexcept;

/**
 * @brief Дополнить уровень по правилу дублирования
 *
 * @param level Уровень дерева
 * @return Level Копия уровня; при нечётном размере > 1 последний узел повторён
 */
[[nodiscard]] Level pad_level(std::span<const Hash256> level);

/**
 * @brief Построить следующий уровень
 *
 * @param level Текущий уровень (не пустой)
 * @return Level Родители попарно, слева направо
 */
[[nodiscard]] Level next_level(std::span<const Hash256> level);

/**
 * @brief Вычислить Merkle root
 *
 * Пустой список отклоняется до какого-либо хеширования.
 *
 * @param leaves Листья дерева
 * @return Result<Hash256> Корень или EmptyInput
 */
[[nodiscard]] Result<Hash256> compute_merkle_root(std::span<const Hash256> leaves);

/**
 * @brief Высота дерева (число раундов попарного хеширования)
 *
 * Совпадает с длиной доказательства включения: 0 для одного листа.
 *
 * @param leaf_count Количество листьев
 */
[[nodiscard]] std::size_t tree_height(std::size_t leaf_count) noexcept;

} // namespace proofsmith::merkle
