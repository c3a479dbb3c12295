/**
 * @file header_checker.hpp
 * @brief Проверка присланного заголовка блока
 *
 * Заголовок принимается, если:
 * 1. Его merkle_root совпадает с корнем, построенным по списку txid
 * 2. SHA256 заголовка <= target
 */

#pragma once

#include "../core/types.hpp"
#include "../core/verdict.hpp"
#include "../core/primitives/block_header.hpp"
#include "../core/primitives/uint256.hpp"

#include <span>

namespace proofsmith::pow {

/**
 * @brief Проверить заголовок против списка транзакций и target
 *
 * Проверяются оба условия; каждое нарушение записывается в вердикт.
 *
 * @param header Разобранный заголовок
 * @param leaves Листья дерева (coinbase уже добавлен, если он нужен)
 * @param target Декодированный target
 * @return Result<Verdict> Вердикт; EmptyInput при пустом списке листьев
 */
[[nodiscard]] Result<Verdict> check_header(
    const core::BlockHeader& header,
    std::span<const Hash256> leaves,
    const core::uint256& target
);

} // namespace proofsmith::pow
