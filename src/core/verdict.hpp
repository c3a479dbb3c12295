/**
 * @file verdict.hpp
 * @brief Результат проверяющей операции
 *
 * Любая проверка (доказательство включения, заголовок, набор транзакций)
 * возвращает Verdict: принято/отклонено плюс структурированные причины.
 * Отказ проверки - ожидаемый исход, а не ошибка выполнения.
 */

#pragma once

#include "types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace proofsmith {

/**
 * @brief Исход проверки
 */
struct Verdict {
    /// @brief Причины отказа (пусто, если проверка пройдена)
    std::vector<Error> failures;

    /// @brief Информационные строки для отчёта ("Merkle root: ...")
    std::vector<std::string> details;

    /**
     * @brief Проверка пройдена?
     */
    [[nodiscard]] bool accepted() const noexcept {
        return failures.empty();
    }

    /**
     * @brief Добавить причину отказа
     */
    void reject(ErrorCode code, std::string message) {
        failures.emplace_back(code, std::move(message));
    }

    /**
     * @brief Добавить информационную строку
     */
    void note(std::string line) {
        details.push_back(std::move(line));
    }
};

} // namespace proofsmith
