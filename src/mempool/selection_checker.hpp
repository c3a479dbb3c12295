/**
 * @file selection_checker.hpp
 * @brief Проверка набора транзакций кандидата в блок
 *
 * Мемпул задаётся CSV файлом без заголовка:
 * @code
 * txid,fee,weight[,parent1;parent2;...]
 * @endcode
 *
 * Правила для кандидата (список txid в порядке блока):
 * 1. Блок не пуст
 * 2. Нет повторяющихся txid
 * 3. Каждый txid есть в мемпуле
 * 4. Суммарный вес не превышает лимит
 * 5. Каждый родитель включён в блок и стоит раньше потомка
 * 6. Требуемый txid (если задан) включён в блок
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "../core/verdict.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace proofsmith::mempool {

/**
 * @brief Запись мемпула
 */
struct MempoolEntry {
    std::string txid;
    int64_t fee{0};
    int64_t weight{0};
    std::vector<std::string> parents;
};

/**
 * @brief Мемпул: записи по txid (в нижнем регистре)
 */
class Mempool {
public:
    /**
     * @brief Добавить запись (повторный txid заменяет прежнюю)
     */
    void add(MempoolEntry entry);

    /**
     * @brief Найти запись
     *
     * @return Указатель на запись или nullptr
     */
    [[nodiscard]] const MempoolEntry* find(std::string_view txid) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    std::unordered_map<std::string, MempoolEntry> entries_;
};

/**
 * @brief Разобрать одну строку CSV мемпула
 *
 * @return Result<MempoolEntry> Запись или MalformedRecord
 */
[[nodiscard]] Result<MempoolEntry> parse_mempool_row(std::string_view row);

/**
 * @brief Загрузить мемпул из CSV файла
 *
 * @return Result<Mempool> Мемпул; IoError, EmptyInput или MalformedRecord
 *         с позицией "файл:строка"
 */
[[nodiscard]] Result<Mempool> load_mempool(const std::filesystem::path& path);

/**
 * @brief Прочитать список txid кандидата (пустой список допустим)
 */
[[nodiscard]] Result<std::vector<std::string>> load_selection(
    const std::filesystem::path& path
);

/**
 * @brief Проверить кандидата в блок
 *
 * Проверка останавливается на первом нарушенном правиле.
 *
 * @param pool Мемпул
 * @param selection txid в порядке блока (в нижнем регистре)
 * @param required Требуемый txid (std::nullopt - не проверять)
 * @param weight_limit Максимальный суммарный вес
 */
[[nodiscard]] Verdict check_selection(
    const Mempool& pool,
    std::span<const std::string> selection,
    const std::optional<std::string>& required,
    int64_t weight_limit = constants::DEFAULT_WEIGHT_LIMIT
);

} // namespace proofsmith::mempool
