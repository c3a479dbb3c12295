/**
 * @file selection_checker.cpp
 * @brief Реализация проверки кандидата в блок
 */

#include "selection_checker.hpp"
#include "../core/hex.hpp"
#include "../io/files.hpp"

#include <charconv>
#include <format>
#include <unordered_set>

namespace proofsmith::mempool {

namespace {

/**
 * @brief Разбить строку по разделителю (пустые части сохраняются)
 */
[[nodiscard]] std::vector<std::string_view> split(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

[[nodiscard]] std::optional<int64_t> parse_int(std::string_view text) {
    std::string trimmed = hex::normalize(text);
    int64_t value = 0;
    const char* first = trimmed.data();
    const char* last = trimmed.data() + trimmed.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (trimmed.empty() || ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

// =============================================================================
// Mempool
// =============================================================================

void Mempool::add(MempoolEntry entry) {
    std::string key = entry.txid;
    entries_.insert_or_assign(std::move(key), std::move(entry));
}

const MempoolEntry* Mempool::find(std::string_view txid) const {
    auto it = entries_.find(std::string(txid));
    return it != entries_.end() ? &it->second : nullptr;
}

// =============================================================================
// Загрузка
// =============================================================================

Result<MempoolEntry> parse_mempool_row(std::string_view row) {
    auto columns = split(row, ',');
    if (columns.size() < 3) {
        return Err<MempoolEntry>(
            ErrorCode::MalformedRecord,
            "ожидается минимум 3 колонки (txid,fee,weight[,parents])"
        );
    }

    MempoolEntry entry;
    entry.txid = hex::normalize(columns[0]);
    if (entry.txid.empty()) {
        return Err<MempoolEntry>(ErrorCode::MalformedRecord, "пустой txid");
    }

    auto fee = parse_int(columns[1]);
    auto weight = parse_int(columns[2]);
    if (!fee || !weight) {
        return Err<MempoolEntry>(
            ErrorCode::MalformedRecord,
            std::format("некорректные fee/weight: fee='{}', weight='{}'",
                        columns[1], columns[2])
        );
    }
    if (*weight < 0) {
        return Err<MempoolEntry>(
            ErrorCode::MalformedRecord,
            std::format("отрицательный weight: {}", *weight)
        );
    }
    entry.fee = *fee;
    entry.weight = *weight;

    if (columns.size() >= 4) {
        for (auto parent : split(columns[3], ';')) {
            std::string id = hex::normalize(parent);
            if (!id.empty()) {
                entry.parents.push_back(std::move(id));
            }
        }
    }
    return entry;
}

Result<Mempool> load_mempool(const std::filesystem::path& path) {
    auto lines = io::read_lines(path);
    if (!lines) {
        return std::unexpected(lines.error());
    }

    Mempool pool;
    for (const auto& line : *lines) {
        auto entry = parse_mempool_row(line.text);
        if (!entry) {
            return Err<Mempool>(
                entry.error().code,
                std::format("{}:{}: {}", path.string(), line.number, entry.error().message)
            );
        }
        pool.add(std::move(*entry));
    }

    if (pool.empty()) {
        return Err<Mempool>(
            ErrorCode::EmptyInput,
            std::format("{}: мемпул пуст", path.string())
        );
    }
    return pool;
}

Result<std::vector<std::string>> load_selection(const std::filesystem::path& path) {
    auto lines = io::read_lines(path);
    if (!lines) {
        return std::unexpected(lines.error());
    }

    std::vector<std::string> selection;
    selection.reserve(lines->size());
    for (auto& line : *lines) {
        selection.push_back(std::move(line.text));
    }
    return selection;
}

// =============================================================================
// Проверка
// =============================================================================

Verdict check_selection(
    const Mempool& pool,
    std::span<const std::string> selection,
    const std::optional<std::string>& required,
    int64_t weight_limit
) {
    Verdict verdict;

    if (selection.empty()) {
        verdict.reject(ErrorCode::SelectionRejected, "Блок не может быть пустым");
        return verdict;
    }

    // 1. Уникальность
    std::unordered_set<std::string_view> seen;
    for (const auto& txid : selection) {
        if (!seen.insert(txid).second) {
            verdict.reject(
                ErrorCode::SelectionRejected,
                std::format("Повторяющийся txid: {}", txid)
            );
            return verdict;
        }
    }

    // 2. Наличие в мемпуле
    std::size_t missing = 0;
    const std::string* first_missing = nullptr;
    for (const auto& txid : selection) {
        if (pool.find(txid) == nullptr) {
            if (missing == 0) {
                first_missing = &txid;
            }
            ++missing;
        }
    }
    if (missing > 0) {
        verdict.reject(
            ErrorCode::SelectionRejected,
            std::format("{} txid не найдено в мемпуле (первый: {})",
                        missing, *first_missing)
        );
        return verdict;
    }

    // 3. Лимит веса; сумма не выходит за [0, weight_limit]
    int64_t total_weight = 0;
    for (const auto& txid : selection) {
        const int64_t weight = pool.find(txid)->weight;
        if (weight < 0) {
            verdict.reject(
                ErrorCode::SelectionRejected,
                std::format("Отрицательный вес {} у транзакции {}", weight, txid)
            );
            return verdict;
        }
        if (weight > weight_limit - total_weight) {
            verdict.reject(
                ErrorCode::SelectionRejected,
                std::format("Суммарный вес превышает лимит {} на транзакции {} "
                            "(набрано {}, вес {})", weight_limit, txid, total_weight, weight)
            );
            return verdict;
        }
        total_weight += weight;
    }

    // 4. Родители включены и стоят раньше
    std::unordered_map<std::string_view, std::size_t> position;
    for (std::size_t i = 0; i < selection.size(); ++i) {
        position.emplace(selection[i], i);
    }
    for (std::size_t i = 0; i < selection.size(); ++i) {
        for (const auto& parent : pool.find(selection[i])->parents) {
            auto it = position.find(parent);
            if (it == position.end()) {
                verdict.reject(
                    ErrorCode::SelectionRejected,
                    std::format("Родитель {} транзакции {} не включён в блок",
                                parent, selection[i])
                );
                return verdict;
            }
            if (it->second >= i) {
                verdict.reject(
                    ErrorCode::SelectionRejected,
                    std::format("Родитель {} транзакции {} стоит на позиции {}, "
                                "не раньше потомка на позиции {}",
                                parent, selection[i], it->second, i)
                );
                return verdict;
            }
        }
    }

    // 5. Требуемый txid
    if (required && !position.contains(*required)) {
        verdict.reject(
            ErrorCode::SelectionRejected,
            std::format("Требуемый txid не найден в блоке: {}", *required)
        );
        return verdict;
    }

    verdict.note(std::format("Tx count: {}", selection.size()));
    verdict.note(std::format("Total weight: {}", total_weight));
    return verdict;
}

} // namespace proofsmith::mempool
