/**
 * @file files.hpp
 * @brief Чтение и запись текстовых файлов proofsmith
 *
 * Все форматы построчные:
 * - Список txid: по одному hex идентификатору (64 символа) на строку
 * - Доказательство: строка 1 - корень, далее sibling'и от листа к корню
 * - Опубликованные дайджесты: строка 1 - SHA256 корня, далее SHA256 sibling'ов
 * - Заголовок: одна строка из 160 hex символов
 *
 * Пробелы по краям строк и пустые строки игнорируются, hex приводится к
 * нижнему регистру. Ошибки формата указывают "файл:строка".
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/block_header.hpp"
#include "../merkle/verifier.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace proofsmith::io {

/**
 * @brief Непустая строка файла с номером (нумерация с 1)
 */
struct TextLine {
    std::size_t number{0};
    std::string text;
};

// =============================================================================
// Чтение
// =============================================================================

/**
 * @brief Прочитать непустые строки файла (обрезанные, в нижнем регистре)
 *
 * @return Result<std::vector<TextLine>> Строки или IoError
 */
[[nodiscard]] Result<std::vector<TextLine>> read_lines(const std::filesystem::path& path);

/**
 * @brief Прочитать список txid
 *
 * @return Result<std::vector<Hash256>> Листья; EmptyInput для пустого файла,
 *         InvalidHex / Length с позицией "файл:строка"
 */
[[nodiscard]] Result<std::vector<Hash256>> read_leaf_list(const std::filesystem::path& path);

/**
 * @brief Прочитать файл доказательства (корень + sibling'и)
 */
[[nodiscard]] Result<merkle::ProofClaim> read_proof(const std::filesystem::path& path);

/**
 * @brief Прочитать файл опубликованных дайджестов
 */
[[nodiscard]] Result<std::vector<Hash256>> read_reference_digests(
    const std::filesystem::path& path
);

/**
 * @brief Прочитать файл заголовка (первая непустая строка)
 */
[[nodiscard]] Result<core::BlockHeader> read_header(const std::filesystem::path& path);

/**
 * @brief Первая непустая строка необязательного файла
 *
 * @return std::nullopt, если файла нет или в нём нет непустых строк
 */
[[nodiscard]] Result<std::optional<TextLine>> read_first_line(
    const std::filesystem::path& path
);

/**
 * @brief Прочитать txid coinbase из необязательного файла
 *
 * @return std::nullopt, если файла нет
 */
[[nodiscard]] Result<std::optional<Hash256>> read_coinbase_txid(
    const std::filesystem::path& path
);

/**
 * @brief Добавить coinbase в начало списка (если он задан)
 */
[[nodiscard]] std::vector<Hash256> prepend_coinbase(
    std::vector<Hash256> leaves,
    const std::optional<Hash256>& coinbase
);

/**
 * @brief Листья заголовка блока: список txid и необязательный coinbase
 *
 * Coinbase из первой непустой строки coinbase_path ставится первым листом.
 * Используется только при построении и проверке заголовка; деревья для
 * доказательств включения строятся по read_leaf_list.
 *
 * @param coinbase_path Файл coinbase; std::nullopt - не добавлять
 */
[[nodiscard]] Result<std::vector<Hash256>> read_block_leaves(
    const std::filesystem::path& leaf_list,
    const std::optional<std::filesystem::path>& coinbase_path
);

// =============================================================================
// Запись
// =============================================================================

/**
 * @brief Записать доказательство: корень, затем sibling'и
 */
[[nodiscard]] Result<void> write_proof(
    const std::filesystem::path& path,
    const Hash256& root,
    std::span<const Hash256> siblings
);

/**
 * @brief Записать список значений по одному на строку
 *
 * Используется для файла опубликованных дайджестов и списков txid.
 */
[[nodiscard]] Result<void> write_hash_list(
    const std::filesystem::path& path,
    std::span<const Hash256> values
);

/**
 * @brief Записать заголовок одной hex строкой
 */
[[nodiscard]] Result<void> write_header(
    const std::filesystem::path& path,
    const core::BlockHeader& header
);

} // namespace proofsmith::io
