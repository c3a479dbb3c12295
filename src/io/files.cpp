/**
 * @file files.cpp
 * @brief Реализация чтения и записи файлов
 */

#include "files.hpp"
#include "../core/hex.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <system_error>

namespace proofsmith::io {

namespace fs = std::filesystem;

namespace {

/**
 * @brief Добавить к ошибке позицию "файл:строка"
 */
[[nodiscard]] Error at(const fs::path& path, std::size_t line, const Error& error) {
    return Error{error.code, std::format("{}:{}: {}", path.string(), line, error.message)};
}

/**
 * @brief Разобрать строки как 32-байтные значения
 */
[[nodiscard]] Result<std::vector<Hash256>> parse_hashes(
    const fs::path& path,
    std::span<const TextLine> lines,
    std::string_view what
) {
    std::vector<Hash256> values;
    values.reserve(lines.size());
    for (const auto& line : lines) {
        auto value = hex::decode_hash(line.text, what);
        if (!value) {
            return std::unexpected(at(path, line.number, value.error()));
        }
        values.push_back(*value);
    }
    return values;
}

/**
 * @brief Открыть файл на запись, создав родительские директории
 */
[[nodiscard]] Result<std::ofstream> open_for_write(const fs::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err<std::ofstream>(
                ErrorCode::IoError,
                std::format("Не удалось создать директорию {}: {}",
                            path.parent_path().string(), ec.message())
            );
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Err<std::ofstream>(
            ErrorCode::IoError,
            std::format("Не удалось открыть файл на запись: {}", path.string())
        );
    }
    return out;
}

[[nodiscard]] Result<void> finish(std::ofstream& out, const fs::path& path) {
    out.flush();
    if (!out) {
        return Err<void>(
            ErrorCode::IoError,
            std::format("Ошибка записи в файл: {}", path.string())
        );
    }
    return {};
}

} // anonymous namespace

// =============================================================================
// Чтение
// =============================================================================

Result<std::vector<TextLine>> read_lines(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<std::vector<TextLine>>(
            ErrorCode::IoError,
            std::format("Не удалось открыть файл: {}", path.string())
        );
    }

    std::vector<TextLine> lines;
    std::string raw;
    std::size_t number = 0;
    while (std::getline(in, raw)) {
        ++number;
        std::string text = hex::normalize(raw);
        if (!text.empty()) {
            lines.push_back(TextLine{number, std::move(text)});
        }
    }
    if (in.bad()) {
        return Err<std::vector<TextLine>>(
            ErrorCode::IoError,
            std::format("Ошибка чтения файла: {}", path.string())
        );
    }
    return lines;
}

Result<std::vector<Hash256>> read_leaf_list(const fs::path& path) {
    auto lines = read_lines(path);
    if (!lines) {
        return std::unexpected(lines.error());
    }
    if (lines->empty()) {
        return Err<std::vector<Hash256>>(
            ErrorCode::EmptyInput,
            std::format("{}: список txid пуст", path.string())
        );
    }
    return parse_hashes(path, *lines, "txid");
}

Result<merkle::ProofClaim> read_proof(const fs::path& path) {
    auto lines = read_lines(path);
    if (!lines) {
        return std::unexpected(lines.error());
    }
    if (lines->empty()) {
        return Err<merkle::ProofClaim>(
            ErrorCode::EmptyInput,
            std::format("{}: файл доказательства пуст", path.string())
        );
    }

    const TextLine& first = lines->front();
    auto root = hex::decode_hash(first.text, "merkle root");
    if (!root) {
        return std::unexpected(at(path, first.number, root.error()));
    }

    auto siblings = parse_hashes(
        path, std::span<const TextLine>(*lines).subspan(1), "sibling");
    if (!siblings) {
        return std::unexpected(siblings.error());
    }

    return merkle::ProofClaim{*root, std::move(*siblings)};
}

Result<std::vector<Hash256>> read_reference_digests(const fs::path& path) {
    auto lines = read_lines(path);
    if (!lines) {
        return std::unexpected(lines.error());
    }
    if (lines->empty()) {
        return Err<std::vector<Hash256>>(
            ErrorCode::EmptyInput,
            std::format("{}: файл дайджестов пуст", path.string())
        );
    }
    return parse_hashes(path, *lines, "digest");
}

Result<core::BlockHeader> read_header(const fs::path& path) {
    auto lines = read_lines(path);
    if (!lines) {
        return std::unexpected(lines.error());
    }
    if (lines->empty()) {
        return Err<core::BlockHeader>(
            ErrorCode::EmptyInput,
            std::format("{}: файл заголовка пуст", path.string())
        );
    }

    const TextLine& first = lines->front();
    auto header = core::BlockHeader::from_hex(first.text);
    if (!header) {
        return std::unexpected(at(path, first.number, header.error()));
    }
    return *header;
}

Result<std::optional<TextLine>> read_first_line(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::optional<TextLine>{};
    }

    auto lines = read_lines(path);
    if (!lines) {
        return std::unexpected(lines.error());
    }
    if (lines->empty()) {
        return std::optional<TextLine>{};
    }
    return std::optional<TextLine>{lines->front()};
}

Result<std::optional<Hash256>> read_coinbase_txid(const fs::path& path) {
    auto line = read_first_line(path);
    if (!line) {
        return std::unexpected(line.error());
    }
    if (!line->has_value()) {
        return std::optional<Hash256>{};
    }

    auto txid = hex::decode_hash((*line)->text, "coinbase txid");
    if (!txid) {
        return std::unexpected(at(path, (*line)->number, txid.error()));
    }
    return std::optional<Hash256>{*txid};
}

std::vector<Hash256> prepend_coinbase(
    std::vector<Hash256> leaves,
    const std::optional<Hash256>& coinbase
) {
    if (coinbase) {
        leaves.insert(leaves.begin(), *coinbase);
    }
    return leaves;
}

Result<std::vector<Hash256>> read_block_leaves(
    const fs::path& leaf_list,
    const std::optional<fs::path>& coinbase_path
) {
    auto leaves = read_leaf_list(leaf_list);
    if (!leaves || !coinbase_path) {
        return leaves;
    }

    auto coinbase = read_coinbase_txid(*coinbase_path);
    if (!coinbase) {
        return std::unexpected(coinbase.error());
    }
    return prepend_coinbase(std::move(*leaves), *coinbase);
}

// =============================================================================
// Запись
// =============================================================================

Result<void> write_proof(
    const fs::path& path,
    const Hash256& root,
    std::span<const Hash256> siblings
) {
    auto out = open_for_write(path);
    if (!out) {
        return std::unexpected(out.error());
    }

    *out << hex::encode(root) << '\n';
    for (const auto& sibling : siblings) {
        *out << hex::encode(sibling) << '\n';
    }
    return finish(*out, path);
}

Result<void> write_hash_list(
    const fs::path& path,
    std::span<const Hash256> values
) {
    auto out = open_for_write(path);
    if (!out) {
        return std::unexpected(out.error());
    }

    for (const auto& value : values) {
        *out << hex::encode(value) << '\n';
    }
    return finish(*out, path);
}

Result<void> write_header(const fs::path& path, const core::BlockHeader& header) {
    auto out = open_for_write(path);
    if (!out) {
        return std::unexpected(out.error());
    }

    *out << header.to_hex() << '\n';
    return finish(*out, path);
}

} // namespace proofsmith::io
