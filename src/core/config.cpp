/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "hex.hpp"
#include "../io/files.hpp"

#include <toml++/toml.hpp>
#include <cstdlib>
#include <format>
#include <utility>
#include <vector>

namespace proofsmith {

namespace {

/**
 * @brief Прочитать целое и проверить, что оно помещается в T
 */
template<typename T>
[[nodiscard]] Result<void> read_integer(
    const toml::table& section,
    std::string_view section_name,
    std::string_view key,
    T& out
) {
    auto val = section[key].value<int64_t>();
    if (!val) {
        return {};
    }
    if (!std::in_range<T>(*val)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("{}.{}: значение {} вне допустимого диапазона",
                        section_name, key, *val)
        );
    }
    out = static_cast<T>(*val);
    return {};
}

/**
 * @brief Построить Config из разобранной TOML таблицы
 */
[[nodiscard]] Result<Config> from_table(const toml::table& table) {
    Config config;

    // === Секция [paths] ===
    if (auto paths = table["paths"].as_table()) {
        auto read_path = [&](std::string_view key, std::filesystem::path& out) {
            if (auto val = (*paths)[key].value<std::string>()) {
                out = *val;
            }
        };
        read_path("leaf_list", config.paths.leaf_list);
        read_path("proof", config.paths.proof);
        read_path("reference_digests", config.paths.reference_digests);
        read_path("header", config.paths.header);
        read_path("mempool", config.paths.mempool);
        read_path("selection", config.paths.selection);
        read_path("coinbase_txid", config.paths.coinbase_txid);
        read_path("required_txid_file", config.paths.required_txid_file);
    }

    // === Секция [merkle] ===
    if (auto merkle = table["merkle"].as_table()) {
        if (auto val = (*merkle)["required_txid"].value<std::string>()) {
            std::string txid = hex::normalize(*val);
            if (!txid.empty()) {
                config.merkle.required_txid = std::move(txid);
            }
        }
    }

    // === Секция [mining] ===
    if (auto mining = table["mining"].as_table()) {
        if (auto r = read_integer(*mining, "mining", "version", config.mining.version); !r) {
            return std::unexpected(r.error());
        }
        if (auto val = (*mining)["prev_hash"].value<std::string>()) {
            config.mining.prev_hash = hex::normalize(*val);
        }
        if (auto val = (*mining)["target"].value<std::string>()) {
            config.mining.target = hex::normalize(*val);
        }
        if (auto r = read_integer(*mining, "mining", "timestamp", config.mining.timestamp); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_integer(*mining, "mining", "start_nonce", config.mining.start_nonce); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_integer(*mining, "mining", "max_attempts", config.mining.max_attempts); !r) {
            return std::unexpected(r.error());
        }
        if (auto val = (*mining)["allow_time_increment"].value<bool>()) {
            config.mining.allow_time_increment = *val;
        }
    }

    // === Секция [selection] ===
    if (auto selection = table["selection"].as_table()) {
        if (auto r = read_integer(*selection, "selection", "weight_limit",
                                  config.selection.weight_limit); !r) {
            return std::unexpected(r.error());
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }

    return config;
}

} // anonymous namespace

// =============================================================================
// Config - Загрузка из файла
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML ({}): {}", path.string(), e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view source, std::string_view source_path) {
    try {
        auto table = toml::parse(source, source_path);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML ({}): {}", source_path, e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь обязан существовать
    if (path.has_value()) {
        return load(path.value());
    }

    // Стандартные пути
    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("proofsmith.toml");
    search_paths.push_back("/etc/proofsmith/proofsmith.toml");

    // Домашняя директория пользователя
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "proofsmith" / "proofsmith.toml"
        );
    }

    // Ищем первый существующий файл
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    // Проверка бюджета попыток
    if (mining.max_attempts == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "mining.max_attempts должен быть больше 0"
        );
    }

    // Проверка хеша предыдущего блока
    if (auto prev = hex::decode_hash(mining.prev_hash, "mining.prev_hash"); !prev) {
        return Err<void>(ErrorCode::ConfigInvalidValue, prev.error().message);
    }

    // Compact target: только формат, диапазон проверяется при декодировании
    if (mining.target.size() != constants::COMPACT_TARGET_SIZE * 2 ||
        !hex::decode(mining.target)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("mining.target должен быть {} hex символов, получено '{}'",
                        constants::COMPACT_TARGET_SIZE * 2, mining.target)
        );
    }

    // Требуемый txid из файла конфигурации
    if (merkle.required_txid) {
        if (auto txid = hex::decode_hash(*merkle.required_txid, "merkle.required_txid"); !txid) {
            return Err<void>(ErrorCode::ConfigInvalidValue, txid.error().message);
        }
    }

    // Лимит веса
    if (selection.weight_limit <= 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "selection.weight_limit должен быть больше 0"
        );
    }

    // Уровень логирования
    if (logging.level != "error" && logging.level != "warn" &&
        logging.level != "info" && logging.level != "debug") {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("logging.level должен быть 'error', 'warn', 'info' или 'debug', "
                        "получено '{}'", logging.level)
        );
    }

    return {};
}

// =============================================================================
// Config - Требуемый txid
// =============================================================================

Result<std::optional<Hash256>> Config::resolve_required_txid() const {
    // 1. Переменная окружения
    if (const char* env = std::getenv(constants::REQUIRED_TXID_ENV)) {
        std::string value = hex::normalize(env);
        if (!value.empty()) {
            auto txid = hex::decode_hash(value, constants::REQUIRED_TXID_ENV);
            if (!txid) {
                return std::unexpected(txid.error());
            }
            return std::optional<Hash256>{*txid};
        }
    }

    // 2. Файл
    auto line = io::read_first_line(paths.required_txid_file);
    if (!line) {
        return std::unexpected(line.error());
    }
    if (line->has_value()) {
        auto txid = hex::decode_hash((*line)->text, "required txid");
        if (!txid) {
            return Err<std::optional<Hash256>>(
                txid.error().code,
                std::format("{}:{}: {}", paths.required_txid_file.string(),
                            (*line)->number, txid.error().message)
            );
        }
        return std::optional<Hash256>{*txid};
    }

    // 3. Конфигурация
    if (merkle.required_txid) {
        auto txid = hex::decode_hash(*merkle.required_txid, "merkle.required_txid");
        if (!txid) {
            return std::unexpected(txid.error());
        }
        return std::optional<Hash256>{*txid};
    }

    return std::optional<Hash256>{};
}

} // namespace proofsmith
