/**
 * @file config.hpp
 * @brief Конфигурация proofsmith
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 * Все секции необязательны: отсутствующие значения берутся по умолчанию,
 * пути можно переопределить аргументами командной строки.
 *
 * Пример конфигурации (proofsmith.toml):
 * @code
 * [paths]
 * leaf_list = "solutions/exercise01.txt"
 * proof = "solutions/exercise02.txt"
 * reference_digests = "data/reference_digests.txt"
 * header = "solutions/exercise03.txt"
 * mempool = "data/mempool.csv"
 * selection = "solutions/exercise01.txt"
 * coinbase_txid = "data/coinbase_txid.txt"
 * required_txid_file = "data/required_txid.txt"
 *
 * [merkle]
 * required_txid = "4c50e3da..."
 *
 * [mining]
 * version = 4
 * prev_hash = "00000000d1145790..."
 * target = "207fffff"
 * timestamp = 1230999306
 * start_nonce = 0
 * max_attempts = 50000000
 * allow_time_increment = true
 *
 * [selection]
 * weight_limit = 4000000
 *
 * [logging]
 * level = "info"
 * color = true
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace proofsmith {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Пути к входным и выходным файлам
 */
struct PathsConfig {
    /// @brief Список txid в порядке блока
    std::filesystem::path leaf_list = "solutions/exercise01.txt";

    /// @brief Файл доказательства (корень + sibling'и)
    std::filesystem::path proof = "solutions/exercise02.txt";

    /// @brief Опубликованные дайджесты для режима committed-digest
    std::filesystem::path reference_digests = "data/reference_digests.txt";

    /// @brief Файл заголовка блока
    std::filesystem::path header = "solutions/exercise03.txt";

    /// @brief CSV мемпула
    std::filesystem::path mempool = "data/mempool.csv";

    /// @brief Кандидат в блок для проверки выбора транзакций
    std::filesystem::path selection = "solutions/exercise01.txt";

    /// @brief Необязательный txid coinbase
    std::filesystem::path coinbase_txid = "data/coinbase_txid.txt";

    /// @brief Необязательный файл с требуемым txid
    std::filesystem::path required_txid_file = "data/required_txid.txt";
};

/**
 * @brief Настройки Merkle дерева
 */
struct MerkleConfig {
    /// @brief Требуемый txid (самый низкий приоритет)
    std::optional<std::string> required_txid;
};

/**
 * @brief Шаблон заголовка и параметры перебора
 */
struct MiningConfig {
    /// @brief Версия блока
    int32_t version = constants::DEFAULT_BLOCK_VERSION;

    /// @brief Хеш предыдущего блока (64 hex символа)
    std::string prev_hash = std::string(constants::HASH_HEX_SIZE, '0');

    /// @brief Compact target (8 hex символов)
    std::string target{constants::DEFAULT_COMPACT_TARGET};

    /// @brief Начальная временная метка
    uint32_t timestamp = 0;

    /// @brief Начальный nonce
    uint32_t start_nonce = 0;

    /// @brief Попыток на один timestamp
    uint64_t max_attempts = constants::DEFAULT_MAX_ATTEMPTS;

    /// @brief Увеличивать timestamp при исчерпании попыток
    bool allow_time_increment = false;
};

/**
 * @brief Настройки проверки выбора транзакций
 */
struct SelectionConfig {
    /// @brief Максимальный суммарный вес блока
    int64_t weight_limit = constants::DEFAULT_WEIGHT_LIMIT;
};

/**
 * @brief Настройки логирования
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief Включить ANSI цвета в терминале
    bool color = true;
};

/**
 * @brief Полная конфигурация proofsmith
 */
struct Config {
    PathsConfig paths;
    MerkleConfig merkle;
    MiningConfig mining;
    SelectionConfig selection;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из строки TOML
     *
     * @param source Содержимое файла
     * @param source_path Имя источника для сообщений об ошибках
     */
    [[nodiscard]] static Result<Config> parse(
        std::string_view source,
        std::string_view source_path = "proofsmith.toml"
    );

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./proofsmith.toml
     * 3. /etc/proofsmith/proofsmith.toml
     * 4. ~/.config/proofsmith/proofsmith.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ConfigNotFound
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет:
     * - max_attempts > 0 и weight_limit > 0
     * - prev_hash и required_txid - 64 hex символа
     * - target - 8 hex символов
     * - Известный уровень логирования
     *
     * @return Result<void> Успех или ConfigInvalidValue
     */
    [[nodiscard]] Result<void> validate() const;

    /**
     * @brief Определить требуемый txid
     *
     * Приоритет:
     * 1. Переменная окружения REQUIRED_TXID
     * 2. Первая непустая строка paths.required_txid_file
     * 3. merkle.required_txid
     *
     * @return std::nullopt, если ни один источник не задан (проверка пропускается)
     */
    [[nodiscard]] Result<std::optional<Hash256>> resolve_required_txid() const;
};

} // namespace proofsmith
