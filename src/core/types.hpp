/**
 * @file types.hpp
 * @brief Базовые типы proofsmith
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный идентификатор (txid, узел дерева, хеш заголовка)
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 * - ConsistencyError: исключение для внутренних противоречий
 *
 * @note Ошибки входных данных и отказы проверки передаются значениями
 *       (Result / Verdict). Исключение бросается только при дефекте логики.
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace proofsmith {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битное значение (32 байта)
 *
 * Используется для:
 * - Transaction ID (лист дерева)
 * - Узлов и корня Merkle дерева
 * - SHA256 хеша заголовка
 *
 * Байты хранятся ровно в том порядке, в каком они записаны в hex строке.
 * Никакого разворота порядка байт в проекте нет.
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

/**
 * @brief Уровень дерева (порядок узлов слева направо значим)
 */
using Level = std::vector<Hash256>;

// =============================================================================
// Коды ошибок
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Каждый код относится ровно к одной категории (см. ErrorCategory).
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки формата входных данных (100-199)
    InvalidHex = 100,
    Length = 101,
    EmptyInput = 102,
    MalformedRecord = 103,

    // Ошибки поиска (200-299)
    TargetNotFound = 200,

    // Отказы проверки (300-399)
    ProofMismatch = 300,
    ProofTooShort = 301,
    ProofTooLong = 302,
    RootMismatch = 303,
    DigestMismatch = 304,
    PowInsufficient = 305,
    SelectionRejected = 306,

    // Ошибки диапазона (400-499)
    InvalidEncoding = 400,
    TargetOutOfRange = 401,

    // Ошибки перебора nonce (500-599)
    SearchExhausted = 500,
    SearchCancelled = 501,

    // Ошибки конфигурации (600-699)
    ConfigNotFound = 600,
    ConfigParseError = 601,
    ConfigInvalidValue = 602,

    // Системные ошибки (800-899)
    IoError = 800,
};

/**
 * @brief Категория ошибки
 *
 * По категории верхний уровень (main) выбирает код завершения процесса.
 */
enum class ErrorCategory {
    None,
    InputFormat,    ///< Некорректный hex, длина, пустой обязательный ввод
    Lookup,         ///< Требуемый идентификатор отсутствует в списке
    Verification,   ///< Проверяемая сторона прислала неверный ответ
    Range,          ///< Декодированное значение вне допустимой области
    Search,         ///< Перебор nonce исчерпан или отменён
    Config,         ///< Ошибка конфигурации
    System          ///< Ошибка ввода/вывода
};

/**
 * @brief Получить категорию кода ошибки
 */
[[nodiscard]] constexpr ErrorCategory category(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return ErrorCategory::None;
        case ErrorCode::InvalidHex:
        case ErrorCode::Length:
        case ErrorCode::EmptyInput:
        case ErrorCode::MalformedRecord:
            return ErrorCategory::InputFormat;
        case ErrorCode::TargetNotFound:
            return ErrorCategory::Lookup;
        case ErrorCode::ProofMismatch:
        case ErrorCode::ProofTooShort:
        case ErrorCode::ProofTooLong:
        case ErrorCode::RootMismatch:
        case ErrorCode::DigestMismatch:
        case ErrorCode::PowInsufficient:
        case ErrorCode::SelectionRejected:
            return ErrorCategory::Verification;
        case ErrorCode::InvalidEncoding:
        case ErrorCode::TargetOutOfRange:
            return ErrorCategory::Range;
        case ErrorCode::SearchExhausted:
        case ErrorCode::SearchCancelled:
            return ErrorCategory::Search;
        case ErrorCode::ConfigNotFound:
        case ErrorCode::ConfigParseError:
        case ErrorCode::ConfigInvalidValue:
            return ErrorCategory::Config;
        case ErrorCode::IoError:
            return ErrorCategory::System;
    }
    return ErrorCategory::System;
}

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidHex: return "Некорректная hex строка";
        case ErrorCode::Length: return "Некорректная длина данных";
        case ErrorCode::EmptyInput: return "Пустые входные данные";
        case ErrorCode::MalformedRecord: return "Некорректная запись";
        case ErrorCode::TargetNotFound: return "Идентификатор не найден";
        case ErrorCode::ProofMismatch: return "Неверный sibling в доказательстве";
        case ErrorCode::ProofTooShort: return "Доказательство слишком короткое";
        case ErrorCode::ProofTooLong: return "Доказательство слишком длинное";
        case ErrorCode::RootMismatch: return "Корень не совпадает";
        case ErrorCode::DigestMismatch: return "Дайджест не совпадает";
        case ErrorCode::PowInsufficient: return "Хеш не соответствует target";
        case ErrorCode::SelectionRejected: return "Набор транзакций отклонён";
        case ErrorCode::InvalidEncoding: return "Некорректный compact target";
        case ErrorCode::TargetOutOfRange: return "Target вне 256-битного диапазона";
        case ErrorCode::SearchExhausted: return "Перебор nonce исчерпан";
        case ErrorCode::SearchCancelled: return "Перебор nonce отменён";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::IoError: return "Ошибка ввода/вывода";
    }
    return "Неизвестная ошибка";
}

/**
 * @brief Короткое имя категории для логов
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCategory cat) noexcept {
    switch (cat) {
        case ErrorCategory::None: return "none";
        case ErrorCategory::InputFormat: return "input";
        case ErrorCategory::Lookup: return "lookup";
        case ErrorCategory::Verification: return "verification";
        case ErrorCategory::Range: return "range";
        case ErrorCategory::Search: return "search";
        case ErrorCategory::Config: return "config";
        case ErrorCategory::System: return "system";
    }
    return "unknown";
}

// =============================================================================
// Коды завершения процесса
// =============================================================================

/// @brief Проверка пройдена / артефакт создан
inline constexpr int EXIT_OK = 0;

/// @brief Проверка отклонила присланный ответ
inline constexpr int EXIT_REJECTED = 1;

/// @brief Ошибка входных данных, поиска, конфигурации или диапазона
inline constexpr int EXIT_INPUT_ERROR = 2;

/// @brief Внутреннее противоречие (ConsistencyError)
inline constexpr int EXIT_CONSISTENCY = 3;

/// @brief Перебор nonce исчерпан или отменён
inline constexpr int EXIT_SEARCH_FAILED = 4;

/**
 * @brief Код завершения для категории ошибки
 */
[[nodiscard]] constexpr int exit_code(ErrorCategory cat) noexcept {
    switch (cat) {
        case ErrorCategory::None:
            return EXIT_OK;
        case ErrorCategory::Verification:
            return EXIT_REJECTED;
        case ErrorCategory::Search:
            return EXIT_SEARCH_FAILED;
        case ErrorCategory::InputFormat:
        case ErrorCategory::Lookup:
        case ErrorCategory::Range:
        case ErrorCategory::Config:
        case ErrorCategory::System:
            return EXIT_INPUT_ERROR;
    }
    return EXIT_INPUT_ERROR;
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и сообщением
 *
 * Используется как error type в std::expected и как запись отказа в Verdict.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @tparam T Тип возвращаемого значения
 *
 * Пример использования:
 * @code
 * auto root = merkle::compute_merkle_root(leaves);
 * if (!root) {
 *     std::cerr << root.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Внутренние противоречия
// =============================================================================

/**
 * @brief Значение, вычисленное двумя путями, не совпало
 *
 * Сигнализирует об ошибке в самом проверяющем коде, а не во входных данных.
 * Не восстанавливается; перехватывается только в main.
 */
class ConsistencyError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace proofsmith
