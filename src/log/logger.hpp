/**
 * @file logger.hpp
 * @brief Консольный логгер с уровнями
 *
 * Формат строки: "[LEVEL] сообщение".
 * - info и debug пишутся в stdout
 * - warn и error пишутся в stderr
 *
 * Потоки передаются в конструктор, поэтому вывод можно перехватить в тестах.
 */

#pragma once

#include <format>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace proofsmith::log {

/**
 * @brief Уровень логирования (по возрастанию подробности)
 */
enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

/**
 * @brief Имя уровня в префиксе строки
 */
[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "UNKNOWN";
}

/**
 * @brief Разобрать уровень из конфигурации ("error", "warn", "info", "debug")
 */
[[nodiscard]] std::optional<LogLevel> parse_level(std::string_view name) noexcept;

/**
 * @brief Консольный логгер
 */
class Logger {
public:
    explicit Logger(
        LogLevel level = LogLevel::Info,
        bool color = false,
        std::ostream& out = std::cout,
        std::ostream& err = std::cerr
    ) noexcept;

    void set_level(LogLevel level) noexcept { level_ = level; }
    [[nodiscard]] LogLevel level() const noexcept { return level_; }

    void set_color(bool color) noexcept { color_ = color; }

    /**
     * @brief Будет ли выведено сообщение уровня level
     */
    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) <= static_cast<int>(level_);
    }

    /**
     * @brief Записать готовую строку
     */
    void write(LogLevel level, std::string_view message);

    template<typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

private:
    template<typename... Args>
    void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (!enabled(level)) {
            return;
        }
        write(level, std::format(fmt, std::forward<Args>(args)...));
    }

    LogLevel level_;
    bool color_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace proofsmith::log
