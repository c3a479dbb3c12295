/**
 * @file logger.cpp
 * @brief Реализация консольного логгера
 */

#include "logger.hpp"

namespace proofsmith::log {

namespace {

// ANSI коды цветов
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

[[nodiscard]] constexpr const char* color_of(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return ansi::RED;
        case LogLevel::Warn:  return ansi::YELLOW;
        case LogLevel::Info:  return ansi::CYAN;
        case LogLevel::Debug: return ansi::DIM;
    }
    return ansi::RESET;
}

} // anonymous namespace

std::optional<LogLevel> parse_level(std::string_view name) noexcept {
    if (name == "error") return LogLevel::Error;
    if (name == "warn") return LogLevel::Warn;
    if (name == "info") return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    return std::nullopt;
}

Logger::Logger(LogLevel level, bool color, std::ostream& out, std::ostream& err) noexcept
    : level_(level)
    , color_(color)
    , out_(out)
    , err_(err) {}

void Logger::write(LogLevel level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    std::ostream& stream = (level == LogLevel::Error || level == LogLevel::Warn) ? err_ : out_;
    if (color_) {
        stream << color_of(level) << '[' << to_string(level) << ']' << ansi::RESET
               << ' ' << message << std::endl;
    } else {
        stream << '[' << to_string(level) << "] " << message << std::endl;
    }
}

} // namespace proofsmith::log
