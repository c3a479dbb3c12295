/**
 * @file test_logger.cpp
 * @brief Тесты консольного логгера
 */

#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "log/logger.hpp"

namespace proofsmith::tests {

class LoggerTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    std::ostringstream err_;
};

/**
 * @brief Тест: ошибки и предупреждения идут в поток ошибок
 */
TEST_F(LoggerTest, RoutesByLevel) {
    log::Logger logger(log::LogLevel::Debug, false, out_, err_);
    logger.info("root {}", 1);
    logger.debug("detail");
    logger.warn("careful");
    logger.error("broken {}", "proof");

    EXPECT_EQ(out_.str(), "[INFO] root 1\n[DEBUG] detail\n");
    EXPECT_EQ(err_.str(), "[WARN] careful\n[ERROR] broken proof\n");
}

/**
 * @brief Тест: сообщения ниже уровня отбрасываются
 */
TEST_F(LoggerTest, FiltersByLevel) {
    log::Logger logger(log::LogLevel::Warn, false, out_, err_);
    logger.info("hidden");
    logger.debug("hidden");
    logger.warn("shown");

    EXPECT_TRUE(out_.str().empty());
    EXPECT_EQ(err_.str(), "[WARN] shown\n");
    EXPECT_FALSE(logger.enabled(log::LogLevel::Info));
    EXPECT_TRUE(logger.enabled(log::LogLevel::Error));

    logger.set_level(log::LogLevel::Error);
    logger.warn("hidden");
    EXPECT_EQ(err_.str(), "[WARN] shown\n");
}

/**
 * @brief Тест: цветной вывод оборачивает префикс в ANSI коды
 */
TEST_F(LoggerTest, Color) {
    log::Logger logger(log::LogLevel::Info, true, out_, err_);
    logger.info("x");
    EXPECT_EQ(out_.str(), "\033[36m[INFO]\033[0m x\n");
}

/**
 * @brief Тест: разбор уровня из конфигурации
 */
TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(log::parse_level("error"), log::LogLevel::Error);
    EXPECT_EQ(log::parse_level("debug"), log::LogLevel::Debug);
    EXPECT_FALSE(log::parse_level("trace").has_value());
    EXPECT_FALSE(log::parse_level("INFO").has_value());
}

} // namespace proofsmith::tests
