/**
 * @file test_config.cpp
 * @brief Тесты загрузки конфигурации
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "core/config.hpp"
#include "core/hex.hpp"

namespace proofsmith::tests {

namespace fs = std::filesystem;

namespace {

constexpr const char* TXID_A =
    "4c50e3da2afc3a3b2c4ee6be0a37e6f8fa5ca6b5a1a8d4b1e0ec2b5d2e0c04a6";
constexpr const char* TXID_B =
    "00000000d1145790a8694403d4063f323d499e655c83426834d4ce2f8dd4a2ee";

} // anonymous namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("REQUIRED_TXID");
        dir_ = fs::temp_directory_path() / "proofsmith_config_test";
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        unsetenv("REQUIRED_TXID");
        fs::remove_all(dir_);
    }

    fs::path dir_;
};

/**
 * @brief Тест: пустой файл даёт значения по умолчанию
 */
TEST_F(ConfigTest, Defaults) {
    auto config = Config::parse("");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->paths.leaf_list, fs::path("solutions/exercise01.txt"));
    EXPECT_EQ(config->mining.target, "207fffff");
    EXPECT_EQ(config->mining.prev_hash, std::string(64, '0'));
    EXPECT_FALSE(config->mining.allow_time_increment);
    EXPECT_FALSE(config->merkle.required_txid.has_value());
    EXPECT_EQ(config->logging.level, "info");
    EXPECT_TRUE(config->validate().has_value());
}

/**
 * @brief Тест: все секции разбираются
 */
TEST_F(ConfigTest, ParsesSections) {
    auto config = Config::parse(R"(
[paths]
leaf_list = "in/leaves.txt"
mempool = "in/pool.csv"

[merkle]
required_txid = "4C50E3DA2AFC3A3B2C4EE6BE0A37E6F8FA5CA6B5A1A8D4B1E0EC2B5D2E0C04A6"

[mining]
version = 2
target = "1f00ffff"
timestamp = 1230999306
start_nonce = 7
max_attempts = 1000
allow_time_increment = true

[selection]
weight_limit = 12345

[logging]
level = "debug"
color = false
)");
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->paths.leaf_list, fs::path("in/leaves.txt"));
    EXPECT_EQ(config->paths.mempool, fs::path("in/pool.csv"));
    EXPECT_EQ(config->merkle.required_txid, std::string(TXID_A));
    EXPECT_EQ(config->mining.version, 2);
    EXPECT_EQ(config->mining.target, "1f00ffff");
    EXPECT_EQ(config->mining.timestamp, 1230999306u);
    EXPECT_EQ(config->mining.start_nonce, 7u);
    EXPECT_EQ(config->mining.max_attempts, 1000u);
    EXPECT_TRUE(config->mining.allow_time_increment);
    EXPECT_EQ(config->selection.weight_limit, 12345);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_FALSE(config->logging.color);
    EXPECT_TRUE(config->validate().has_value());
}

/**
 * @brief Тест: синтаксическая ошибка TOML
 */
TEST_F(ConfigTest, ParseError) {
    auto config = Config::parse("[mining\nversion = ");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);
}

/**
 * @brief Тест: значение вне диапазона типа
 */
TEST_F(ConfigTest, IntegerOutOfRange) {
    auto config = Config::parse("[mining]\ntimestamp = 4294967296\n");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigInvalidValue);

    auto negative = Config::parse("[mining]\nmax_attempts = -1\n");
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, ErrorCode::ConfigInvalidValue);
}

/**
 * @brief Тест: валидация отклоняет некорректные значения
 */
TEST_F(ConfigTest, Validate) {
    Config config;
    config.mining.max_attempts = 0;
    EXPECT_EQ(config.validate().error().code, ErrorCode::ConfigInvalidValue);

    config = Config{};
    config.mining.prev_hash = "abcd";
    EXPECT_FALSE(config.validate().has_value());

    config = Config{};
    config.mining.target = "207fff";
    EXPECT_FALSE(config.validate().has_value());

    config = Config{};
    config.merkle.required_txid = "xyz";
    EXPECT_FALSE(config.validate().has_value());

    config = Config{};
    config.selection.weight_limit = 0;
    EXPECT_FALSE(config.validate().has_value());

    config = Config{};
    config.logging.level = "trace";
    EXPECT_FALSE(config.validate().has_value());
}

/**
 * @brief Тест: явно указанный файл должен существовать
 */
TEST_F(ConfigTest, LoadMissingFile) {
    auto config = Config::load(dir_ / "missing.toml");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigNotFound);

    auto searched = Config::load_with_search(dir_ / "missing.toml");
    ASSERT_FALSE(searched.has_value());
    EXPECT_EQ(searched.error().code, ErrorCode::ConfigNotFound);
}

/**
 * @brief Тест: загрузка из файла
 */
TEST_F(ConfigTest, LoadFile) {
    fs::path path = dir_ / "proofsmith.toml";
    std::ofstream(path) << "[logging]\nlevel = \"warn\"\n";

    auto config = Config::load(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->logging.level, "warn");
}

/**
 * @brief Тест: без источников требуемый txid не задан
 */
TEST_F(ConfigTest, RequiredTxidAbsent) {
    Config config;
    config.paths.required_txid_file = dir_ / "required.txt";

    auto txid = config.resolve_required_txid();
    ASSERT_TRUE(txid.has_value());
    EXPECT_FALSE(txid->has_value());
}

/**
 * @brief Тест: приоритет окружение > файл > конфигурация
 */
TEST_F(ConfigTest, RequiredTxidPriority) {
    Config config;
    config.paths.required_txid_file = dir_ / "required.txt";
    config.merkle.required_txid = TXID_A;

    auto from_config = config.resolve_required_txid();
    ASSERT_TRUE(from_config.has_value() && from_config->has_value());
    EXPECT_EQ(hex::encode(**from_config), TXID_A);

    std::ofstream(config.paths.required_txid_file) << "\n" << TXID_B << "\n";
    auto from_file = config.resolve_required_txid();
    ASSERT_TRUE(from_file.has_value() && from_file->has_value());
    EXPECT_EQ(hex::encode(**from_file), TXID_B);

    setenv("REQUIRED_TXID", TXID_A, 1);
    auto from_env = config.resolve_required_txid();
    ASSERT_TRUE(from_env.has_value() && from_env->has_value());
    EXPECT_EQ(hex::encode(**from_env), TXID_A);
}

/**
 * @brief Тест: некорректный txid в файле указывает строку
 */
TEST_F(ConfigTest, RequiredTxidInvalidFile) {
    Config config;
    config.paths.required_txid_file = dir_ / "required.txt";
    std::ofstream(config.paths.required_txid_file) << "\n\nnot-a-txid\n";

    auto txid = config.resolve_required_txid();
    ASSERT_FALSE(txid.has_value());
    EXPECT_NE(txid.error().message.find("required.txt:3:"), std::string::npos);
}

} // namespace proofsmith::tests
