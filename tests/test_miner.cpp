/**
 * @file test_miner.cpp
 * @brief Тесты перебора nonce
 *
 * Ожидаемые nonce и хеши для фиксированного шаблона посчитаны заранее
 * независимой реализацией SHA256.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <limits>
#include <string>

#include "mining/miner.hpp"
#include "pow/target.hpp"
#include "core/hex.hpp"
#include "core/primitives/uint256.hpp"
#include "core/types.hpp"

namespace proofsmith::tests {

/**
 * @brief Класс тестов для Miner
 */
class MinerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmpl_.version = 4;
        tmpl_.prev_hash = *hex::decode_hash(
            "00000000d1145790a8694403d4063f323d499e655c83426834d4ce2f8dd4a2ee");
        tmpl_.merkle_root = *hex::decode_hash(
            "4c50e3dad7f98bceb6441f96b23748dea84fbdb7cedd603441e6ea4a574d04a6");
        tmpl_.timestamp = 1230999306;
        tmpl_.start_nonce = 0;
    }

    static core::uint256 target_from_hex(const std::string& text) {
        return *core::uint256::from_hex(text);
    }

    mining::HeaderTemplate tmpl_;
};

/**
 * @brief Тест: максимальный target - успех с первой попытки
 */
TEST_F(MinerTest, MaxTargetFoundOnFirstAttempt) {
    tmpl_.start_nonce = 12345;
    mining::Miner miner(tmpl_, core::uint256::max(), mining::MiningParams{10, false});
    EXPECT_EQ(miner.state(), mining::MinerState::Searching);

    auto result = miner.run();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(miner.state(), mining::MinerState::Found);
    EXPECT_EQ(result->hashes_total, 1u);
    EXPECT_EQ(result->attempts, 0u);
    EXPECT_EQ(result->nonce, 12345u);
    EXPECT_EQ(result->timestamp, tmpl_.timestamp);
    EXPECT_EQ(result->header, tmpl_.to_header());
}

/**
 * @brief Тест: target и имена состояний для логов
 */
TEST_F(MinerTest, TargetAndStateNames) {
    auto target = target_from_hex(
        "0000ffff00000000000000000000000000000000000000000000000000000000");
    mining::Miner miner(tmpl_, target, mining::MiningParams{});
    EXPECT_EQ(miner.target(), target);

    EXPECT_EQ(mining::to_string(miner.state()), "searching");
    EXPECT_EQ(mining::to_string(mining::MinerState::Found), "found");
    EXPECT_EQ(mining::to_string(mining::MinerState::Exhausted), "exhausted");
}

/**
 * @brief Тест: нулевой target и бюджет N - SearchExhausted ровно после N попыток
 */
TEST_F(MinerTest, ZeroTargetExhaustsBudget) {
    for (uint64_t budget : {uint64_t{1}, uint64_t{7}, uint64_t{100}}) {
        mining::Miner miner(tmpl_, core::uint256::zero(), mining::MiningParams{budget, false});

        auto result = miner.run();
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, ErrorCode::SearchExhausted);
        EXPECT_EQ(category(result.error().code), ErrorCategory::Search);
        EXPECT_EQ(miner.state(), mining::MinerState::Exhausted);
        EXPECT_EQ(miner.hashes_total(), budget);
    }
}

/**
 * @brief Тест: найденный заголовок совпадает с эталонным перебором
 */
TEST_F(MinerTest, FindsExpectedNonce) {
    auto target = pow::parse_compact_target("1f00ffff");
    ASSERT_TRUE(target.has_value());

    mining::Miner miner(tmpl_, *target, mining::MiningParams{1'000'000, false});
    auto result = miner.run();
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->nonce, 67659u);
    EXPECT_EQ(result->timestamp, tmpl_.timestamp);
    EXPECT_EQ(result->hashes_total, 67660u);
    EXPECT_EQ(hex::encode(result->hash),
              "0000201adb007db046eb05efcb9d911cbdc5b67ea98000e6542fe96f69646bbb");

    // Результат согласован с кодеком заголовка
    EXPECT_EQ(result->header.hash(), result->hash);
    EXPECT_EQ(result->header.serialize(), result->encoded);
    EXPECT_EQ(result->header.nonce, 67659u);
    EXPECT_TRUE(pow::meets_target(result->hash, *target));
}

/**
 * @brief Тест: стандартный target 207fffff
 */
TEST_F(MinerTest, DefaultTarget) {
    auto target = pow::parse_compact_target("207fffff");
    ASSERT_TRUE(target.has_value());

    mining::Miner miner(tmpl_, *target, mining::MiningParams{});
    auto result = miner.run();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->nonce, 0u);
    EXPECT_EQ(hex::encode(result->hash),
              "079242c09c8eb95b401731f4d2d932b60e723b7706122c6513d555943c660230");
}

/**
 * @brief Тест: сдвиг времени сохраняет бегущий nonce
 *
 * Бюджет 4: nonce 0..3 на timestamp T, затем nonce 4 на T + 1.
 */
TEST_F(MinerTest, TimeIncrementKeepsNonceRolling) {
    tmpl_.timestamp = 1230999308;
    auto target = target_from_hex(
        "317311c69fd171b72b0bacbcb85b7a788fe9c995d72d5c2e72af395e774af487");

    mining::Miner strict(tmpl_, target, mining::MiningParams{4, false});
    auto exhausted = strict.run();
    ASSERT_FALSE(exhausted.has_value());
    EXPECT_EQ(exhausted.error().code, ErrorCode::SearchExhausted);

    mining::Miner miner(tmpl_, target, mining::MiningParams{4, true});
    auto result = miner.run();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->timestamp, tmpl_.timestamp + 1);
    EXPECT_EQ(result->nonce, 4u);
    EXPECT_EQ(result->attempts, 0u);
    EXPECT_EQ(result->time_increments, 1u);
    EXPECT_EQ(result->hashes_total, 5u);
}

/**
 * @brief Тест: nonce переходит через 2^32 в 0, старшие байты остаются нулевыми
 */
TEST_F(MinerTest, NonceWrapsAround) {
    tmpl_.timestamp = 1230999307;
    tmpl_.start_nonce = std::numeric_limits<uint32_t>::max();
    auto target = target_from_hex(
        "025629026d31c35bb641a75a8b9e3d49acdb097dbe1d5935a3de24f89247afb8");

    mining::Miner miner(tmpl_, target, mining::MiningParams{10, false});
    auto result = miner.run();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->nonce, 1u);
    EXPECT_EQ(result->header.nonce, 1u);
    EXPECT_EQ(result->hashes_total, 3u);
    for (std::size_t i = 72; i < 76; ++i) {
        EXPECT_EQ(result->encoded[i], 0x00);
    }
}

/**
 * @brief Тест: переполнение timestamp - SearchExhausted
 */
TEST_F(MinerTest, TimestampOverflow) {
    tmpl_.timestamp = std::numeric_limits<uint32_t>::max() - 1;
    mining::Miner miner(tmpl_, core::uint256::zero(), mining::MiningParams{3, true});

    auto result = miner.run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::SearchExhausted);
    EXPECT_EQ(miner.state(), mining::MinerState::Exhausted);
    EXPECT_EQ(miner.hashes_total(), 6u);
}

/**
 * @brief Тест: нулевой бюджет - ошибка конфигурации
 */
TEST_F(MinerTest, ZeroBudgetRejected) {
    mining::Miner miner(tmpl_, core::uint256::max(), mining::MiningParams{0, false});
    auto result = miner.run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalidValue);
    EXPECT_EQ(miner.hashes_total(), 0u);
}

/**
 * @brief Тест: выставленный флаг отмены - SearchCancelled
 */
TEST_F(MinerTest, Cancelled) {
    std::atomic<bool> cancel{true};
    mining::Miner miner(tmpl_, core::uint256::zero(), mining::MiningParams{1000, true});

    auto result = miner.run(&cancel);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::SearchCancelled);
    EXPECT_EQ(miner.state(), mining::MinerState::Searching);
    EXPECT_EQ(miner.hashes_total(), 0u);
}

} // namespace proofsmith::tests
