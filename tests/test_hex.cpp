/**
 * @file test_hex.cpp
 * @brief Тесты hex преобразований
 */

#include <gtest/gtest.h>
#include <string>

#include "core/hex.hpp"
#include "core/types.hpp"

namespace proofsmith::tests {

class HexTest : public ::testing::Test {
};

/**
 * @brief Тест: байты декодируются буквально, без разворота порядка
 */
TEST_F(HexTest, DecodeIsLiteral) {
    auto bytes = hex::decode("00ff10ab");
    ASSERT_TRUE(bytes.has_value());
    ASSERT_EQ(bytes->size(), 4u);
    EXPECT_EQ((*bytes)[0], 0x00);
    EXPECT_EQ((*bytes)[1], 0xff);
    EXPECT_EQ((*bytes)[2], 0x10);
    EXPECT_EQ((*bytes)[3], 0xab);
}

/**
 * @brief Тест: encode(decode(x)) == x для 32-байтного значения
 */
TEST_F(HexTest, HashRoundTrip) {
    const std::string text =
        "4c50e3dad7f98bceb6441f96b23748dea84fbdb7cedd603441e6ea4a574d04a6";
    auto hash = hex::decode_hash(text);
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ((*hash)[0], 0x4c);
    EXPECT_EQ((*hash)[31], 0xa6);
    EXPECT_EQ(hex::encode(*hash), text);
}

/**
 * @brief Тест: верхний регистр принимается, вывод в нижнем
 */
TEST_F(HexTest, UppercaseAccepted) {
    auto bytes = hex::decode("ABCDEF");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(hex::encode(*bytes), "abcdef");
}

/**
 * @brief Тест: нечётная длина - ошибка Length
 */
TEST_F(HexTest, OddLength) {
    auto bytes = hex::decode("abc");
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code, ErrorCode::Length);
}

/**
 * @brief Тест: неверный символ - InvalidHex с позицией
 */
TEST_F(HexTest, InvalidCharacterReportsPosition) {
    auto bytes = hex::decode("00zz");
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code, ErrorCode::InvalidHex);
    EXPECT_NE(bytes.error().message.find("2"), std::string::npos);
}

/**
 * @brief Тест: decode_hash требует ровно 64 символа
 */
TEST_F(HexTest, DecodeHashLength) {
    auto short_hash = hex::decode_hash("abcd", "txid");
    ASSERT_FALSE(short_hash.has_value());
    EXPECT_EQ(short_hash.error().code, ErrorCode::Length);
    EXPECT_NE(short_hash.error().message.find("txid"), std::string::npos);

    auto long_hash = hex::decode_hash(std::string(66, '0'));
    ASSERT_FALSE(long_hash.has_value());
    EXPECT_EQ(long_hash.error().code, ErrorCode::Length);
}

/**
 * @brief Тест: normalize обрезает пробелы и понижает регистр
 */
TEST_F(HexTest, Normalize) {
    EXPECT_EQ(hex::normalize("  AbCd\r\n"), "abcd");
    EXPECT_EQ(hex::normalize("\t \n"), "");
}

} // namespace proofsmith::tests
