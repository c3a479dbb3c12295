/**
 * @file test_sha256.cpp
 * @brief Тесты SHA256 реализации
 *
 * Проверяет корректность SHA256 хеширования для известных тестовых векторов,
 * потоковый хешер и хеширование заголовка через midstate.
 */

#include <gtest/gtest.h>
#include <array>
#include <string>
#include <string_view>
#include <span>

#include "crypto/sha256.hpp"
#include "core/hex.hpp"
#include "core/types.hpp"

namespace proofsmith::tests {

/**
 * @brief Класс тестов для SHA256
 */
class SHA256Test : public ::testing::Test {
protected:
    static ByteSpan bytes_of(std::string_view text) {
        return ByteSpan{reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    static std::string sha256_hex(std::string_view text) {
        return hex::encode(crypto::sha256(bytes_of(text)));
    }
};

/**
 * @brief Тест: пустое сообщение
 */
TEST_F(SHA256Test, EmptyMessage) {
    EXPECT_EQ(sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

/**
 * @brief Тест: "abc"
 */
TEST_F(SHA256Test, SimpleMessage) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

/**
 * @brief Тест: сообщение из 56 байт (padding уходит во второй блок)
 */
TEST_F(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

/**
 * @brief Тест: миллион символов 'a' через потоковый хешер
 */
TEST_F(SHA256Test, MillionA) {
    const std::string chunk(1000, 'a');
    crypto::Sha256 hasher;
    for (int i = 0; i < 1000; ++i) {
        hasher.update(bytes_of(chunk));
    }
    EXPECT_EQ(hex::encode(hasher.finalize()),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

/**
 * @brief Тест: потоковый хешер совпадает с однократным при любом разбиении
 */
TEST_F(SHA256Test, StreamingMatchesOneShot) {
    std::string message;
    for (int i = 0; i < 200; ++i) {
        message.push_back(static_cast<char>('a' + i % 26));
    }
    const Hash256 expected = crypto::sha256(bytes_of(message));

    for (std::size_t split : {0u, 1u, 55u, 63u, 64u, 65u, 128u, 199u, 200u}) {
        crypto::Sha256 hasher;
        hasher.update(bytes_of(std::string_view(message).substr(0, split)));
        hasher.update(bytes_of(std::string_view(message).substr(split)));
        EXPECT_EQ(hasher.finalize(), expected) << "split=" << split;
    }
}

/**
 * @brief Тест: после finalize хешер снова в начальном состоянии
 */
TEST_F(SHA256Test, FinalizeResets) {
    crypto::Sha256 hasher;
    hasher.update(bytes_of("abc"));
    [[maybe_unused]] auto first = hasher.finalize();

    EXPECT_EQ(hex::encode(hasher.finalize()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

/**
 * @brief Тест: хеш заголовка через midstate равен обычному SHA256
 */
TEST_F(SHA256Test, MidstateMatchesDirectHash) {
    std::array<uint8_t, 80> header{};
    for (std::size_t i = 0; i < header.size(); ++i) {
        header[i] = static_cast<uint8_t>(i * 7 + 3);
    }

    auto midstate = crypto::compute_midstate(header.data());
    auto via_midstate = crypto::hash_header_with_midstate(
        midstate, std::span<const uint8_t, 16>(header.data() + 64, 16));

    EXPECT_EQ(via_midstate, crypto::sha256(ByteSpan{header.data(), header.size()}));
}

} // namespace proofsmith::tests
