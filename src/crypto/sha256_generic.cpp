/**
 * @file sha256_generic.cpp
 * @brief Программная функция сжатия SHA256
 *
 * Алгоритм соответствует FIPS 180-4, секция 6.2.2.
 */

#include "sha256.hpp"
#include "../core/byte_order.hpp"
#include "../core/constants.hpp"

#include <bit>

namespace proofsmith::crypto::generic {

namespace {

// Функции SHA256 (FIPS 180-4, секция 4.1.2)

[[nodiscard]] constexpr uint32_t ch(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (~x & z);
}

[[nodiscard]] constexpr uint32_t maj(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

[[nodiscard]] constexpr uint32_t big_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr uint32_t big_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr uint32_t small_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3);
}

[[nodiscard]] constexpr uint32_t small_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10);
}

} // namespace

/**
 * @brief Функция сжатия SHA256
 *
 * 1. Расписание сообщения W[0..63]
 * 2. 64 раунда над рабочими переменными a-h
 * 3. Добавление результата к состоянию
 *
 * @param state Состояние хеша (8 x 32-bit слов), будет обновлено
 * @param block Указатель на 64 байта данных
 */
void sha256_transform(Sha256State& state, const uint8_t* block) noexcept {
    std::array<uint32_t, 64> w;

    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = read_be32(block + i * 4);
    }
    for (std::size_t i = 16; i < 64; ++i) {
        w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
    }

    // v[0..7] = a..h
    Sha256State v = state;

    for (std::size_t i = 0; i < 64; ++i) {
        uint32_t t1 = v[7] + big_sigma1(v[4]) + ch(v[4], v[5], v[6]) +
                      constants::SHA256_K[i] + w[i];
        uint32_t t2 = big_sigma0(v[0]) + maj(v[0], v[1], v[2]);

        v[7] = v[6];
        v[6] = v[5];
        v[5] = v[4];
        v[4] = v[3] + t1;
        v[3] = v[2];
        v[2] = v[1];
        v[1] = v[0];
        v[0] = t1 + t2;
    }

    for (std::size_t i = 0; i < state.size(); ++i) {
        state[i] += v[i];
    }
}

} // namespace proofsmith::crypto::generic
