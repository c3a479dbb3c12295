/**
 * @file constants.hpp
 * @brief Константы форматов proofsmith
 *
 * Размеры структур, значения по умолчанию для шаблона блока
 * и константы SHA256.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace proofsmith::constants {

// =============================================================================
// Размеры структур
// =============================================================================

/// @brief Размер SHA256 хеша и идентификатора в байтах
inline constexpr std::size_t HASH_SIZE = 32;

/// @brief Длина идентификатора в hex символах
inline constexpr std::size_t HASH_HEX_SIZE = HASH_SIZE * 2;

/// @brief Размер блока SHA256 (один transform) в байтах
inline constexpr std::size_t SHA256_BLOCK_SIZE = 64;

/// @brief Размер заголовка блока в байтах
inline constexpr std::size_t BLOCK_HEADER_SIZE = 80;

/// @brief Длина заголовка в hex символах
inline constexpr std::size_t BLOCK_HEADER_HEX_SIZE = BLOCK_HEADER_SIZE * 2;

/// @brief Размер compact target (exponent[1] + mantissa[3])
inline constexpr std::size_t COMPACT_TARGET_SIZE = 4;

// Смещения полей заголовка
inline constexpr std::size_t HEADER_VERSION_OFFSET = 0;
inline constexpr std::size_t HEADER_PREV_HASH_OFFSET = 4;
inline constexpr std::size_t HEADER_ROOT_OFFSET = 36;
inline constexpr std::size_t HEADER_TIME_OFFSET = 68;
inline constexpr std::size_t HEADER_NONCE_OFFSET = 72;
static_assert(HEADER_NONCE_OFFSET + 8 == BLOCK_HEADER_SIZE, "Заголовок должен быть 80 байт");

// =============================================================================
// Compact target
// =============================================================================

/// @brief Минимальная допустимая экспонента
inline constexpr uint8_t COMPACT_MIN_EXPONENT = 3;

/// @brief Максимальная допустимая экспонента
inline constexpr uint8_t COMPACT_MAX_EXPONENT = 34;

// =============================================================================
// Значения по умолчанию
// =============================================================================

/// @brief Версия блока по умолчанию
inline constexpr int32_t DEFAULT_BLOCK_VERSION = 4;

/// @brief Compact target по умолчанию (лёгкий, regtest)
inline constexpr const char* DEFAULT_COMPACT_TARGET = "207fffff";

/// @brief Бюджет попыток на одну временную метку
inline constexpr uint64_t DEFAULT_MAX_ATTEMPTS = 50'000'000;

/// @brief Лимит веса блока для проверки набора транзакций
inline constexpr int64_t DEFAULT_WEIGHT_LIMIT = 4'000'000;

/// @brief Переменная окружения с обязательным txid
inline constexpr const char* REQUIRED_TXID_ENV = "REQUIRED_TXID";

// =============================================================================
// Начальные значения SHA256 (H0-H7)
// =============================================================================

/// @brief Начальные значения хеша SHA256 (FIPS 180-4)
inline constexpr std::array<uint32_t, 8> SHA256_INIT = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

/// @brief Константы раунда SHA256 (первые 32 бита дробной части кубических корней простых чисел)
inline constexpr std::array<uint32_t, 64> SHA256_K = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

} // namespace proofsmith::constants
