/**
 * @file sha256.hpp
 * @brief SHA256 интерфейс
 *
 * Единственный примитив хеширования в проекте. Везде применяется
 * одинарный SHA256: узлы дерева, заголовок блока, committed digest.
 *
 * Предоставляет:
 * - One-shot хеш произвольного буфера
 * - Потоковый хешер (Sha256) для данных из нескольких частей
 * - Midstate для 80-байтного заголовка: первые 64 байта не меняются
 *   при переборе nonce и timestamp
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace proofsmith::crypto {

// =============================================================================
// Типы данных
// =============================================================================

/**
 * @brief SHA256 состояние (8 x 32-bit слов)
 *
 * Промежуточное состояние после обработки целых 64-байтных блоков.
 * В контексте майнинга называется "midstate".
 */
using Sha256State = std::array<uint32_t, 8>;

// =============================================================================
// Основные функции SHA256
// =============================================================================

/**
 * @brief Вычислить SHA256 хеш данных произвольной длины
 *
 * Полная реализация SHA256 согласно FIPS 180-4.
 *
 * @param data Входные данные для хеширования
 * @return Hash256 32-байтный хеш
 */
[[nodiscard]] Hash256 sha256(ByteSpan data) noexcept;

/**
 * @brief Функция сжатия SHA256 для одного 64-байтного блока
 *
 * @param state Текущее состояние хеша (будет модифицировано)
 * @param block Указатель на 64 байта данных
 *
 * @warning block должен содержать ровно 64 байта!
 */
void sha256_transform(Sha256State& state, const uint8_t* block) noexcept;

/**
 * @brief Потоковый SHA256
 *
 * @code
 * crypto::Sha256 hasher;
 * hasher.update(left);
 * hasher.update(right);
 * Hash256 digest = hasher.finalize();
 * @endcode
 */
class Sha256 {
public:
    Sha256() noexcept;

    /**
     * @brief Добавить данные
     */
    Sha256& update(ByteSpan data) noexcept;

    /**
     * @brief Завершить вычисление и получить хеш
     *
     * После вызова объект сбрасывается в начальное состояние.
     */
    [[nodiscard]] Hash256 finalize() noexcept;

    /**
     * @brief Сбросить в начальное состояние
     */
    void reset() noexcept;

private:
    Sha256State state_;
    std::array<uint8_t, constants::SHA256_BLOCK_SIZE> buffer_{};
    std::size_t buffered_{0};
    uint64_t total_{0};
};

// =============================================================================
// Midstate для заголовка блока
// =============================================================================

/**
 * @brief Вычислить midstate для первых 64 байт данных
 *
 * В 80-байтном заголовке первые 64 байта (version, prev_hash и 28 байт
 * корня) постоянны во время перебора, а timestamp и nonce лежат в
 * последних 16 байтах. Midstate вычисляется один раз на шаблон.
 *
 * @param data Указатель на минимум 64 байта данных
 * @return Sha256State Состояние после обработки первых 64 байт
 */
[[nodiscard]] Sha256State compute_midstate(const uint8_t* data) noexcept;

/**
 * @brief Завершить хеш 80-байтного заголовка из midstate
 *
 * Дополняет последние 16 байт заголовка padding'ом (длина 640 бит)
 * и выполняет один transform. Результат равен sha256(header).
 *
 * @param midstate Состояние после первых 64 байт заголовка
 * @param header_tail Последние 16 байт заголовка (root[28:32] + time + nonce)
 * @return Hash256 Одинарный SHA256 заголовка
 */
[[nodiscard]] Hash256 hash_header_with_midstate(
    const Sha256State& midstate,
    std::span<const uint8_t, 16> header_tail
) noexcept;

} // namespace proofsmith::crypto
