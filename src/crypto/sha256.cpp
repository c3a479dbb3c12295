/**
 * @file sha256.cpp
 * @brief SHA256: padding, потоковый хешер и midstate
 *
 * Функция сжатия находится в sha256_generic.cpp.
 */

#include "sha256.hpp"
#include "../core/byte_order.hpp"

#include <algorithm>
#include <cstring>

namespace proofsmith::crypto {

namespace generic {
    void sha256_transform(Sha256State& state, const uint8_t* block) noexcept;
}

namespace {

/**
 * @brief Записать состояние как 32 байта (big-endian слова)
 */
[[nodiscard]] Hash256 state_to_hash(const Sha256State& state) noexcept {
    Hash256 out;
    for (std::size_t i = 0; i < state.size(); ++i) {
        write_be32(out.data() + i * 4, state[i]);
    }
    return out;
}

} // namespace

void sha256_transform(Sha256State& state, const uint8_t* block) noexcept {
    generic::sha256_transform(state, block);
}

// =============================================================================
// Sha256 - потоковый хешер
// =============================================================================

Sha256::Sha256() noexcept : state_(constants::SHA256_INIT) {}

void Sha256::reset() noexcept {
    state_ = constants::SHA256_INIT;
    buffered_ = 0;
    total_ = 0;
}

Sha256& Sha256::update(ByteSpan data) noexcept {
    const uint8_t* ptr = data.data();
    std::size_t len = data.size();
    total_ += len;

    // Дозаполняем буфер, оставшийся от прошлого вызова
    if (buffered_ > 0) {
        std::size_t take = std::min(len, buffer_.size() - buffered_);
        std::memcpy(buffer_.data() + buffered_, ptr, take);
        buffered_ += take;
        ptr += take;
        len -= take;
        if (buffered_ < buffer_.size()) {
            return *this;
        }
        sha256_transform(state_, buffer_.data());
        buffered_ = 0;
    }

    // Целые блоки без копирования
    while (len >= constants::SHA256_BLOCK_SIZE) {
        sha256_transform(state_, ptr);
        ptr += constants::SHA256_BLOCK_SIZE;
        len -= constants::SHA256_BLOCK_SIZE;
    }

    if (len > 0) {
        std::memcpy(buffer_.data(), ptr, len);
        buffered_ = len;
    }
    return *this;
}

Hash256 Sha256::finalize() noexcept {
    const uint64_t bit_len = total_ * 8;

    // 0x80, затем нули до 56 байт по модулю 64, затем длина в битах
    std::array<uint8_t, 2 * constants::SHA256_BLOCK_SIZE> tail{};
    std::memcpy(tail.data(), buffer_.data(), buffered_);
    tail[buffered_] = 0x80;

    std::size_t tail_len = buffered_ < 56 ? constants::SHA256_BLOCK_SIZE
                                          : 2 * constants::SHA256_BLOCK_SIZE;
    write_be64(tail.data() + tail_len - 8, bit_len);

    for (std::size_t off = 0; off < tail_len; off += constants::SHA256_BLOCK_SIZE) {
        sha256_transform(state_, tail.data() + off);
    }

    Hash256 result = state_to_hash(state_);
    reset();
    return result;
}

Hash256 sha256(ByteSpan data) noexcept {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

// =============================================================================
// Midstate функции
// =============================================================================

Sha256State compute_midstate(const uint8_t* data) noexcept {
    Sha256State state = constants::SHA256_INIT;
    sha256_transform(state, data);
    return state;
}

Hash256 hash_header_with_midstate(
    const Sha256State& midstate,
    std::span<const uint8_t, 16> header_tail
) noexcept {
    Sha256State state = midstate;

    // Второй 64-байтный блок:
    // [0-15]  : последние 16 байт заголовка
    // [16]    : 0x80 (padding)
    // [56-63] : длина = 80 * 8 = 640 бит (big-endian)
    std::array<uint8_t, constants::SHA256_BLOCK_SIZE> block{};
    std::memcpy(block.data(), header_tail.data(), header_tail.size());
    block[16] = 0x80;
    write_be64(block.data() + 56, constants::BLOCK_HEADER_SIZE * 8);

    sha256_transform(state, block.data());
    return state_to_hash(state);
}

} // namespace proofsmith::crypto
