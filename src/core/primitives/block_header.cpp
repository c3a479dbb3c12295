/**
 * @file block_header.cpp
 * @brief Реализация заголовка блока
 */

#include "block_header.hpp"
#include "../byte_order.hpp"
#include "../hex.hpp"
#include "../../crypto/sha256.hpp"

#include <cstring>
#include <format>

namespace proofsmith::core {

using namespace constants;

HeaderBytes BlockHeader::serialize() const noexcept {
    HeaderBytes result{};

    write_be32(result.data() + HEADER_VERSION_OFFSET, static_cast<uint32_t>(version));
    std::memcpy(result.data() + HEADER_PREV_HASH_OFFSET, prev_hash.data(), HASH_SIZE);
    std::memcpy(result.data() + HEADER_ROOT_OFFSET, merkle_root.data(), HASH_SIZE);
    write_be32(result.data() + HEADER_TIME_OFFSET, timestamp);
    write_be64(result.data() + HEADER_NONCE_OFFSET, nonce);

    return result;
}

std::string BlockHeader::to_hex() const {
    auto bytes = serialize();
    return hex::encode(bytes);
}

BlockHeader BlockHeader::deserialize(
    std::span<const uint8_t, BLOCK_HEADER_SIZE> data
) noexcept {
    BlockHeader header;

    header.version = static_cast<int32_t>(read_be32(data.data() + HEADER_VERSION_OFFSET));
    std::memcpy(header.prev_hash.data(), data.data() + HEADER_PREV_HASH_OFFSET, HASH_SIZE);
    std::memcpy(header.merkle_root.data(), data.data() + HEADER_ROOT_OFFSET, HASH_SIZE);
    header.timestamp = read_be32(data.data() + HEADER_TIME_OFFSET);
    header.nonce = read_be64(data.data() + HEADER_NONCE_OFFSET);

    return header;
}

Result<BlockHeader> BlockHeader::from_hex(std::string_view text) {
    if (text.size() != BLOCK_HEADER_HEX_SIZE) {
        return Err<BlockHeader>(
            ErrorCode::Length,
            std::format("Неверная длина заголовка: ожидается {} hex символов, получено {}",
                        BLOCK_HEADER_HEX_SIZE, text.size())
        );
    }

    auto bytes = hex::decode(text);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    if (bytes->size() != BLOCK_HEADER_SIZE) {
        return Err<BlockHeader>(
            ErrorCode::Length,
            std::format("Декодировано {} байт заголовка (ожидается {})",
                        bytes->size(), BLOCK_HEADER_SIZE)
        );
    }

    return deserialize(std::span<const uint8_t, BLOCK_HEADER_SIZE>(
        bytes->data(), BLOCK_HEADER_SIZE));
}

Hash256 BlockHeader::hash() const noexcept {
    auto serialized = serialize();
    return crypto::sha256(serialized);
}

uint256 BlockHeader::hash_uint256() const noexcept {
    return uint256{hash()};
}

} // namespace proofsmith::core
