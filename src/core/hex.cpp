/**
 * @file hex.cpp
 * @brief Реализация hex преобразований
 */

#include "hex.hpp"
#include "constants.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace proofsmith::hex {

namespace {

constexpr char DIGITS[] = "0123456789abcdef";

/**
 * @brief Значение hex символа или -1
 */
[[nodiscard]] constexpr int nibble(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string encode(ByteSpan data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0F]);
    }
    return out;
}

std::string encode(const Hash256& hash) {
    return encode(ByteSpan{hash.data(), hash.size()});
}

Result<Bytes> decode(std::string_view text) {
    if (text.size() % 2 != 0) {
        return Err<Bytes>(
            ErrorCode::Length,
            std::format("Нечётная длина hex строки: {}", text.size())
        );
    }

    Bytes out;
    out.reserve(text.size() / 2);

    for (std::size_t i = 0; i < text.size(); i += 2) {
        int high = nibble(text[i]);
        int low = nibble(text[i + 1]);
        if (high < 0 || low < 0) {
            std::size_t pos = high < 0 ? i : i + 1;
            return Err<Bytes>(
                ErrorCode::InvalidHex,
                std::format("Неверный символ в hex строке: '{}' (позиция {})",
                            text[pos], pos)
            );
        }
        out.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return out;
}

Result<Hash256> decode_hash(std::string_view text, std::string_view what) {
    if (text.size() != constants::HASH_HEX_SIZE) {
        return Err<Hash256>(
            ErrorCode::Length,
            std::format("{} должен быть {} байта ({} hex символа), получено {}",
                        what, constants::HASH_SIZE, constants::HASH_HEX_SIZE,
                        text.size())
        );
    }

    auto bytes = decode(text);
    if (!bytes) {
        return Err<Hash256>(
            bytes.error().code,
            std::format("{}: {}", what, bytes.error().message)
        );
    }

    Hash256 result{};
    std::copy(bytes->begin(), bytes->end(), result.begin());
    return result;
}

std::string normalize(std::string_view text) {
    auto is_space = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);

    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return out;
}

} // namespace proofsmith::hex
