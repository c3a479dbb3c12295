/**
 * @file hex.hpp
 * @brief Преобразования hex <-> байты
 *
 * Hex строка декодируется буквально: первый байт строки становится
 * первым байтом буфера. encode(decode(x)) == x для любой корректной
 * строки в нижнем регистре.
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace proofsmith::hex {

/**
 * @brief Закодировать байты в hex (нижний регистр)
 */
[[nodiscard]] std::string encode(ByteSpan data);

/**
 * @brief Закодировать 32-байтное значение в hex (64 символа)
 */
[[nodiscard]] std::string encode(const Hash256& hash);

/**
 * @brief Декодировать hex строку произвольной чётной длины
 *
 * @param text Hex строка (регистр не важен)
 * @return Result<Bytes> Байты или InvalidHex / Length с позицией ошибки
 */
[[nodiscard]] Result<Bytes> decode(std::string_view text);

/**
 * @brief Декодировать ровно 32 байта (64 hex символа)
 *
 * @param text Hex строка
 * @param what Что декодируется (для сообщения об ошибке, например "txid")
 * @return Result<Hash256> Значение или ошибка формата
 */
[[nodiscard]] Result<Hash256> decode_hash(std::string_view text,
                                          std::string_view what = "hash");

/**
 * @brief Убрать пробелы по краям и привести к нижнему регистру
 */
[[nodiscard]] std::string normalize(std::string_view text);

} // namespace proofsmith::hex
