/**
 * @file text_encoding.hpp
 * @brief UTF-8 validation and GBK <-> UTF-8 transcoding for inbound frames.
 *
 * Standard peers send UTF-8. The regional vendor client sends GBK. The codec
 * tries strict UTF-8 first and only falls back to GBK when the buffer is not
 * valid UTF-8. Transcoding goes through iconv(3).
 */
#ifndef LANMSG_TEXT_ENCODING_HPP
#define LANMSG_TEXT_ENCODING_HPP

#include <stddef.h>
#include <stdint.h>
#include <optional>
#include <string>

namespace lanmsg {

/// Strict check: rejects overlongs, surrogates, code points above U+10FFFF.
bool is_valid_utf8(const uint8_t* data, size_t len);

/// GBK bytes to UTF-8; nullopt if the bytes are not valid GBK.
std::optional<std::string> gbk_to_utf8(const uint8_t* data, size_t len);

/// UTF-8 text to GBK bytes; nullopt if a character has no GBK mapping.
std::optional<std::string> utf8_to_gbk(const std::string& text);

} // namespace lanmsg

#endif // LANMSG_TEXT_ENCODING_HPP
