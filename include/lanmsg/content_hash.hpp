/**
 * @file content_hash.hpp
 * @brief Streaming MD5 content hash for file offers (OpenSSL EVP).
 *
 * @details
 * The hash travels in the offer payload as 32 lowercase hex characters and
 * is checked by the receiver after the data channel closes. Files are read
 * in CHUNK_SIZE pieces, so hashing a large file never loads it whole.
 */
#ifndef LANMSG_CONTENT_HASH_HPP
#define LANMSG_CONTENT_HASH_HPP

#include <stdint.h>
#include <optional>
#include <string>

namespace lanmsg {

/**
 * @brief MD5 of a file as lowercase hex.
 * @param size_out  If non-null, receives the number of bytes hashed.
 * @return nullopt if the file cannot be opened or read, or the digest fails.
 */
std::optional<std::string> md5_file_hex(const std::string& path, uint64_t* size_out = nullptr);

/// MD5 of an in-memory buffer as lowercase hex (nullopt only on digest failure).
std::optional<std::string> md5_hex(const std::string& data);

} // namespace lanmsg

#endif // LANMSG_CONTENT_HASH_HPP
