/**
 * @file payload.hpp
 * @brief JSON bodies carried in frame content (file offers and answers) and event JSON.
 *
 * @details
 * The file-transfer handshake rides on ordinary datagrams: the offer is a
 * GETFILEDATA frame whose content is
 * ```
 *   {"name":"report.pdf","size":1024,"hash":"9e107d9d372bb6826bd81d3542a419d6"}
 * ```
 * and the answer is a RELEASEFILES frame whose content is
 * ```
 *   {"accept":true,"port":8123}      accepted, data channel listens on 8123
 *   {"accept":false}                 rejected, port omitted
 * ```
 * Older senders spell the hash key `md5`; both are read, `hash` is written.
 *
 * Parsing never throws: malformed JSON, wrong types and missing keys all come
 * back as std::nullopt. Serialising never throws either: bytes that are not
 * UTF-8 are written as U+FFFD (see dump_text()).
 */
#ifndef LANMSG_PAYLOAD_HPP
#define LANMSG_PAYLOAD_HPP

#include <stdint.h>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "events.hpp"

namespace lanmsg {

struct FileOfferPayload {
  std::string name;
  uint64_t    size{0};
  std::string hash;
};

struct FileAnswerPayload {
  bool                    accept{false};
  std::optional<uint16_t> port;       ///< only meaningful when accept == true
};

std::string to_json(const FileOfferPayload& p);
std::string to_json(const FileAnswerPayload& p);

std::optional<FileOfferPayload>  offer_from_json(const std::string& text);
std::optional<FileAnswerPayload> answer_from_json(const std::string& text);

/// Event as a JSON object (empty fields omitted).
nlohmann::json event_json(const Event& ev);

/// json::dump() that replaces invalid UTF-8 instead of throwing type_error.316.
std::string dump_text(const nlohmann::json& j, int indent = -1);

} // namespace lanmsg

#endif // LANMSG_PAYLOAD_HPP
