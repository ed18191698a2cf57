// -----------------------------------------------------------------------------
// text_encoding.cpp - UTF-8 validation and iconv-backed GBK transcoding
//
// API: include/lanmsg/text_encoding.hpp
//
// NOTE: iconv descriptors are not thread-safe, so each call opens its own.
// Frames are small and decode is not on a hot path worth caching for.
// -----------------------------------------------------------------------------
#include "lanmsg/text_encoding.hpp"

#include <iconv.h>
#include <cerrno>
#include <vector>

namespace lanmsg {

namespace {

// iconv_open(3) failure value.
const iconv_t ICONV_FAILED = (iconv_t)-1;

// RAII owner for an iconv_t.
class IconvHandle {
public:
  IconvHandle(const char* to, const char* from)
  : cd_(iconv_open(to, from)) {}
  ~IconvHandle() {
    if (valid()) iconv_close(cd_);
  }
  IconvHandle(const IconvHandle&) = delete;
  IconvHandle& operator=(const IconvHandle&) = delete;

  bool valid() const { return cd_ != ICONV_FAILED; }
  iconv_t get() const { return cd_; }

private:
  iconv_t cd_;
};

// convert() - run one complete conversion; any EILSEQ/EINVAL fails the whole call.
std::optional<std::string> convert(const char* to, const char* from,
                                   const char* data, size_t len) {
  IconvHandle h(to, from);
  if (!h.valid()) return std::nullopt;          // encoding not available in this libc
  if (len == 0) return std::string();

  std::vector<char> out(len * 4 + 16);          // GBK->UTF-8 grows at most 3/2; be generous
  char*  in_ptr   = const_cast<char*>(data);    // iconv's signature is not const-correct
  size_t in_left  = len;
  char*  out_ptr  = out.data();
  size_t out_left = out.size();

  while (in_left > 0) {
    size_t rc = iconv(h.get(), &in_ptr, &in_left, &out_ptr, &out_left);
    if (rc != static_cast<size_t>(-1)) break;
    if (errno != E2BIG) return std::nullopt;    // illegal or truncated sequence
    const size_t used = static_cast<size_t>(out_ptr - out.data());
    out.resize(out.size() * 2);
    out_ptr  = out.data() + used;
    out_left = out.size() - used;
  }

  // flush shift state (no-op for GBK, required by the API contract)
  if (iconv(h.get(), nullptr, nullptr, &out_ptr, &out_left) == static_cast<size_t>(-1)) {
    return std::nullopt;
  }
  return std::string(out.data(), static_cast<size_t>(out_ptr - out.data()));
}

} // namespace

// ---------- public ----------

bool is_valid_utf8(const uint8_t* s, size_t len) {
  size_t i = 0;
  while (i < len) {
    const uint8_t c = s[i];
    if (c < 0x80) { ++i; continue; }

    size_t   need = 0;
    uint32_t cp   = 0;
    if      ((c & 0xE0) == 0xC0) { need = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { need = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { need = 3; cp = c & 0x07; }
    else return false;                                   // stray continuation or 0xF8+

    if (i + need >= len) return false;                   // truncated tail
    for (size_t k = 1; k <= need; ++k) {
      const uint8_t cc = s[i + k];
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }

    // overlong, surrogate, out of range
    if ((need == 1 && cp < 0x80) ||
        (need == 2 && cp < 0x800) ||
        (need == 3 && cp < 0x10000)) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;
    if (cp > 0x10FFFF) return false;

    i += need + 1;
  }
  return true;
}

std::optional<std::string> gbk_to_utf8(const uint8_t* data, size_t len) {
  return convert("UTF-8", "GBK", reinterpret_cast<const char*>(data), len);
}

std::optional<std::string> utf8_to_gbk(const std::string& text) {
  return convert("GBK", "UTF-8", text.data(), text.size());
}

} // namespace lanmsg
