// -----------------------------------------------------------------------------
// content_hash.cpp - MD5 over files and buffers via the OpenSSL EVP API
// -----------------------------------------------------------------------------
#include "lanmsg/content_hash.hpp"
#include "lanmsg/log.hpp"
#include "lanmsg/transport/tcp_stream.hpp"

#include <openssl/evp.h>

#include <cstdio>
#include <memory>

namespace lanmsg {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

struct FileCloser {
  void operator()(FILE* f) const { std::fclose(f); }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

std::string to_hex(const unsigned char* d, unsigned int n) {
  static const char* digits = "0123456789abcdef";
  std::string out;
  out.reserve(n * 2);
  for (unsigned int i = 0; i < n; ++i) {
    out.push_back(digits[d[i] >> 4]);
    out.push_back(digits[d[i] & 0x0F]);
  }
  return out;
}

MdCtx start_md5() {
  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx) return nullptr;
  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) return nullptr;
  return ctx;
}

std::optional<std::string> finish(EVP_MD_CTX* ctx) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int  md_len = 0;
  if (EVP_DigestFinal_ex(ctx, md, &md_len) != 1) return std::nullopt;
  return to_hex(md, md_len);
}

} // namespace

std::optional<std::string> md5_file_hex(const std::string& path, uint64_t* size_out) {
  FilePtr file(std::fopen(path.c_str(), "rb"));
  if (!file) {
    log(LogLevel::Warn, "hash").kv("status", "open_failed").kv("path", path);
    return std::nullopt;
  }
  MdCtx ctx = start_md5();
  if (!ctx) {
    log(LogLevel::Error, "hash").kv("status", "digest_init_failed");
    return std::nullopt;
  }

  unsigned char buf[transport::CHUNK_SIZE];
  uint64_t total = 0;
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), file.get())) > 0) {
    if (EVP_DigestUpdate(ctx.get(), buf, n) != 1) {
      log(LogLevel::Error, "hash").kv("status", "digest_update_failed").kv("path", path);
      return std::nullopt;
    }
    total += n;
  }
  if (std::ferror(file.get())) {
    log(LogLevel::Warn, "hash").kv("status", "read_failed").kv("path", path);
    return std::nullopt;
  }

  auto hex = finish(ctx.get());
  if (hex && size_out) *size_out = total;
  return hex;
}

std::optional<std::string> md5_hex(const std::string& data) {
  MdCtx ctx = start_md5();
  if (!ctx) return std::nullopt;
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) return std::nullopt;
  return finish(ctx.get());
}

} // namespace lanmsg
