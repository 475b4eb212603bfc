// Repository: Triptych-ingest
// Component: Content hasher
// Copyright (c) 2026 Triptych

#include "triptych/upload/ContentHasher.hpp"

#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

#include "triptych/util/Logger.hpp"

namespace triptych::upload {

using triptych::util::Logger;

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}  // namespace

std::string Sha256Hex(const uint8_t* data, size_t length) {
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    Logger::Error("[ContentHasher] EVP_MD_CTX_new failed");
    return "";
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    Logger::Error("[ContentHasher] EVP_DigestInit_ex failed");
    return "";
  }
  if (length > 0 && EVP_DigestUpdate(ctx.get(), data, length) != 1) {
    Logger::Error("[ContentHasher] EVP_DigestUpdate failed");
    return "";
  }
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
    Logger::Error("[ContentHasher] EVP_DigestFinal_ex failed");
    return "";
  }

  std::ostringstream ss;
  for (unsigned int i = 0; i < md_len; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
  }
  return ss.str();
}

bool DigestsMatch(const std::string& a, const std::string& b) {
  if (a.empty() || a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace triptych::upload
