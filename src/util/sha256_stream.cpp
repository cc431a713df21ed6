#include "wrapline/sha256_stream.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>

namespace wl {

Sha256Stream::Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
  ok_ = ctx_ != nullptr && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) == 1;
}

Sha256Stream::~Sha256Stream() { EVP_MD_CTX_free(ctx_); }

void Sha256Stream::update(std::string_view data) {
  if (!ok_ || done_ || data.empty()) return;
  ok_ = EVP_DigestUpdate(ctx_, data.data(), data.size()) == 1;
}

std::string Sha256Stream::hex_digest() {
  if (!ok_ || done_) return {};
  done_ = true;
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_, md, &len) != 1) { ok_ = false; return {}; }
  std::ostringstream o;
  for (unsigned int i = 0; i < len; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  return o.str();
}

}
