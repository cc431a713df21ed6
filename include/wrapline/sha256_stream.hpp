#pragma once
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace wl {

// Incremental SHA-256 over streamed input (OpenSSL EVP).
class Sha256Stream {
public:
  Sha256Stream();
  ~Sha256Stream();

  Sha256Stream(const Sha256Stream&) = delete;
  Sha256Stream& operator=(const Sha256Stream&) = delete;

  void update(std::string_view data);

  // Finalizes; further updates are ignored. Empty string if OpenSSL failed.
  std::string hex_digest();

  bool ok() const noexcept { return ok_; }

private:
  EVP_MD_CTX* ctx_{nullptr};
  bool ok_{false};
  bool done_{false};
};

}
