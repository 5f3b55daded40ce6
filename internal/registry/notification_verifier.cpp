#include "notification_verifier.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>
#include <vector>

#include "internal/util/errors.hpp"

namespace docbuild::registry {

namespace {

constexpr std::string_view kPrefix = "sha256=";

std::string ToHex(const unsigned char* data, std::size_t size) {
  static const char* kDigits = "0123456789abcdef";
  std::string        out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out += kDigits[data[i] >> 4];
    out += kDigits[data[i] & 0x0f];
  }
  return out;
}

} // namespace

NotificationVerifier::NotificationVerifier(std::string secret) : secret_(std::move(secret)) {
}

std::string NotificationVerifier::Sign(const std::string& secret, const std::string& body) {
  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int               digest_len = 0;
  if (HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()), reinterpret_cast<const unsigned char*>(body.data()), body.size(),
           digest.data(), &digest_len) == nullptr) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return std::string(kPrefix) + ToHex(digest.data(), digest_len);
}

void NotificationVerifier::Verify(const std::string& body, const std::string& signature) const {
  if (secret_.empty()) {
    return;
  }
  if (signature.empty()) {
    throw util::Unauthenticated("notification signature missing");
  }

  const auto expected = Sign(secret_, body);
  if (signature.size() != expected.size() || CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
    throw util::Unauthenticated("notification signature mismatch");
  }
}

} // namespace docbuild::registry
