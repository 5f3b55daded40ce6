#pragma once

#include <string>

namespace docbuild::registry {

/*
  Authenticates registry push notifications.

  Signature format: "sha256=" + lowercase hex HMAC-SHA256(secret, body).
  With an empty secret every notification is accepted, signed or not.
  A notification only ever triggers a sync; its body is never trusted.
*/
class NotificationVerifier {
 public:
  explicit NotificationVerifier(std::string secret);

  // Throws util::Unauthenticated.
  void Verify(const std::string& body, const std::string& signature) const;

  static std::string Sign(const std::string& secret, const std::string& body);

 private:
  std::string secret_;
};

} // namespace docbuild::registry
