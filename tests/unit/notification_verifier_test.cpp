#include "internal/registry/notification_verifier.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using docbuild::registry::NotificationVerifier;

bool Rejects(const NotificationVerifier& verifier, const std::string& body, const std::string& signature) {
  try {
    verifier.Verify(body, signature);
  } catch (const docbuild::util::Unauthenticated&) {
    return true;
  }
  return false;
}

void TestKnownDigest() {
  // RFC 4231 test case 2
  const auto signature = NotificationVerifier::Sign("Jefe", "what do ya want for nothing?");
  assert(signature == "sha256=5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

void TestValidSignatureIsAccepted() {
  NotificationVerifier verifier("s3cret");
  const std::string    body = R"({"name":"serde"})";

  verifier.Verify(body, NotificationVerifier::Sign("s3cret", body));
}

void TestBadSignaturesAreRejected() {
  NotificationVerifier verifier("s3cret");
  const std::string    body = R"({"name":"serde"})";

  assert(Rejects(verifier, body, ""));
  assert(Rejects(verifier, body, NotificationVerifier::Sign("other", body)));
  assert(Rejects(verifier, body + " ", NotificationVerifier::Sign("s3cret", body)));
  assert(Rejects(verifier, body, "sha256=deadbeef"));
}

void TestEmptySecretAcceptsAnything() {
  NotificationVerifier verifier("");
  verifier.Verify("body", "");
  verifier.Verify("body", "sha256=garbage");
}

} // namespace

int main() {
  TestKnownDigest();
  TestValidSignatureIsAccepted();
  TestBadSignaturesAreRejected();
  TestEmptySecretAcceptsAnything();

  std::cout << "docbuild_unit_notification_verifier: pass\n";
  return 0;
}
