#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "docbuild/v1/registry.pb.h"
#include "internal/registry/registry_index.hpp"

namespace docbuild::registry {

/*
  JournalIndex

  Registry mirror stored as a JSON-lines journal, one IndexEvent per line:

    {"seq": 41, "kind": "PUBLISH", "name": "serde", "vers": "1.0.0", ...}

  References are decimal sequence numbers. ChangesSince(ref) returns the
  events with seq > ref in file order. Malformed lines are logged and
  skipped so one bad write cannot wedge synchronization.

  A PUBLISH without has_lib is a library release.
*/
class JournalIndex final : public RegistryIndex {
 public:
  explicit JournalIndex(std::string path);

  std::string HeadReference() override;

  IndexDiff ChangesSince(const std::string& reference) override;

  // Replays the whole journal.
  IndexSnapshot Snapshot() override;

  std::string RepositoryUrl() const override;

  // Exposed for tests. nullopt for lines that do not parse.
  static std::optional<docbuild::v1::IndexEvent> ParseLine(const std::string& line);

  static std::optional<IndexChange> ToChange(const docbuild::v1::IndexEvent& event);

 private:
  template <typename Fn>
  void ForEachEvent(Fn&& fn);

  std::string path_;
};

// Throws util::InvalidArgument when reference is not a sequence number.
uint64_t ParseSequenceReference(const std::string& reference);

} // namespace docbuild::registry
