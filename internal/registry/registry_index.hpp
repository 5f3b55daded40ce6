#pragma once

#include <map>
#include <string>
#include <vector>

#include "internal/catalog/release_catalog.hpp"

namespace docbuild::registry {

enum class ChangeKind {
  kAdded,
  kYanked,
  kUnyanked,
  kVersionDeleted,
  kPackageDeleted,
};

/*
  One observed change. For kYanked/kUnyanked/kVersionDeleted only
  release.name and release.version are meaningful; kPackageDeleted carries
  release.name only.
*/
struct IndexChange {
  ChangeKind               kind = ChangeKind::kAdded;
  catalog::ReleaseMetadata release;
};

struct IndexDiff {
  std::vector<IndexChange> changes; // index order
  std::string              new_reference;
};

struct IndexedPackage {
  std::string                                    name; // as first published
  std::map<std::string, catalog::ReleaseMetadata> versions;
};

// Everything currently in the index, keyed by normalized package name.
using IndexSnapshot = std::map<std::string, IndexedPackage>;

/*
  Read-only view of the package registry index.

  A reference is an opaque position in the index. An empty reference means
  "the beginning". Implementations throw util::RegistryUnavailable when the
  index cannot be read; nothing may be partially returned in that case.
*/
class RegistryIndex {
 public:
  virtual ~RegistryIndex() = default;

  virtual std::string HeadReference() = 0;

  virtual IndexDiff ChangesSince(const std::string& reference) = 0;

  virtual IndexSnapshot Snapshot() = 0;

  virtual std::string RepositoryUrl() const = 0;
};

} // namespace docbuild::registry
