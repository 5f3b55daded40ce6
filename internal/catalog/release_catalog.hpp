#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/status/status_aggregator.hpp"

namespace docbuild::catalog {

// Registry-side view of one release, as read from the index.
struct ReleaseMetadata {
  std::string              name;
  std::string              version;
  bool                     yanked     = false;
  bool                     is_library = true;
  std::vector<std::string> dependencies;
  // default target first when the registry declares one
  std::vector<std::string> targets;
};

struct CatalogEntry {
  db::model::PackageRecord package;
  db::model::ReleaseRecord release;
  bool                     created = false; // release row did not exist before
};

/*
  ReleaseCatalog

  Package/Release bookkeeping shared by synchronization and the builder.
  Every method runs inside the caller's transaction and never opens one.
  A release is created together with its status row.
*/
class ReleaseCatalog {
 public:
  explicit ReleaseCatalog(std::shared_ptr<db::Repository> repository);

  // Upserts package + release registry metadata. Build outputs are untouched.
  CatalogEntry UpsertFromRegistry(db::Transaction& tx, const ReleaseMetadata& metadata);

  // Creates missing rows with default metadata; existing rows are returned as-is.
  CatalogEntry EnsureRelease(db::Transaction& tx, const std::string& name, const std::string& version);

  std::optional<CatalogEntry> Find(db::Transaction& tx, const std::string& name, const std::string& version);

  // false when the release is unknown
  bool SetYanked(db::Transaction& tx, const std::string& name, const std::string& version, bool yanked);

  // Deletes the release with its builds and status, then refreshes latest. false when unknown.
  bool RemoveRelease(db::Transaction& tx, const std::string& name, const std::string& version);

  // Deletes the package and everything under it. Returns the number of releases removed, nullopt when unknown.
  std::optional<uint64_t> RemovePackage(db::Transaction& tx, const std::string& name);

  /*
    Latest = highest non-yanked stable version, else highest non-yanked
    pre-release, else none (0).
  */
  void RefreshLatest(db::Transaction& tx, uint64_t package_id);

 private:
  db::model::PackageRecord UpsertPackage(db::Transaction& tx, const std::string& name);

  std::shared_ptr<db::Repository> repository_;
  status::StatusAggregator        aggregator_;
};

} // namespace docbuild::catalog
