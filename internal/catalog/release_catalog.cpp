#include "release_catalog.hpp"

#include "internal/util/names.hpp"
#include "internal/util/version.hpp"

namespace docbuild::catalog {

ReleaseCatalog::ReleaseCatalog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)), aggregator_(repository_) {
}

db::model::PackageRecord ReleaseCatalog::UpsertPackage(db::Transaction& tx, const std::string& name) {
  util::ValidateName(name);

  db::model::PackageRecord package;
  package.name            = name;
  package.normalized_name = util::NormalizeName(name);
  db::ThrowIfError(repository_->UpsertPackage(tx, package), "upsert package " + package.normalized_name);
  return package;
}

CatalogEntry ReleaseCatalog::UpsertFromRegistry(db::Transaction& tx, const ReleaseMetadata& metadata) {
  CatalogEntry entry;
  entry.package = UpsertPackage(tx, metadata.name);
  entry.created = !repository_->GetRelease(tx, entry.package.id, metadata.version).has_value();

  db::model::ReleaseRecord release;
  release.package_id   = entry.package.id;
  release.version      = metadata.version;
  release.yanked       = metadata.yanked;
  release.is_library   = metadata.is_library;
  release.dependencies = metadata.dependencies;
  release.targets      = metadata.targets;
  db::ThrowIfError(repository_->UpsertRelease(tx, release), "upsert release " + metadata.name + " " + metadata.version);
  if (entry.created) {
    aggregator_.Recompute(tx, release.id);
  }

  entry.release = std::move(release);
  return entry;
}

CatalogEntry ReleaseCatalog::EnsureRelease(db::Transaction& tx, const std::string& name, const std::string& version) {
  CatalogEntry entry;
  entry.package = UpsertPackage(tx, name);

  if (auto existing = repository_->GetRelease(tx, entry.package.id, version)) {
    entry.release = std::move(*existing);
    return entry;
  }

  entry.release.package_id = entry.package.id;
  entry.release.version    = version;
  db::ThrowIfError(repository_->UpsertRelease(tx, entry.release), "create release " + name + " " + version);
  aggregator_.Recompute(tx, entry.release.id);
  entry.created = true;
  return entry;
}

std::optional<CatalogEntry> ReleaseCatalog::Find(db::Transaction& tx, const std::string& name, const std::string& version) {
  auto package = repository_->GetPackage(tx, util::NormalizeName(name));
  if (!package) {
    return std::nullopt;
  }
  auto release = repository_->GetRelease(tx, package->id, version);
  if (!release) {
    return std::nullopt;
  }
  return CatalogEntry{std::move(*package), std::move(*release), false};
}

bool ReleaseCatalog::SetYanked(db::Transaction& tx, const std::string& name, const std::string& version, bool yanked) {
  auto entry = Find(tx, name, version);
  if (!entry) {
    return false;
  }
  if (entry->release.yanked != yanked) {
    db::ThrowIfError(repository_->SetReleaseYanked(tx, entry->release.id, yanked), "set yanked " + name + " " + version);
  }
  RefreshLatest(tx, entry->package.id);
  return true;
}

bool ReleaseCatalog::RemoveRelease(db::Transaction& tx, const std::string& name, const std::string& version) {
  auto entry = Find(tx, name, version);
  if (!entry) {
    return false;
  }
  db::ThrowIfError(repository_->DeleteRelease(tx, entry->release.id), "delete release " + name + " " + version);
  RefreshLatest(tx, entry->package.id);
  return true;
}

std::optional<uint64_t> ReleaseCatalog::RemovePackage(db::Transaction& tx, const std::string& name) {
  auto package = repository_->GetPackage(tx, util::NormalizeName(name));
  if (!package) {
    return std::nullopt;
  }
  const auto releases = repository_->ListReleases(tx, package->id).size();
  db::ThrowIfError(repository_->DeletePackage(tx, package->id), "delete package " + package->normalized_name);
  return static_cast<uint64_t>(releases);
}

void ReleaseCatalog::RefreshLatest(db::Transaction& tx, uint64_t package_id) {
  const db::model::ReleaseRecord* best_stable = nullptr;
  const db::model::ReleaseRecord* best_pre    = nullptr;

  const auto releases = repository_->ListReleases(tx, package_id);
  for (const auto& release : releases) {
    if (release.yanked) continue;
    auto*& best = util::IsPrerelease(release.version) ? best_pre : best_stable;
    if (!best || util::CompareVersions(release.version, best->version) > 0) {
      best = &release;
    }
  }

  const uint64_t latest = best_stable ? best_stable->id : (best_pre ? best_pre->id : 0);

  auto package = repository_->GetPackageById(tx, package_id);
  if (package && package->latest_release_id != latest) {
    db::ThrowIfError(repository_->SetLatestRelease(tx, package_id, latest), "set latest release");
  }
}

} // namespace docbuild::catalog
