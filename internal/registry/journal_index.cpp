#include "journal_index.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"

namespace docbuild::registry {

using docbuild::v1::IndexEvent;

namespace {

bool IsBlank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

uint64_t ParseSequenceReference(const std::string& reference) {
  if (reference.empty()) {
    return 0;
  }
  uint64_t value = 0;
  auto [end, ec] = std::from_chars(reference.data(), reference.data() + reference.size(), value);
  if (ec != std::errc() || end != reference.data() + reference.size()) {
    throw util::InvalidArgument("invalid journal reference: " + reference);
  }
  return value;
}

JournalIndex::JournalIndex(std::string path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("journal path is required");
  }
}

std::optional<IndexEvent> JournalIndex::ParseLine(const std::string& line) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  IndexEvent event;
  if (!google::protobuf::util::JsonStringToMessage(line, &event, options).ok()) {
    return std::nullopt;
  }
  if (event.seq() == 0 || event.kind() == IndexEvent::KIND_UNSPECIFIED || event.name().empty()) {
    return std::nullopt;
  }
  if (event.vers().empty() && event.kind() != IndexEvent::DELETE_PACKAGE) {
    return std::nullopt;
  }
  return event;
}

std::optional<IndexChange> JournalIndex::ToChange(const IndexEvent& event) {
  IndexChange change;
  change.release.name    = event.name();
  change.release.version = event.vers();

  switch (event.kind()) {
    case IndexEvent::PUBLISH:
      change.kind               = ChangeKind::kAdded;
      change.release.yanked     = event.yanked();
      change.release.is_library = event.has_has_lib() ? event.has_lib() : true;
      change.release.dependencies.assign(event.deps().begin(), event.deps().end());
      if (!event.default_target().empty()) {
        change.release.targets.push_back(event.default_target());
      }
      for (const auto& target : event.targets()) {
        if (std::find(change.release.targets.begin(), change.release.targets.end(), target) == change.release.targets.end()) {
          change.release.targets.push_back(target);
        }
      }
      return change;
    case IndexEvent::YANK:
      change.kind = ChangeKind::kYanked;
      return change;
    case IndexEvent::UNYANK:
      change.kind = ChangeKind::kUnyanked;
      return change;
    case IndexEvent::DELETE_VERSION:
      change.kind = ChangeKind::kVersionDeleted;
      return change;
    case IndexEvent::DELETE_PACKAGE:
      change.kind            = ChangeKind::kPackageDeleted;
      change.release.version.clear();
      return change;
    default:
      return std::nullopt;
  }
}

template <typename Fn>
void JournalIndex::ForEachEvent(Fn&& fn) {
  std::ifstream in(path_);
  if (!in) {
    throw util::RegistryUnavailable("cannot open registry journal: " + path_);
  }

  std::string line;
  uint64_t    line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (IsBlank(line)) {
      continue;
    }
    auto event = ParseLine(line);
    if (!event) {
      DOCBUILD_LOG_WARN("skipping malformed journal line",
                        {observability::StringField("path", path_), observability::IntField("line", static_cast<int64_t>(line_no))});
      continue;
    }
    fn(*event);
  }

  if (in.bad()) {
    throw util::RegistryUnavailable("error reading registry journal: " + path_);
  }
}

std::string JournalIndex::HeadReference() {
  uint64_t head = 0;
  ForEachEvent([&](const IndexEvent& event) { head = std::max(head, event.seq()); });
  return std::to_string(head);
}

IndexDiff JournalIndex::ChangesSince(const std::string& reference) {
  const uint64_t since = ParseSequenceReference(reference);
  uint64_t       head  = since;

  IndexDiff diff;
  ForEachEvent([&](const IndexEvent& event) {
    if (event.seq() <= since) {
      return;
    }
    head = std::max(head, event.seq());
    if (auto change = ToChange(event)) {
      diff.changes.push_back(std::move(*change));
    }
  });

  diff.new_reference = std::to_string(head);
  return diff;
}

IndexSnapshot JournalIndex::Snapshot() {
  IndexSnapshot snapshot;
  ForEachEvent([&](const IndexEvent& event) {
    auto change = ToChange(event);
    if (!change) {
      return;
    }

    const auto normalized = util::NormalizeName(change->release.name);
    switch (change->kind) {
      case ChangeKind::kAdded: {
        auto& package = snapshot[normalized];
        if (package.name.empty()) {
          package.name = change->release.name;
        }
        package.versions[change->release.version] = std::move(change->release);
        break;
      }
      case ChangeKind::kYanked:
      case ChangeKind::kUnyanked: {
        auto package = snapshot.find(normalized);
        if (package == snapshot.end()) break;
        auto version = package->second.versions.find(change->release.version);
        if (version != package->second.versions.end()) {
          version->second.yanked = change->kind == ChangeKind::kYanked;
        }
        break;
      }
      case ChangeKind::kVersionDeleted: {
        auto package = snapshot.find(normalized);
        if (package == snapshot.end()) break;
        package->second.versions.erase(change->release.version);
        if (package->second.versions.empty()) {
          snapshot.erase(package);
        }
        break;
      }
      case ChangeKind::kPackageDeleted:
        snapshot.erase(normalized);
        break;
    }
  });
  return snapshot;
}

std::string JournalIndex::RepositoryUrl() const {
  return "file://" + std::filesystem::absolute(path_).string();
}

} // namespace docbuild::registry
