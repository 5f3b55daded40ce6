#include "version.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <vector>

namespace docbuild::util {

namespace {

struct ParsedVersion {
  uint64_t                      major = 0;
  uint64_t                      minor = 0;
  uint64_t                      patch = 0;
  std::vector<std::string_view> prerelease;
};

std::optional<uint64_t> ParseNumber(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  uint64_t   value = 0;
  const auto res   = std::from_chars(text.data(), text.data() + text.size(), value);
  if (res.ec != std::errc{} || res.ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string_view> Split(std::string_view text, char sep) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  while (true) {
    const auto pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

std::optional<ParsedVersion> Parse(std::string_view version) {
  if (const auto plus = version.find('+'); plus != std::string_view::npos) {
    version = version.substr(0, plus);
  }

  std::string_view core = version;
  std::string_view pre;
  if (const auto dash = version.find('-'); dash != std::string_view::npos) {
    core = version.substr(0, dash);
    pre  = version.substr(dash + 1);
  }

  const auto numbers = Split(core, '.');
  if (numbers.size() != 3) {
    return std::nullopt;
  }

  ParsedVersion parsed;
  auto          major = ParseNumber(numbers[0]);
  auto          minor = ParseNumber(numbers[1]);
  auto          patch = ParseNumber(numbers[2]);
  if (!major || !minor || !patch) {
    return std::nullopt;
  }
  parsed.major = *major;
  parsed.minor = *minor;
  parsed.patch = *patch;
  if (!pre.empty()) {
    parsed.prerelease = Split(pre, '.');
  }
  return parsed;
}

int CompareIdentifier(std::string_view lhs, std::string_view rhs) {
  const auto lnum = ParseNumber(lhs);
  const auto rnum = ParseNumber(rhs);
  if (lnum && rnum) {
    return *lnum < *rnum ? -1 : (*lnum > *rnum ? 1 : 0);
  }
  // numeric identifiers have lower precedence than alphanumeric ones
  if (lnum) return -1;
  if (rnum) return 1;
  return lhs.compare(rhs) < 0 ? -1 : (lhs == rhs ? 0 : 1);
}

} // namespace

int CompareVersions(std::string_view lhs, std::string_view rhs) {
  const auto l = Parse(lhs);
  const auto r = Parse(rhs);
  if (!l || !r) {
    const int cmp = lhs.compare(rhs);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
  }

  if (l->major != r->major) return l->major < r->major ? -1 : 1;
  if (l->minor != r->minor) return l->minor < r->minor ? -1 : 1;
  if (l->patch != r->patch) return l->patch < r->patch ? -1 : 1;

  if (l->prerelease.empty() || r->prerelease.empty()) {
    if (l->prerelease.empty() && r->prerelease.empty()) return 0;
    return l->prerelease.empty() ? 1 : -1;
  }

  const auto n = std::min(l->prerelease.size(), r->prerelease.size());
  for (std::size_t i = 0; i < n; ++i) {
    if (const int cmp = CompareIdentifier(l->prerelease[i], r->prerelease[i]); cmp != 0) {
      return cmp;
    }
  }
  if (l->prerelease.size() == r->prerelease.size()) return 0;
  return l->prerelease.size() < r->prerelease.size() ? -1 : 1;
}

bool IsPrerelease(std::string_view version) {
  const auto parsed = Parse(version);
  return parsed && !parsed->prerelease.empty();
}

} // namespace docbuild::util
