#pragma once

#include <string>
#include <string_view>

namespace docbuild::util {

/*
  Semantic version ordering used to pick a package's latest release.

  Returns <0, 0, >0. Build metadata ("+...") is ignored, a pre-release
  sorts before the release it precedes. Versions that do not parse as
  MAJOR.MINOR.PATCH fall back to plain string comparison.
*/
int CompareVersions(std::string_view lhs, std::string_view rhs);

bool IsPrerelease(std::string_view version);

} // namespace docbuild::util
