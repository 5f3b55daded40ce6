#pragma once

#include <string>
#include <string_view>

namespace docbuild::util {

/*
  Package names are case-insensitive and treat '-' and '_' as the same
  separator. The normalized form is lowercase with '-' separators and is
  the key used for packages, queue entries, blacklist and overrides.
*/
std::string NormalizeName(std::string_view name);

// Throws InvalidArgument for empty names or names with whitespace/control characters.
void ValidateName(std::string_view name);

/*
  SQL LIKE matching: '%' matches any run (including empty), '_' matches
  exactly one character. Everything else matches itself.
*/
bool MatchesLikePattern(std::string_view pattern, std::string_view value);

} // namespace docbuild::util
