#include "names.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace docbuild::util {

std::string NormalizeName(std::string_view name) {
  std::string normalized;
  normalized.reserve(name.size());
  for (char c : name) {
    if (c == '_') {
      normalized.push_back('-');
    } else {
      normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return normalized;
}

void ValidateName(std::string_view name) {
  if (name.empty()) {
    throw InvalidArgument("package name must not be empty");
  }
  for (char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc) || std::iscntrl(uc)) {
      throw InvalidArgument("package name contains invalid characters: " + std::string(name));
    }
  }
}

bool MatchesLikePattern(std::string_view pattern, std::string_view value) {
  std::size_t p = 0;
  std::size_t v = 0;

  // position after the last '%' and the value index it was tried against
  std::size_t star_p = std::string_view::npos;
  std::size_t star_v = 0;

  while (v < value.size()) {
    if (p < pattern.size() && (pattern[p] == '_' || pattern[p] == value[v])) {
      ++p;
      ++v;
    } else if (p < pattern.size() && pattern[p] == '%') {
      star_p = ++p;
      star_v = v;
    } else if (star_p != std::string_view::npos) {
      p = star_p;
      v = ++star_v;
    } else {
      return false;
    }
  }

  while (p < pattern.size() && pattern[p] == '%') {
    ++p;
  }
  return p == pattern.size();
}

} // namespace docbuild::util
