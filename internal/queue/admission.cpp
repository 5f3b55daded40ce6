#include "admission.hpp"

#include <algorithm>

#include "internal/util/names.hpp"

namespace docbuild::queue {

PriorityResolver::PriorityResolver(std::vector<db::model::PriorityRuleRecord> rules, int32_t default_priority)
    : rules_(std::move(rules)), default_priority_(default_priority) {
  std::sort(rules_.begin(), rules_.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
}

int32_t PriorityResolver::Resolve(std::string_view name, bool is_new) const {
  if (is_new) {
    return kNewReleasePriority;
  }
  return ResolveByRules(name);
}

int32_t PriorityResolver::ResolveByRules(std::string_view name) const {
  const auto normalized = util::NormalizeName(name);
  for (const auto& rule : rules_) {
    if (util::MatchesLikePattern(rule.pattern, normalized) || util::MatchesLikePattern(rule.pattern, name)) {
      return rule.priority;
    }
  }
  return default_priority_;
}

BlacklistFilter::BlacklistFilter(const std::vector<std::string>& normalized_names) {
  for (const auto& name : normalized_names) {
    names_.insert(util::NormalizeName(name));
  }
}

bool BlacklistFilter::IsBlocked(std::string_view name) const {
  return names_.contains(util::NormalizeName(name));
}

} // namespace docbuild::queue
