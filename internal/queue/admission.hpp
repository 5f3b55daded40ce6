#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/admission_records.hpp"

namespace docbuild::queue {

// lower = more urgent
inline constexpr int32_t kNewReleasePriority       = 0;
inline constexpr int32_t kDefaultPriority          = 5;
inline constexpr int32_t kConsistencyCheckPriority = 15;
inline constexpr int32_t kRebuildPriority          = 20;

/*
  PriorityResolver

  Pure. Built from a snapshot of the priority rules; never reads the
  database itself.
*/
class PriorityResolver {
 public:
  explicit PriorityResolver(std::vector<db::model::PriorityRuleRecord> rules, int32_t default_priority = kDefaultPriority);

  // is_new: the release did not exist before the current sync.
  int32_t Resolve(std::string_view name, bool is_new) const;

  // First matching rule in id order, or the default.
  int32_t ResolveByRules(std::string_view name) const;

 private:
  std::vector<db::model::PriorityRuleRecord> rules_;
  int32_t                                    default_priority_;
};

class BlacklistFilter {
 public:
  explicit BlacklistFilter(const std::vector<std::string>& normalized_names);

  bool IsBlocked(std::string_view name) const;

 private:
  std::set<std::string, std::less<>> names_;
};

} // namespace docbuild::queue
