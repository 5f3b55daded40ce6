#include "internal/queue/admission.hpp"

#include <cassert>
#include <iostream>
#include <vector>

namespace {

using docbuild::db::model::PriorityRuleRecord;
using docbuild::queue::BlacklistFilter;
using docbuild::queue::kDefaultPriority;
using docbuild::queue::kNewReleasePriority;
using docbuild::queue::PriorityResolver;

void TestFirstRuleInIdOrderWins() {
  // ids out of order on purpose; resolution follows id
  std::vector<PriorityRuleRecord> rules{
      {.id = 7, .pattern = "aws-%", .priority = 30},
      {.id = 2, .pattern = "aws-sdk-%", .priority = 40},
  };
  PriorityResolver resolver(rules);

  assert(resolver.ResolveByRules("aws-sdk-s3") == 40);
  assert(resolver.ResolveByRules("aws-config") == 30);
  assert(resolver.ResolveByRules("serde") == kDefaultPriority);
}

void TestNewReleasesJumpTheRules() {
  PriorityResolver resolver({{.id = 1, .pattern = "%", .priority = 50}});

  assert(resolver.Resolve("serde", true) == kNewReleasePriority);
  assert(resolver.Resolve("serde", false) == 50);
}

void TestRulesMatchNormalizedNames() {
  PriorityResolver resolver({{.id = 1, .pattern = "windows-%", .priority = 25}}, 3);

  assert(resolver.ResolveByRules("Windows_Sys") == 25);
  assert(resolver.ResolveByRules("winapi") == 3);
}

void TestBlacklistIsNameInsensitive() {
  BlacklistFilter filter({"bad-crate", "Evil_Crate"});

  assert(filter.IsBlocked("bad-crate"));
  assert(filter.IsBlocked("Bad_Crate"));
  assert(filter.IsBlocked("evil-crate"));
  assert(!filter.IsBlocked("good-crate"));
}

} // namespace

int main() {
  TestFirstRuleInIdOrderWins();
  TestNewReleasesJumpTheRules();
  TestRulesMatchNormalizedNames();
  TestBlacklistIsNameInsensitive();

  std::cout << "docbuild_unit_admission: pass\n";
  return 0;
}
