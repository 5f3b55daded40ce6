#pragma once

#include "docbuild/v1/types.pb.h"
#include "docbuild/v1/registry.pb.h"

#include "docbuild/v1/admin_service.pb.h"
#include "docbuild/v1/query_service.pb.h"

namespace docbuild::v1 {

inline constexpr const char* kAdminServiceName = "docbuild.v1.DocBuildAdminService";
inline constexpr const char* kQueryServiceName = "docbuild.v1.DocBuildQueryService";

} // namespace docbuild::v1
