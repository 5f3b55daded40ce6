#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docbuild::db::sql {

/*
  Backend-agnostic schema bootstrap.

  Each backend implements ExecuteSQL(). Statements are idempotent
  (CREATE ... IF NOT EXISTS) and run in order on every start.
*/

class SchemaExecutor {
 public:
  virtual ~SchemaExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

enum class Dialect { kSqlite, kPostgres };

const std::vector<std::string>& SchemaStatements(Dialect dialect);

void ApplySchema(SchemaExecutor& executor, Dialect dialect);

/*
  List columns (dependencies, targets, doc_targets) are stored as
  newline-joined text. Entries never contain newlines.
*/
std::string              JoinList(const std::vector<std::string>& values);
std::vector<std::string> SplitList(std::string_view text);

} // namespace docbuild::db::sql
