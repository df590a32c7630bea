#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace atomicswap::db::sql {

// A store able to run DDL, one statement per call.
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

struct Migration {
  std::string_view name;
  std::string      sql;
};

using Schema = std::vector<Migration>;

// Applies every step in order on each start; all steps are IF NOT EXISTS.
// A failing step is rethrown as runtime_error naming the step.
void RunMigrations(MigrationExecutor& executor, const Schema& schema);

const Schema& SqliteSchema();
const Schema& PostgresSchema();

} // namespace atomicswap::db::sql
