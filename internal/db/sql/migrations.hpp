#pragma once

#include <string>
#include <vector>

namespace chatlog::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor; the schema itself is a list of
  numbered migrations per dialect. Applied versions are recorded in
  schema_migrations and never re-run.
*/

struct Migration {
  int                      version = 0;
  std::vector<std::string> statements;
};

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest recorded version, 0 on a fresh database.
  virtual int CurrentVersion() = 0;

  virtual void RecordVersion(int version) = 0;
};

/*
  Runs migrations in order.
  Returns the number of migrations applied.
*/
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

const std::vector<Migration>& SqliteMigrations();
const std::vector<Migration>& PostgresMigrations();

} // namespace chatlog::db::sql
