#include "migrations.hpp"

namespace storygraph::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS snippets (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, story TEXT NOT NULL, parent_id TEXT, child_id TEXT, kind TEXT NOT NULL, content TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_snippets_story ON snippets(story);",
      "CREATE INDEX IF NOT EXISTS idx_snippets_story_parent ON snippets(story, parent_id);",
      "CREATE INDEX IF NOT EXISTS idx_snippets_story_child ON snippets(story, child_id);",
      "CREATE TABLE IF NOT EXISTS branches (seq INTEGER PRIMARY KEY AUTOINCREMENT, story TEXT NOT NULL, name TEXT NOT NULL, head_id TEXT NOT NULL, created_at_ms INTEGER NOT NULL, UNIQUE(story, name));"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS snippets (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, story TEXT NOT NULL, parent_id TEXT, child_id TEXT, kind TEXT NOT NULL, content TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_snippets_story ON snippets(story);",
      "CREATE INDEX IF NOT EXISTS idx_snippets_story_parent ON snippets(story, parent_id);",
      "CREATE INDEX IF NOT EXISTS idx_snippets_story_child ON snippets(story, child_id);",
      "CREATE TABLE IF NOT EXISTS branches (seq BIGSERIAL PRIMARY KEY, story TEXT NOT NULL, name TEXT NOT NULL, head_id TEXT NOT NULL, created_at_ms BIGINT NOT NULL, UNIQUE(story, name));"};
  return kSchema;
}

} // namespace storygraph::db::sql
