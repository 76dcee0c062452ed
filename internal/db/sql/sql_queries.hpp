#pragma once

namespace storygraph::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Postgres installs $n-parameter equivalents as prepared statements
  (see PgPool::PrepareStatements).

  Row order: created_at_ms, then seq (insertion order).
*/

static constexpr const char* SNIPPET_COLUMNS =
    "id,story,parent_id,child_id,kind,content,created_at_ms";

static constexpr const char* INSERT_SNIPPET =
    "INSERT INTO snippets(id,story,parent_id,child_id,kind,content,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SNIPPET =
    "SELECT id,story,parent_id,child_id,kind,content,created_at_ms"
    " FROM snippets WHERE id=?;";

static constexpr const char* UPDATE_SNIPPET =
    "UPDATE snippets SET parent_id=?,child_id=?,kind=?,content=?"
    " WHERE id=?;";

static constexpr const char* DELETE_SNIPPET =
    "DELETE FROM snippets WHERE id=?;";

static constexpr const char* DELETE_SNIPPETS_BY_STORY =
    "DELETE FROM snippets WHERE story=?;";

static constexpr const char* SELECT_STORIES =
    "SELECT DISTINCT story FROM snippets ORDER BY story ASC;";

// branches

static constexpr const char* UPSERT_BRANCH =
    "INSERT INTO branches(story,name,head_id,created_at_ms)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(story,name) DO UPDATE SET"
    " head_id=excluded.head_id;";

static constexpr const char* SELECT_BRANCH =
    "SELECT story,name,head_id,created_at_ms"
    " FROM branches WHERE story=? AND name=?;";

static constexpr const char* SELECT_BRANCHES_BY_STORY =
    "SELECT story,name,head_id,created_at_ms"
    " FROM branches WHERE story=?"
    " ORDER BY created_at_ms DESC, seq DESC;";

static constexpr const char* DELETE_BRANCH =
    "DELETE FROM branches WHERE story=? AND name=?;";

static constexpr const char* DELETE_BRANCHES_BY_STORY =
    "DELETE FROM branches WHERE story=?;";

// maintenance

static constexpr const char* DELETE_ALL_BRANCHES = "DELETE FROM branches;";
static constexpr const char* DELETE_ALL_SNIPPETS = "DELETE FROM snippets;";

} // namespace storygraph::db::sql
