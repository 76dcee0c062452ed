#include "pg_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace storygraph::db::postgres {

namespace {

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

model::SnippetRecord ReadSnippet(const pqxx::row& row) {
  model::SnippetRecord r;
  r.id            = row[0].c_str();
  r.story         = row[1].c_str();
  r.parent_id     = OptText(row[2]);
  r.child_id      = OptText(row[3]);
  r.kind          = row[4].c_str();
  r.content       = row[5].c_str();
  r.created_at_ms = row[6].as<uint64_t>();
  return r;
}

model::BranchRecord ReadBranch(const pqxx::row& row) {
  model::BranchRecord r;
  r.story         = row[0].c_str();
  r.name          = row[1].c_str();
  r.head_id       = row[2].c_str();
  r.created_at_ms = row[3].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Snippets
// ------------------------------------------------------------------

Result PgRepository::InsertSnippet(Transaction& t, const model::SnippetRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_snippet", r.id, r.story, r.parent_id, r.child_id, r.kind, r.content, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertSnippets(Transaction& t, const std::vector<model::SnippetRecord>& rows) {
  for (const auto& r : rows) {
    auto result = InsertSnippet(t, r);
    if (!result) return result;
  }
  return Result::Ok();
}

std::optional<model::SnippetRecord> PgRepository::GetSnippet(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_snippet", id);
  if (res.empty()) return std::nullopt;
  return ReadSnippet(res[0]);
}

std::vector<model::SnippetRecord> PgRepository::ListSnippets(Transaction& t, const SnippetQuery& q) {
  std::optional<int64_t> limit;
  if (q.limit) limit = static_cast<int64_t>(*q.limit);

  auto res = TX(t).Work().exec_prepared(q.order == SortOrder::Ascending ? "list_snippets_asc" : "list_snippets_desc",
                                        q.story, q.roots_only, q.parent_id, q.child_id, limit);

  std::vector<model::SnippetRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSnippet(row));
  return out;
}

Result PgRepository::UpdateSnippet(Transaction& t, const model::SnippetRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_snippet", r.id, r.parent_id, r.child_id, r.kind, r.content);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "snippet " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSnippet(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_snippet", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSnippetsByStory(Transaction& t, const std::string& story) {
  try {
    TX(t).Work().exec_params("DELETE FROM snippets WHERE story=$1;", story);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::ListStories(Transaction& t) {
  auto res = TX(t).Work().exec(sql::SELECT_STORIES);

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.emplace_back(row[0].c_str());
  return out;
}

// ------------------------------------------------------------------
// Branches
// ------------------------------------------------------------------

Result PgRepository::UpsertBranch(Transaction& t, const model::BranchRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_branch", r.story, r.name, r.head_id, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BranchRecord> PgRepository::GetBranch(Transaction& t, const std::string& story, const std::string& name) {
  auto res = TX(t).Work().exec_prepared("get_branch", story, name);
  if (res.empty()) return std::nullopt;
  return ReadBranch(res[0]);
}

std::vector<model::BranchRecord> PgRepository::ListBranches(Transaction& t, const std::string& story) {
  auto res = TX(t).Work().exec_prepared("list_branches", story);

  std::vector<model::BranchRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadBranch(row));
  return out;
}

Result PgRepository::DeleteBranch(Transaction& t, const std::string& story, const std::string& name) {
  try {
    TX(t).Work().exec_params("DELETE FROM branches WHERE story=$1 AND name=$2;", story, name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteBranchesByStory(Transaction& t, const std::string& story) {
  try {
    TX(t).Work().exec_params("DELETE FROM branches WHERE story=$1;", story);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

Result PgRepository::DeleteAll(Transaction& t) {
  try {
    TX(t).Work().exec(sql::DELETE_ALL_BRANCHES);
    TX(t).Work().exec(sql::DELETE_ALL_SNIPPETS);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace storygraph::db::postgres
