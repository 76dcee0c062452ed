#include "internal/db/sqlite/sqlite_repository.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/errors.hpp"

namespace {

using storygraph::db::ErrorCode;
using storygraph::db::ThrowIfDbError;
using storygraph::db::model::SnippetRecord;
using storygraph::db::sqlite::SqliteDB;
using storygraph::db::sqlite::SqliteRepository;

std::shared_ptr<SqliteRepository> OpenInMemory() {
  auto db = std::make_shared<SqliteDB>(":memory:", false);
  storygraph::db::sql::RunMigrations(*db, storygraph::db::sql::SqliteSchema());
  return std::make_shared<SqliteRepository>(std::move(db));
}

SnippetRecord Row(const std::string& id) {
  SnippetRecord row;
  row.id            = id;
  row.story         = "tale";
  row.kind          = "user";
  row.content       = id;
  row.created_at_ms = 1;
  return row;
}

void TestDuplicateIdIsAlreadyExists() {
  auto repo = OpenInMemory();
  {
    auto tx = repo->Begin();
    assert(repo->InsertSnippet(*tx, Row("x")));
    tx->Commit();
  }

  auto tx        = repo->Begin();
  auto duplicate = repo->InsertSnippet(*tx, Row("x"));
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);
  assert(duplicate.message.find("UNIQUE") != std::string::npos);

  bool already_exists = false;
  try {
    ThrowIfDbError(duplicate, "insert");
  } catch (const storygraph::util::AlreadyExists&) {
    already_exists = true;
  }
  assert(already_exists);
}

void TestDuplicateInsideBatchRollsBack() {
  auto repo = OpenInMemory();
  {
    auto tx     = repo->Begin();
    auto result = repo->InsertSnippets(*tx, {Row("a"), Row("b"), Row("a")});
    assert(result.code == ErrorCode::AlreadyExists);
  }

  auto tx = repo->Begin();
  assert(!repo->GetSnippet(*tx, "a").has_value());
  assert(!repo->GetSnippet(*tx, "b").has_value());
}

void TestUpdateOfMissingRowIsNotFound() {
  auto repo   = OpenInMemory();
  auto tx     = repo->Begin();
  auto result = repo->UpdateSnippet(*tx, Row("ghost"));
  assert(result.code == ErrorCode::NotFound);
}

} // namespace

int main() {
  TestDuplicateIdIsAlreadyExists();
  TestDuplicateInsideBatchRollsBack();
  TestUpdateOfMissingRowIsNotFound();

  std::cout << "storygraph_unit_sqlite_repository: pass\n";
  return 0;
}
