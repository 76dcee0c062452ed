#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace storygraph::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSnippet(Transaction&, const model::SnippetRecord&) override;
  Result InsertSnippets(Transaction&, const std::vector<model::SnippetRecord>&) override;
  std::optional<model::SnippetRecord> GetSnippet(Transaction&, const std::string&) override;
  std::vector<model::SnippetRecord> ListSnippets(Transaction&, const SnippetQuery&) override;
  Result UpdateSnippet(Transaction&, const model::SnippetRecord&) override;
  Result DeleteSnippet(Transaction&, const std::string&) override;
  Result DeleteSnippetsByStory(Transaction&, const std::string&) override;
  std::vector<std::string> ListStories(Transaction&) override;

  Result UpsertBranch(Transaction&, const model::BranchRecord&) override;
  std::optional<model::BranchRecord> GetBranch(
      Transaction&, const std::string& story, const std::string& name) override;
  std::vector<model::BranchRecord> ListBranches(Transaction&, const std::string& story) override;
  Result DeleteBranch(Transaction&, const std::string& story, const std::string& name) override;
  Result DeleteBranchesByStory(Transaction&, const std::string& story) override;

  Result DeleteAll(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
