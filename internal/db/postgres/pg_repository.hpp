#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace storygraph::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
