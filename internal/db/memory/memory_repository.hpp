#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace storygraph::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // seq orders rows created within the same millisecond.
  struct StoredSnippet {
    model::SnippetRecord record;
    uint64_t             seq = 0;
  };

  struct StoredBranch {
    model::BranchRecord record;
    uint64_t            seq = 0;
  };

  struct State {
    std::unordered_map<std::string, StoredSnippet> snippets;
    std::unordered_map<std::string, StoredBranch>  branches; // key: story#name
    uint64_t next_seq = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
