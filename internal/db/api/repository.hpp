#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/branch_record.hpp"
#include "internal/db/model/snippet_record.hpp"

namespace storygraph::db {

enum class SortOrder {
  Ascending,
  Descending
};

/*
  Snippet row filter.

  All set fields must match. Rows are ordered by creation
  (created_at_ms, then insertion sequence).
*/
struct SnippetQuery {
  std::string                story;
  std::optional<std::string> parent_id;
  std::optional<std::string> child_id;
  bool                       roots_only = false; // parent_id IS NULL

  SortOrder                  order = SortOrder::Ascending;
  std::optional<std::size_t> limit;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Structural operations on the story graph run as one
    transaction, so a failure never leaves half a splice behind

  The DB is the source of truth for:
    snippets
    branches
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Snippets
  // ---------------------------------------------------------------------

  virtual Result InsertSnippet(Transaction&, const model::SnippetRecord&) = 0;

  // Inserts in the given order; later rows count as more recent on ties.
  virtual Result InsertSnippets(Transaction&, const std::vector<model::SnippetRecord>&) = 0;

  virtual std::optional<model::SnippetRecord> GetSnippet(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::SnippetRecord> ListSnippets(Transaction&, const SnippetQuery&) = 0;

  // Rewrites parent_id, child_id, kind and content of an existing row.
  virtual Result UpdateSnippet(Transaction&, const model::SnippetRecord&) = 0;

  virtual Result DeleteSnippet(Transaction&, const std::string& id) = 0;

  virtual Result DeleteSnippetsByStory(Transaction&, const std::string& story) = 0;

  // Distinct story names, ascending.
  virtual std::vector<std::string> ListStories(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Branches
  // ---------------------------------------------------------------------

  // Insert or move head_id on (story, name); created_at_ms of an
  // existing row is kept.
  virtual Result UpsertBranch(Transaction&, const model::BranchRecord&) = 0;

  virtual std::optional<model::BranchRecord> GetBranch(Transaction&, const std::string& story, const std::string& name) = 0;

  // Newest first.
  virtual std::vector<model::BranchRecord> ListBranches(Transaction&, const std::string& story) = 0;

  virtual Result DeleteBranch(Transaction&, const std::string& story, const std::string& name) = 0;

  virtual Result DeleteBranchesByStory(Transaction&, const std::string& story) = 0;

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  // Removes every snippet and branch of every story.
  virtual Result DeleteAll(Transaction&) = 0;
};

} // namespace storygraph::db
