#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/branch_record.hpp"

namespace storygraph::branch {

using Branch = db::model::BranchRecord;

struct HeadValidation {
  bool                       valid = false;
  std::optional<std::string> reason; // "head not found", "dangling parent reference", "cycle detected"
};

/*
  Named heads per story.

  Branches are pointers only; moving or deleting one never touches the
  snippet graph. Validation reports corruption as a value, and repair
  moves a corrupted branch back to the nearest sound ancestor.
*/
class BranchIndex {
 public:
  explicit BranchIndex(std::shared_ptr<db::Repository> repository);

  Branch                UpsertBranch(const std::string& story, const std::string& name, const std::string& head_id);
  std::vector<Branch>   ListBranches(const std::string& story);
  std::optional<Branch> GetBranch(const std::string& story, const std::string& name);
  void                  DeleteBranch(const std::string& story, const std::string& name);

  HeadValidation ValidateBranchHead(const std::string& story, const std::string& head_id);

  // New (or unchanged) head, or nullopt when nothing valid is reachable.
  std::optional<std::string> RepairBranchHead(const std::string& story, const std::string& name);

  // Transaction-scoped form, shared with callers that already hold one.
  static HeadValidation ValidateInTx(db::Repository& repo, db::Transaction& tx, const std::string& story, const std::string& head_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace storygraph::branch
