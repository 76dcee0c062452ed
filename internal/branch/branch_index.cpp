#include "branch_index.hpp"

#include <stdexcept>
#include <unordered_set>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/graph/traversal.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace storygraph::branch {

using storygraph::db::ThrowIfDbError;
using storygraph::observability::StringField;

namespace {

HeadValidation Invalid(const char* reason) {
  return HeadValidation{false, std::string(reason)};
}

// Predecessor of `node` while walking back from a corrupted head: its
// parent when that still exists, else whoever still points at it as the
// active child.
std::optional<graph::Snippet> Predecessor(db::Repository& repo, db::Transaction& tx, const std::string& story, const std::string& node_id,
                                          const std::optional<graph::Snippet>& node, const std::unordered_set<std::string>& visited) {
  if (node && node->parent_id && !visited.contains(*node->parent_id)) {
    if (auto parent = graph::FindInStory(repo, tx, story, *node->parent_id)) {
      return parent;
    }
  }

  db::SnippetQuery query;
  query.story    = story;
  query.child_id = node_id;
  for (auto& candidate : repo.ListSnippets(tx, query)) {
    if (!visited.contains(candidate.id)) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace

BranchIndex::BranchIndex(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("BranchIndex: repository must not be null");
  }
}

Branch BranchIndex::UpsertBranch(const std::string& story, const std::string& name, const std::string& head_id) {
  if (name.empty()) {
    throw util::InvalidArgument("branch name must not be empty");
  }

  auto tx = repository_->Begin();
  if (!graph::FindInStory(*repository_, *tx, story, head_id)) {
    throw util::NotFound("branch head not found: " + head_id);
  }

  Branch branch{story, name, head_id, util::NowMillis()};
  ThrowIfDbError(repository_->UpsertBranch(*tx, branch), "upsert branch");

  auto stored = repository_->GetBranch(*tx, story, name);
  tx->Commit();
  return stored.value_or(branch);
}

std::vector<Branch> BranchIndex::ListBranches(const std::string& story) {
  auto tx = repository_->Begin();
  return repository_->ListBranches(*tx, story);
}

std::optional<Branch> BranchIndex::GetBranch(const std::string& story, const std::string& name) {
  auto tx = repository_->Begin();
  return repository_->GetBranch(*tx, story, name);
}

void BranchIndex::DeleteBranch(const std::string& story, const std::string& name) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteBranch(*tx, story, name), "delete branch");
  tx->Commit();
}

HeadValidation BranchIndex::ValidateInTx(db::Repository& repo, db::Transaction& tx, const std::string& story, const std::string& head_id) {
  auto node = graph::FindInStory(repo, tx, story, head_id);
  if (!node) {
    return Invalid("head not found");
  }

  std::unordered_set<std::string> visited{node->id};
  while (node->parent_id) {
    auto parent = graph::FindInStory(repo, tx, story, *node->parent_id);
    if (!parent) {
      return Invalid("dangling parent reference");
    }
    if (!visited.insert(parent->id).second) {
      return Invalid("cycle detected");
    }
    node = std::move(parent);
  }
  return HeadValidation{true, std::nullopt};
}

HeadValidation BranchIndex::ValidateBranchHead(const std::string& story, const std::string& head_id) {
  auto tx = repository_->Begin();
  return ValidateInTx(*repository_, *tx, story, head_id);
}

std::optional<std::string> BranchIndex::RepairBranchHead(const std::string& story, const std::string& name) {
  auto tx     = repository_->Begin();
  auto branch = repository_->GetBranch(*tx, story, name);
  if (!branch) {
    return std::nullopt;
  }

  if (ValidateInTx(*repository_, *tx, story, branch->head_id).valid) {
    return branch->head_id;
  }

  std::unordered_set<std::string> visited{branch->head_id};
  std::string                     current_id = branch->head_id;
  auto                            current    = graph::FindInStory(*repository_, *tx, story, current_id);

  while (auto previous = Predecessor(*repository_, *tx, story, current_id, current, visited)) {
    visited.insert(previous->id);
    if (ValidateInTx(*repository_, *tx, story, previous->id).valid) {
      const auto old_head = branch->head_id;
      branch->head_id     = previous->id;
      ThrowIfDbError(repository_->UpsertBranch(*tx, *branch), "repair branch");
      tx->Commit();
      STORYGRAPH_LOG_INFO("branch head repaired",
                          {StringField("story", story), StringField("branch", name), StringField("old_head", old_head), StringField("new_head", previous->id)});
      return previous->id;
    }
    current_id = previous->id;
    current    = std::move(previous);
  }

  STORYGRAPH_LOG_WARN("branch head could not be repaired", {StringField("story", story), StringField("branch", name), StringField("head_id", branch->head_id)});
  return std::nullopt;
}

} // namespace storygraph::branch
