#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/branch/branch_index.hpp"
#include "internal/graph/graph_store.hpp"
#include "service_context.hpp"

namespace storygraph::service {

struct AppendRequest {
  std::string                story;
  std::string                content;
  std::string                kind = "ai";
  std::optional<std::string> parent_id;
  std::optional<bool>        set_active;
  std::string                branch;
};

struct RegenerateRequest {
  std::string story;
  std::string target_id;
  std::string content;
  std::string kind       = "ai";
  bool        set_active = true;
  std::string branch;
};

struct ChooseActiveRequest {
  std::string story;
  std::string parent_id;
  std::string child_id;
  std::string branch;
};

struct InsertAboveRequest {
  std::string story;
  std::string target_id;
  std::string content;
  std::string kind       = "ai";
  bool        set_active = true;
};

struct InsertBelowRequest {
  std::string story;
  std::string parent_id;
  std::string content;
  std::string kind = "ai";
  std::string branch;
};

struct UpdateRequest {
  std::string                id;
  std::optional<std::string> content;
  std::optional<std::string> kind;
};

struct BranchPath {
  std::string                story;
  std::optional<std::string> head_id; // last node of path
  graph::SnippetPath         path;
  std::string                text;
};

struct TreeRow {
  graph::Snippet              parent;
  std::vector<graph::Snippet> children;
};

struct StoryTree {
  std::string          story;
  std::vector<TreeRow> rows;
};

struct BranchHealthReport {
  std::string                                   story;
  bool                                          healthy = true;
  std::map<std::string, branch::HeadValidation> branches;
};

/*
  Request-level operations on one story: graph mutation plus the branch
  bookkeeping that goes with it, and branch-aware path resolution.

  Snippet writes and the following branch move are separate
  transactions; the snippet write is never undone when the branch move
  fails.
*/
class StoryService {
 public:
  explicit StoryService(ServiceContext ctx);

  graph::Snippet Append(const AppendRequest& req);
  graph::Snippet Regenerate(const RegenerateRequest& req);
  void           ChooseActive(const ChooseActiveRequest& req);
  graph::Snippet InsertAbove(const InsertAboveRequest& req);
  graph::Snippet InsertBelow(const InsertBelowRequest& req);
  graph::Snippet Update(const UpdateRequest& req);

  // story_hint, when non-empty, must match the snippet's story.
  void Delete(const std::string& id, const std::string& story_hint = {});

  BranchPath ResolvePath(const std::string& story, const std::string& branch = {}, const std::optional<std::string>& head_id = std::nullopt);

  StoryTree          TreeForMainPath(const std::string& story);
  BranchHealthReport BranchHealth(const std::string& story);

  const std::string& DefaultBranch() const {
    return ctx_.default_branch;
  }

 private:
  std::string BranchName(const std::string& requested) const;
  void        MoveBranch(const std::string& story, const std::string& name, const std::string& head_id);

  ServiceContext ctx_;
};

} // namespace storygraph::service
