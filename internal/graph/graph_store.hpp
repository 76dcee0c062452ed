#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/traversal.hpp"

namespace storygraph::graph {

/*
  Story graph operations.

  Each call is one repository transaction: a splice, a delete with its
  re-parenting and branch repointing, or an activation either lands
  completely or not at all.

  Structural preconditions raise util::NotFound / util::StructuralViolation.
  Reads never throw for dangling or cyclic links; they stop walking.
*/
class GraphStore {
 public:
  explicit GraphStore(std::shared_ptr<db::Repository> repository);

  // Child of parent_id, or a root when parent_id is absent.
  // set_active unset: activate only when the parent has no active child.
  Snippet CreateSnippet(const std::string& story, const std::string& content, const std::string& kind,
                        const std::optional<std::string>& parent_id = std::nullopt, std::optional<bool> set_active = std::nullopt);

  // Alternate sibling of target_id.
  Snippet RegenerateSnippet(const std::string& story, const std::string& target_id, const std::string& content, const std::string& kind,
                            bool set_active = true);

  void ChooseActiveChild(const std::string& story, const std::string& parent_id, const std::string& child_id);

  SnippetPath MainPath(const std::string& story);
  SnippetPath PathFromHead(const std::string& story, const std::string& head_id);

  static std::string BuildText(const SnippetPath& path);

  Snippet InsertAbove(const std::string& story, const std::string& target_id, const std::string& content, const std::string& kind,
                      bool set_active = true);
  Snippet InsertBelow(const std::string& story, const std::string& parent_id, const std::string& content, const std::string& kind,
                      bool set_active = true);

  Snippet UpdateSnippet(const std::string& id, const std::optional<std::string>& content, const std::optional<std::string>& kind);

  // false when absent or owned by another story.
  bool DeleteSnippet(const std::string& story, const std::string& id);

  std::optional<Snippet> Get(const std::string& id);
  std::optional<Snippet> Root(const std::string& story);
  std::vector<Snippet>   ListChildren(const std::string& story, const std::string& parent_id);
  bool                   HasChildren(const std::string& story, const std::string& parent_id);

 private:
  Snippet CreateInTx(db::Transaction& tx, const std::string& story, const std::string& content, const std::string& kind,
                     const std::optional<std::string>& parent_id, std::optional<bool> set_active);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace storygraph::graph
