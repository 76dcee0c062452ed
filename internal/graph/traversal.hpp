#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/snippet_record.hpp"

namespace storygraph::graph {

using Snippet     = db::model::SnippetRecord;
using SnippetPath = std::vector<Snippet>;

/*
  Traversal primitives shared by the graph store, the branch index
  and the story lifecycle. All run inside the caller's transaction.

  Every walk carries a visited set: the data may have been written by
  an interrupted splice or another writer, so cycles and dangling ids
  are expected inputs, not programming errors.
*/

// Snippet by id, only if it belongs to `story`.
std::optional<Snippet> FindInStory(db::Repository& repo, db::Transaction& tx, const std::string& story, const std::string& id);

// Most recently created parentless snippet. Logs when more than one exists.
std::optional<Snippet> CanonicalRoot(db::Repository& repo, db::Transaction& tx, const std::string& story);

// Root, then child_id links until none, missing, foreign or revisited.
SnippetPath WalkMainPath(db::Repository& repo, db::Transaction& tx, const std::string& story);

// Root-to-head order. Empty when the head is missing or foreign.
SnippetPath WalkFromHead(db::Repository& repo, db::Transaction& tx, const std::string& story, const std::string& head_id);

// Non-empty contents joined by a blank line.
std::string BuildText(const SnippetPath& path);

} // namespace storygraph::graph
