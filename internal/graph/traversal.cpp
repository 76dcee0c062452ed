#include "internal/graph/traversal.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/observability/logging.hpp"

namespace storygraph::graph {

using storygraph::observability::IntField;
using storygraph::observability::StringField;

std::optional<Snippet> FindInStory(db::Repository& repo, db::Transaction& tx, const std::string& story, const std::string& id) {
  auto row = repo.GetSnippet(tx, id);
  if (!row || row->story != story) {
    return std::nullopt;
  }
  return row;
}

std::optional<Snippet> CanonicalRoot(db::Repository& repo, db::Transaction& tx, const std::string& story) {
  db::SnippetQuery query;
  query.story      = story;
  query.roots_only = true;
  query.order      = db::SortOrder::Descending;
  query.limit      = 2;

  auto roots = repo.ListSnippets(tx, query);
  if (roots.empty()) {
    return std::nullopt;
  }
  if (roots.size() > 1) {
    STORYGRAPH_LOG_WARN("story has more than one root; using the most recent",
                        {StringField("story", story), StringField("root_id", roots.front().id)});
  }
  return roots.front();
}

SnippetPath WalkMainPath(db::Repository& repo, db::Transaction& tx, const std::string& story) {
  auto root = CanonicalRoot(repo, tx, story);
  if (!root) {
    return {};
  }

  SnippetPath                     path{*root};
  std::unordered_set<std::string> visited{root->id};

  while (path.back().child_id) {
    auto child = FindInStory(repo, tx, story, *path.back().child_id);
    if (!child) {
      break;
    }
    if (!visited.insert(child->id).second) {
      STORYGRAPH_LOG_WARN("cycle in active-child links; main path cut short",
                          {StringField("story", story), StringField("snippet_id", child->id), IntField("length", static_cast<int64_t>(path.size()))});
      break;
    }
    path.push_back(std::move(*child));
  }
  return path;
}

SnippetPath WalkFromHead(db::Repository& repo, db::Transaction& tx, const std::string& story, const std::string& head_id) {
  auto head = FindInStory(repo, tx, story, head_id);
  if (!head) {
    return {};
  }

  SnippetPath                     chain{*head};
  std::unordered_set<std::string> visited{head->id};

  while (chain.back().parent_id) {
    auto parent = FindInStory(repo, tx, story, *chain.back().parent_id);
    if (!parent || !visited.insert(parent->id).second) {
      break;
    }
    chain.push_back(std::move(*parent));
  }

  std::reverse(chain.begin(), chain.end());
  return chain;
}

std::string BuildText(const SnippetPath& path) {
  std::string text;
  for (const auto& snippet : path) {
    if (snippet.content.empty()) {
      continue;
    }
    if (!text.empty()) {
      text += "\n\n";
    }
    text += snippet.content;
  }
  return text;
}

} // namespace storygraph::graph
