#include "graph_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace storygraph::graph {

using storygraph::db::ThrowIfDbError;
using storygraph::observability::IntField;
using storygraph::observability::StringField;

namespace {

void RequireStory(const std::string& story) {
  if (story.empty()) {
    throw util::InvalidArgument("story name must not be empty");
  }
}

void RequireKind(const std::string& kind) {
  if (kind.empty()) {
    throw util::InvalidArgument("snippet kind must not be empty");
  }
}

Snippet NewSnippet(const std::string& story, const std::string& content, const std::string& kind, const std::optional<std::string>& parent_id) {
  Snippet row;
  row.id            = util::NewId();
  row.story         = story;
  row.parent_id     = parent_id;
  row.kind          = kind;
  row.content       = content;
  row.created_at_ms = util::NowMillis();
  return row;
}

} // namespace

GraphStore::GraphStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("GraphStore: repository must not be null");
  }
}

Snippet GraphStore::CreateInTx(db::Transaction& tx, const std::string& story, const std::string& content, const std::string& kind,
                               const std::optional<std::string>& parent_id, std::optional<bool> set_active) {
  std::optional<Snippet> parent;
  if (parent_id) {
    parent = FindInStory(*repository_, tx, story, *parent_id);
    if (!parent) {
      throw util::NotFound("parent snippet not found: " + *parent_id);
    }
  } else if (auto root = CanonicalRoot(*repository_, tx, story)) {
    STORYGRAPH_LOG_WARN("creating a second root for story", {StringField("story", story), StringField("existing_root_id", root->id)});
  }

  auto row = NewSnippet(story, content, kind, parent_id);
  ThrowIfDbError(repository_->InsertSnippet(tx, row), "create snippet");

  if (parent) {
    const bool activate = set_active.value_or(!parent->child_id.has_value());
    if (activate) {
      parent->child_id = row.id;
      ThrowIfDbError(repository_->UpdateSnippet(tx, *parent), "activate new child");
    }
  }
  return row;
}

Snippet GraphStore::CreateSnippet(const std::string& story, const std::string& content, const std::string& kind,
                                  const std::optional<std::string>& parent_id, std::optional<bool> set_active) {
  RequireStory(story);
  RequireKind(kind);

  auto tx      = repository_->Begin();
  auto created = CreateInTx(*tx, story, content, kind, parent_id, set_active);
  tx->Commit();
  return created;
}

Snippet GraphStore::RegenerateSnippet(const std::string& story, const std::string& target_id, const std::string& content, const std::string& kind,
                                      bool set_active) {
  RequireStory(story);
  RequireKind(kind);

  auto tx     = repository_->Begin();
  auto target = FindInStory(*repository_, *tx, story, target_id);
  if (!target) {
    throw util::NotFound("target snippet not found: " + target_id);
  }

  auto created = CreateInTx(*tx, story, content, kind, target->parent_id, set_active);
  tx->Commit();
  return created;
}

void GraphStore::ChooseActiveChild(const std::string& story, const std::string& parent_id, const std::string& child_id) {
  auto tx = repository_->Begin();

  auto child = repository_->GetSnippet(*tx, child_id);
  if (!child) {
    throw util::NotFound("child snippet not found: " + child_id);
  }
  if (child->story != story || child->parent_id != parent_id) {
    throw util::StructuralViolation("snippet " + child_id + " is not a child of " + parent_id);
  }

  auto parent = FindInStory(*repository_, *tx, story, parent_id);
  if (!parent) {
    throw util::NotFound("parent snippet not found: " + parent_id);
  }

  parent->child_id = child_id;
  ThrowIfDbError(repository_->UpdateSnippet(*tx, *parent), "choose active child");
  tx->Commit();
}

SnippetPath GraphStore::MainPath(const std::string& story) {
  auto tx = repository_->Begin();
  return WalkMainPath(*repository_, *tx, story);
}

SnippetPath GraphStore::PathFromHead(const std::string& story, const std::string& head_id) {
  auto tx = repository_->Begin();
  return WalkFromHead(*repository_, *tx, story, head_id);
}

std::string GraphStore::BuildText(const SnippetPath& path) {
  return graph::BuildText(path);
}

Snippet GraphStore::InsertAbove(const std::string& story, const std::string& target_id, const std::string& content, const std::string& kind,
                                bool set_active) {
  RequireStory(story);
  RequireKind(kind);

  auto tx     = repository_->Begin();
  auto target = FindInStory(*repository_, *tx, story, target_id);
  if (!target) {
    throw util::NotFound("target snippet not found: " + target_id);
  }

  const auto old_parent_id = target->parent_id;

  auto row     = NewSnippet(story, content, kind, old_parent_id);
  row.child_id = target->id;
  ThrowIfDbError(repository_->InsertSnippet(*tx, row), "insert above");

  target->parent_id = row.id;
  ThrowIfDbError(repository_->UpdateSnippet(*tx, *target), "insert above: relink target");

  if (old_parent_id) {
    auto parent = FindInStory(*repository_, *tx, story, *old_parent_id);
    if (parent && parent->child_id == target->id) {
      // The target is no longer a child of this parent.
      parent->child_id = set_active ? std::optional<std::string>(row.id) : std::nullopt;
      ThrowIfDbError(repository_->UpdateSnippet(*tx, *parent), "insert above: relink parent");
    }
  }

  tx->Commit();
  return row;
}

Snippet GraphStore::InsertBelow(const std::string& story, const std::string& parent_id, const std::string& content, const std::string& kind,
                                bool set_active) {
  RequireStory(story);
  RequireKind(kind);

  auto tx     = repository_->Begin();
  auto parent = FindInStory(*repository_, *tx, story, parent_id);
  if (!parent) {
    throw util::NotFound("parent snippet not found: " + parent_id);
  }

  std::optional<Snippet> active;
  if (parent->child_id) {
    active = FindInStory(*repository_, *tx, story, *parent->child_id);
    if (active && active->parent_id != parent->id) {
      active.reset();
    }
  }

  auto row = NewSnippet(story, content, kind, parent->id);
  if (active) {
    row.child_id = active->id;
  }
  ThrowIfDbError(repository_->InsertSnippet(*tx, row), "insert below");

  if (active) {
    active->parent_id = row.id;
    ThrowIfDbError(repository_->UpdateSnippet(*tx, *active), "insert below: relink child");
  }

  if (set_active) {
    parent->child_id = row.id;
    ThrowIfDbError(repository_->UpdateSnippet(*tx, *parent), "insert below: activate");
  } else if (active) {
    parent->child_id.reset();
    ThrowIfDbError(repository_->UpdateSnippet(*tx, *parent), "insert below: clear moved child");
  }

  tx->Commit();
  return row;
}

Snippet GraphStore::UpdateSnippet(const std::string& id, const std::optional<std::string>& content, const std::optional<std::string>& kind) {
  auto tx  = repository_->Begin();
  auto row = repository_->GetSnippet(*tx, id);
  if (!row) {
    throw util::NotFound("snippet not found: " + id);
  }
  if (!content && !kind) {
    return *row;
  }

  if (content) {
    row->content = *content;
  }
  if (kind) {
    RequireKind(*kind);
    row->kind = *kind;
  }

  ThrowIfDbError(repository_->UpdateSnippet(*tx, *row), "update snippet");
  tx->Commit();
  return *row;
}

bool GraphStore::DeleteSnippet(const std::string& story, const std::string& id) {
  auto tx     = repository_->Begin();
  auto target = FindInStory(*repository_, *tx, story, id);
  if (!target) {
    return false;
  }
  if (!target->parent_id) {
    throw util::StructuralViolation("cannot delete root snippet " + id);
  }

  // Branch moves are decided from the state before any rewrite.
  auto branches = repository_->ListBranches(*tx, story);

  db::SnippetQuery children_query;
  children_query.story     = story;
  children_query.parent_id = id;
  auto children            = repository_->ListSnippets(*tx, children_query);

  std::optional<std::string> replacement;
  if (!children.empty()) {
    const bool active_is_child = target->child_id && std::any_of(children.begin(), children.end(), [&](const Snippet& child) {
                                   return child.id == *target->child_id;
                                 });
    replacement = active_is_child ? *target->child_id : children.front().id;
  }

  for (auto& child : children) {
    child.parent_id = target->parent_id;
    ThrowIfDbError(repository_->UpdateSnippet(*tx, child), "delete snippet: reparent child");
  }

  auto parent = FindInStory(*repository_, *tx, story, *target->parent_id);
  if (parent && parent->child_id == id) {
    parent->child_id = replacement;
    ThrowIfDbError(repository_->UpdateSnippet(*tx, *parent), "delete snippet: relink parent");
  }

  ThrowIfDbError(repository_->DeleteSnippet(*tx, id), "delete snippet");

  for (auto& branch : branches) {
    if (branch.head_id != id) {
      continue;
    }
    if (replacement) {
      branch.head_id = *replacement;
      ThrowIfDbError(repository_->UpsertBranch(*tx, branch), "delete snippet: repoint branch");
    } else {
      ThrowIfDbError(repository_->DeleteBranch(*tx, story, branch.name), "delete snippet: drop branch");
      STORYGRAPH_LOG_INFO("branch dropped with its head snippet", {StringField("story", story), StringField("branch", branch.name), StringField("snippet_id", id)});
    }
  }

  tx->Commit();
  STORYGRAPH_LOG_DEBUG("snippet deleted", {StringField("story", story), StringField("snippet_id", id), IntField("children", static_cast<int64_t>(children.size()))});
  return true;
}

std::optional<Snippet> GraphStore::Get(const std::string& id) {
  auto tx = repository_->Begin();
  return repository_->GetSnippet(*tx, id);
}

std::optional<Snippet> GraphStore::Root(const std::string& story) {
  auto tx = repository_->Begin();
  return CanonicalRoot(*repository_, *tx, story);
}

std::vector<Snippet> GraphStore::ListChildren(const std::string& story, const std::string& parent_id) {
  db::SnippetQuery query;
  query.story     = story;
  query.parent_id = parent_id;

  auto tx = repository_->Begin();
  return repository_->ListSnippets(*tx, query);
}

bool GraphStore::HasChildren(const std::string& story, const std::string& parent_id) {
  db::SnippetQuery query;
  query.story     = story;
  query.parent_id = parent_id;
  query.limit     = 1;

  auto tx = repository_->Begin();
  return !repository_->ListSnippets(*tx, query).empty();
}

} // namespace storygraph::graph
