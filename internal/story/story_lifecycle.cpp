#include "story_lifecycle.hpp"

#include <stdexcept>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace storygraph::story {

using storygraph::db::ThrowIfDbError;
using storygraph::observability::IntField;
using storygraph::observability::StringField;

namespace {

std::optional<std::string> Remap(const std::optional<std::string>& id, const IdMap& ids) {
  if (!id) {
    return std::nullopt;
  }
  auto it = ids.find(*id);
  if (it == ids.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace

DuplicateMode ParseDuplicateMode(const std::string& mode) {
  if (mode == "all") {
    return DuplicateMode::kAll;
  }
  if (mode == "main") {
    return DuplicateMode::kMain;
  }
  throw util::InvalidArgument("unsupported duplicate mode: " + mode);
}

StoryLifecycle::StoryLifecycle(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("StoryLifecycle: repository must not be null");
  }
}

void StoryLifecycle::DeleteStory(const std::string& story) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteBranchesByStory(*tx, story), "delete story branches");
  ThrowIfDbError(repository_->DeleteSnippetsByStory(*tx, story), "delete story snippets");
  tx->Commit();

  STORYGRAPH_LOG_INFO("story deleted", {StringField("story", story)});
}

graph::Snippet StoryLifecycle::TruncateStory(const std::string& story) {
  if (story.empty()) {
    throw util::InvalidArgument("story name must not be empty");
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteBranchesByStory(*tx, story), "truncate story branches");
  ThrowIfDbError(repository_->DeleteSnippetsByStory(*tx, story), "truncate story snippets");

  graph::Snippet root;
  root.id            = util::NewId();
  root.story         = story;
  root.kind          = db::model::kKindUser;
  root.created_at_ms = util::NowMillis();
  ThrowIfDbError(repository_->InsertSnippet(*tx, root), "truncate story: create root");
  tx->Commit();

  STORYGRAPH_LOG_INFO("story truncated", {StringField("story", story), StringField("root_id", root.id)});
  return root;
}

void StoryLifecycle::CheckDuplicateTargets(db::Transaction& tx, const std::string& source, const std::string& target) {
  if (source.empty() || target.empty()) {
    throw util::InvalidArgument("story names must not be empty");
  }
  if (source == target) {
    throw util::InvalidArgument("source and target story must differ");
  }

  db::SnippetQuery existing;
  existing.limit = 1;

  existing.story = source;
  if (repository_->ListSnippets(tx, existing).empty()) {
    throw util::NotFound("source story has no snippets: " + source);
  }
  existing.story = target;
  if (!repository_->ListSnippets(tx, existing).empty()) {
    throw util::AlreadyExists("target story already has snippets: " + target);
  }
}

IdMap StoryLifecycle::DuplicateStoryAll(const std::string& source, const std::string& target) {
  auto tx = repository_->Begin();
  CheckDuplicateTargets(*tx, source, target);

  db::SnippetQuery query;
  query.story = source;
  auto rows   = repository_->ListSnippets(*tx, query);

  IdMap ids;
  ids.reserve(rows.size());
  for (const auto& row : rows) {
    ids.emplace(row.id, util::NewId());
  }

  std::vector<graph::Snippet> copies;
  copies.reserve(rows.size());
  for (const auto& row : rows) {
    graph::Snippet copy = row;
    copy.id             = ids.at(row.id);
    copy.story          = target;
    copy.parent_id      = Remap(row.parent_id, ids);
    copy.child_id       = Remap(row.child_id, ids);
    copies.push_back(std::move(copy));
  }
  ThrowIfDbError(repository_->InsertSnippets(*tx, copies), "duplicate story snippets");

  // Oldest first so the copies keep the same relative order.
  auto branches = repository_->ListBranches(*tx, source);
  for (auto it = branches.rbegin(); it != branches.rend(); ++it) {
    auto head = ids.find(it->head_id);
    if (head == ids.end()) {
      continue;
    }
    db::model::BranchRecord copy{target, it->name, head->second, it->created_at_ms};
    ThrowIfDbError(repository_->UpsertBranch(*tx, copy), "duplicate story branch");
  }

  tx->Commit();
  STORYGRAPH_LOG_INFO("story duplicated",
                      {StringField("source", source), StringField("target", target), StringField("mode", "all"), IntField("snippets", static_cast<int64_t>(ids.size()))});
  return ids;
}

IdMap StoryLifecycle::DuplicateStoryMain(const std::string& source, const std::string& target) {
  auto tx = repository_->Begin();
  CheckDuplicateTargets(*tx, source, target);

  auto path = graph::WalkMainPath(*repository_, *tx, source);

  IdMap ids;
  ids.reserve(path.size());
  for (const auto& row : path) {
    ids.emplace(row.id, util::NewId());
  }

  std::vector<graph::Snippet> copies;
  copies.reserve(path.size());
  for (std::size_t i = 0; i < path.size(); ++i) {
    graph::Snippet copy = path[i];
    copy.id             = ids.at(path[i].id);
    copy.story          = target;
    copy.parent_id      = i == 0 ? std::nullopt : std::optional<std::string>(ids.at(path[i - 1].id));
    copy.child_id       = i + 1 < path.size() ? std::optional<std::string>(ids.at(path[i + 1].id)) : std::nullopt;
    copies.push_back(std::move(copy));
  }
  ThrowIfDbError(repository_->InsertSnippets(*tx, copies), "duplicate main path");

  tx->Commit();
  STORYGRAPH_LOG_INFO("story duplicated",
                      {StringField("source", source), StringField("target", target), StringField("mode", "main"), IntField("snippets", static_cast<int64_t>(ids.size()))});
  return ids;
}

IdMap StoryLifecycle::DuplicateStory(const std::string& source, const std::string& target, DuplicateMode mode) {
  return mode == DuplicateMode::kMain ? DuplicateStoryMain(source, target) : DuplicateStoryAll(source, target);
}

std::vector<std::string> StoryLifecycle::ListStories() {
  auto tx = repository_->Begin();
  return repository_->ListStories(*tx);
}

void StoryLifecycle::PurgeAll() {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteAll(*tx), "purge all stories");
  tx->Commit();

  STORYGRAPH_LOG_WARN("all stories purged");
}

} // namespace storygraph::story
