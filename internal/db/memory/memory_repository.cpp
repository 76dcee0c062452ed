#include "memory_repository.hpp"

#include <algorithm>
#include <set>

#include "memory_tx.hpp"

namespace storygraph::db::memory {

namespace {

std::string BranchKey(const std::string& story, const std::string& name) {
  return story + "#" + name;
}

bool Matches(const model::SnippetRecord& r, const SnippetQuery& q) {
  if (r.story != q.story) return false;
  if (q.roots_only && r.parent_id.has_value()) return false;
  if (q.parent_id && r.parent_id != q.parent_id) return false;
  if (q.child_id && r.child_id != q.child_id) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Snippets
// ------------------------------------------------------------------

Result MemoryRepository::InsertSnippet(Transaction& t, const model::SnippetRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.snippets.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "snippet " + r.id);
  s.snippets[r.id] = StoredSnippet{r, s.next_seq++};
  return Result::Ok();
}

Result MemoryRepository::InsertSnippets(Transaction& t, const std::vector<model::SnippetRecord>& rows) {
  for (const auto& r : rows) {
    auto result = InsertSnippet(t, r);
    if (!result) return result;
  }
  return Result::Ok();
}

std::optional<model::SnippetRecord> MemoryRepository::GetSnippet(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.snippets.find(id);
  if (it == s.snippets.end()) return std::nullopt;
  return it->second.record;
}

std::vector<model::SnippetRecord> MemoryRepository::ListSnippets(Transaction& t, const SnippetQuery& q) {
  std::vector<const StoredSnippet*> matched;
  for (const auto& [_, stored] : TX(t).View().snippets) {
    if (Matches(stored.record, q)) matched.push_back(&stored);
  }

  std::sort(matched.begin(), matched.end(), [&](const StoredSnippet* a, const StoredSnippet* b) {
    const auto ka = std::make_pair(a->record.created_at_ms, a->seq);
    const auto kb = std::make_pair(b->record.created_at_ms, b->seq);
    return q.order == SortOrder::Ascending ? ka < kb : kb < ka;
  });

  if (q.limit && matched.size() > *q.limit) matched.resize(*q.limit);

  std::vector<model::SnippetRecord> out;
  out.reserve(matched.size());
  for (const auto* stored : matched) out.push_back(stored->record);
  return out;
}

Result MemoryRepository::UpdateSnippet(Transaction& t, const model::SnippetRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.snippets.find(r.id);
  if (it == s.snippets.end()) return Result::Err(ErrorCode::NotFound, "snippet " + r.id);

  auto& row     = it->second.record;
  row.parent_id = r.parent_id;
  row.child_id  = r.child_id;
  row.kind      = r.kind;
  row.content   = r.content;
  return Result::Ok();
}

Result MemoryRepository::DeleteSnippet(Transaction& t, const std::string& id) {
  TX(t).Mutable().snippets.erase(id);
  return Result::Ok();
}

Result MemoryRepository::DeleteSnippetsByStory(Transaction& t, const std::string& story) {
  std::erase_if(TX(t).Mutable().snippets, [&](const auto& entry) { return entry.second.record.story == story; });
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListStories(Transaction& t) {
  std::set<std::string> stories;
  for (const auto& [_, stored] : TX(t).View().snippets) stories.insert(stored.record.story);
  return {stories.begin(), stories.end()};
}

// ------------------------------------------------------------------
// Branches
// ------------------------------------------------------------------

Result MemoryRepository::UpsertBranch(Transaction& t, const model::BranchRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = BranchKey(r.story, r.name);
  auto       it  = s.branches.find(key);
  if (it != s.branches.end()) {
    it->second.record.head_id = r.head_id;
    return Result::Ok();
  }
  s.branches[key] = StoredBranch{r, s.next_seq++};
  return Result::Ok();
}

std::optional<model::BranchRecord> MemoryRepository::GetBranch(Transaction& t, const std::string& story, const std::string& name) {
  const auto& s  = TX(t).View();
  const auto  it = s.branches.find(BranchKey(story, name));
  if (it == s.branches.end()) return std::nullopt;
  return it->second.record;
}

std::vector<model::BranchRecord> MemoryRepository::ListBranches(Transaction& t, const std::string& story) {
  std::vector<const StoredBranch*> matched;
  for (const auto& [_, stored] : TX(t).View().branches) {
    if (stored.record.story == story) matched.push_back(&stored);
  }

  std::sort(matched.begin(), matched.end(), [](const StoredBranch* a, const StoredBranch* b) {
    return std::make_pair(a->record.created_at_ms, a->seq) > std::make_pair(b->record.created_at_ms, b->seq);
  });

  std::vector<model::BranchRecord> out;
  out.reserve(matched.size());
  for (const auto* stored : matched) out.push_back(stored->record);
  return out;
}

Result MemoryRepository::DeleteBranch(Transaction& t, const std::string& story, const std::string& name) {
  TX(t).Mutable().branches.erase(BranchKey(story, name));
  return Result::Ok();
}

Result MemoryRepository::DeleteBranchesByStory(Transaction& t, const std::string& story) {
  std::erase_if(TX(t).Mutable().branches, [&](const auto& entry) { return entry.second.record.story == story; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

Result MemoryRepository::DeleteAll(Transaction& t) {
  auto& s = TX(t).Mutable();
  s.snippets.clear();
  s.branches.clear();
  return Result::Ok();
}

} // namespace storygraph::db::memory
