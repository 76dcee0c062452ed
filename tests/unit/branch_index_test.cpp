#include "internal/branch/branch_index.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using storygraph::branch::BranchIndex;
using storygraph::db::memory::MemoryRepository;
using storygraph::graph::GraphStore;
using storygraph::graph::Snippet;

constexpr const char* kStory = "tale";

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  GraphStore                        graph{repository};
  BranchIndex                       branches{repository};

  std::vector<Snippet> Chain(const std::vector<std::string>& contents) {
    std::vector<Snippet>       chain;
    std::optional<std::string> parent;
    for (const auto& content : contents) {
      chain.push_back(graph.CreateSnippet(kStory, content, "ai", parent));
      parent = chain.back().id;
    }
    return chain;
  }

  void Rewrite(const std::string& id, const std::optional<std::string>& parent_id, const std::optional<std::string>& child_id) {
    auto tx  = repository->Begin();
    auto row = repository->GetSnippet(*tx, id);
    assert(row.has_value());
    row->parent_id    = parent_id;
    row->child_id     = child_id;
    const auto update = repository->UpdateSnippet(*tx, *row);
    assert(update);
    tx->Commit();
  }

  void Remove(const std::string& id) {
    auto       tx     = repository->Begin();
    const auto result = repository->DeleteSnippet(*tx, id);
    assert(result);
    tx->Commit();
  }
};

void TestUpsertIsIdempotentAndKeepsCreationTime() {
  Fixture f;
  auto    chain = f.Chain({"A", "B"});

  auto first = f.branches.UpsertBranch(kStory, "main", chain[0].id);
  auto moved = f.branches.UpsertBranch(kStory, "main", chain[1].id);
  assert(moved.head_id == chain[1].id);
  assert(moved.created_at_ms == first.created_at_ms);
  assert(f.branches.ListBranches(kStory).size() == 1);

  auto again = f.branches.UpsertBranch(kStory, "main", chain[1].id);
  assert(again.head_id == chain[1].id);
  assert(f.branches.ListBranches(kStory).size() == 1);
}

void TestUpsertRequiresHeadInStory() {
  Fixture f;
  f.Chain({"A"});

  bool threw = false;
  try {
    f.branches.UpsertBranch(kStory, "main", "missing");
  } catch (const storygraph::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  auto other = f.graph.CreateSnippet("other", "X", "user");
  threw      = false;
  try {
    f.branches.UpsertBranch(kStory, "main", other.id);
  } catch (const storygraph::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.branches.UpsertBranch("other", "", other.id);
  } catch (const storygraph::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestListNewestFirstAndDelete() {
  Fixture f;
  auto    chain = f.Chain({"A", "B"});

  f.branches.UpsertBranch(kStory, "first", chain[0].id);
  f.branches.UpsertBranch(kStory, "second", chain[1].id);

  auto listed = f.branches.ListBranches(kStory);
  assert(listed.size() == 2);
  assert(listed[0].name == "second");
  assert(listed[1].name == "first");

  f.branches.DeleteBranch(kStory, "first");
  f.branches.DeleteBranch(kStory, "never-existed");
  assert(f.branches.ListBranches(kStory).size() == 1);
  assert(!f.branches.GetBranch(kStory, "first").has_value());
  assert(f.branches.GetBranch(kStory, "second")->head_id == chain[1].id);
}

void TestValidateReachableHead() {
  Fixture f;
  auto    chain = f.Chain({"A", "B", "C"});
  for (const auto& snippet : chain) {
    auto validation = f.branches.ValidateBranchHead(kStory, snippet.id);
    assert(validation.valid);
    assert(!validation.reason.has_value());
  }
}

// Regenerating the root leaves the old opening as a second root. A branch
// kept under it is an alternate take, not corruption.
void TestValidateAcceptsHeadUnderOlderRoot() {
  Fixture f;
  auto    chain = f.Chain({"A", "B"});
  f.branches.UpsertBranch(kStory, "draft", chain[1].id);

  auto opening = f.graph.RegenerateSnippet(kStory, chain[0].id, "A2", "user");
  assert(f.graph.Root(kStory)->id == opening.id);

  auto validation = f.branches.ValidateBranchHead(kStory, chain[1].id);
  assert(validation.valid);
  auto repaired = f.branches.RepairBranchHead(kStory, "draft");
  assert(repaired == chain[1].id);

  auto path = f.graph.PathFromHead(kStory, chain[1].id);
  assert(path.front().id == chain[0].id);
}

void TestValidateReportsCorruption() {
  Fixture f;
  auto    chain = f.Chain({"A", "B", "C"});

  auto missing = f.branches.ValidateBranchHead(kStory, "missing");
  assert(!missing.valid && missing.reason == "head not found");

  f.Rewrite(chain[1].id, std::string("ghost"), chain[2].id);
  auto dangling = f.branches.ValidateBranchHead(kStory, chain[2].id);
  assert(!dangling.valid && dangling.reason == "dangling parent reference");

  f.Rewrite(chain[1].id, chain[2].id, chain[2].id);
  auto cycle = f.branches.ValidateBranchHead(kStory, chain[2].id);
  assert(!cycle.valid && cycle.reason == "cycle detected");
}

void TestRepairLeavesValidHeadAlone() {
  Fixture f;
  auto    chain = f.Chain({"A", "B"});
  f.branches.UpsertBranch(kStory, "main", chain[1].id);

  assert(f.branches.RepairBranchHead(kStory, "main") == chain[1].id);
  assert(!f.branches.RepairBranchHead(kStory, "absent").has_value());
}

void TestRepairMovesToNearestValidAncestor() {
  Fixture f;
  auto    chain = f.Chain({"A", "B", "C", "D"});
  f.branches.UpsertBranch(kStory, "main", chain[3].id);

  // B -> C -> B cycle above D; A is the nearest sound ancestor.
  f.Rewrite(chain[1].id, chain[2].id, chain[2].id);
  assert(!f.branches.ValidateBranchHead(kStory, chain[3].id).valid);

  auto repaired = f.branches.RepairBranchHead(kStory, "main");
  assert(repaired == chain[0].id);
  assert(f.branches.GetBranch(kStory, "main")->head_id == chain[0].id);
}

void TestRepairUsesActivePointerBackReference() {
  Fixture f;
  auto    chain = f.Chain({"A", "B", "C"});
  f.branches.UpsertBranch(kStory, "main", chain[2].id);

  // Interrupted splice: C lost its parent link, but B still names C
  // as its active child.
  f.Rewrite(chain[2].id, std::string("ghost"), std::nullopt);
  assert(f.branches.ValidateBranchHead(kStory, chain[2].id).reason == "dangling parent reference");

  auto repaired = f.branches.RepairBranchHead(kStory, "main");
  assert(repaired == chain[1].id);
}

void TestRepairOfDeletedHead() {
  Fixture f;
  auto    chain = f.Chain({"A", "B", "C"});
  f.branches.UpsertBranch(kStory, "main", chain[2].id);

  f.Remove(chain[2].id);
  auto repaired = f.branches.RepairBranchHead(kStory, "main");
  assert(repaired == chain[1].id);
}

void TestRepairFailsWithoutValidAncestor() {
  Fixture f;
  auto    chain = f.Chain({"A", "B"});
  f.branches.UpsertBranch(kStory, "main", chain[1].id);

  // A and B point at each other; no parentless node remains.
  f.Rewrite(chain[0].id, chain[1].id, chain[1].id);
  assert(!f.branches.RepairBranchHead(kStory, "main").has_value());
  assert(f.branches.GetBranch(kStory, "main")->head_id == chain[1].id);
}

} // namespace

int main() {
  TestUpsertIsIdempotentAndKeepsCreationTime();
  TestUpsertRequiresHeadInStory();
  TestListNewestFirstAndDelete();
  TestValidateReachableHead();
  TestValidateAcceptsHeadUnderOlderRoot();
  TestValidateReportsCorruption();
  TestRepairLeavesValidHeadAlone();
  TestRepairMovesToNearestValidAncestor();
  TestRepairUsesActivePointerBackReference();
  TestRepairOfDeletedHead();
  TestRepairFailsWithoutValidAncestor();

  std::cout << "storygraph_unit_branch_index: pass\n";
  return 0;
}
