#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/factory.hpp"

#if STORYGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if STORYGRAPH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using storygraph::db::ErrorCode;
using storygraph::db::Repository;
using storygraph::db::SnippetQuery;
using storygraph::db::SortOrder;
using storygraph::db::memory::MemoryRepository;
using storygraph::db::model::BranchRecord;
using storygraph::db::model::SnippetRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

SnippetRecord Row(const std::string& id, const std::string& story, std::optional<std::string> parent, uint64_t created_at_ms) {
  SnippetRecord row;
  row.id            = id;
  row.story         = story;
  row.parent_id     = std::move(parent);
  row.kind          = "ai";
  row.content       = "content of " + id;
  row.created_at_ms = created_at_ms;
  return row;
}

void VerifySnippetReadWrite(Repository& repo, const std::string& prefix) {
  const auto story = prefix + "-story";
  const auto now   = NowMs();

  {
    auto tx = repo.Begin();
    assert(repo.InsertSnippet(*tx, Row(prefix + "-root", story, std::nullopt, now)));
    assert(repo.InsertSnippets(*tx, {Row(prefix + "-a", story, prefix + "-root", now), Row(prefix + "-b", story, prefix + "-root", now)}));
    tx->Commit();
  }
  {
    // PostgreSQL aborts the transaction after a failed statement.
    auto tx        = repo.Begin();
    auto duplicate = repo.InsertSnippet(*tx, Row(prefix + "-a", story, std::nullopt, now));
    assert(!duplicate);
    assert(duplicate.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx = repo.Begin();

  auto root = repo.GetSnippet(*tx, prefix + "-root");
  assert(root.has_value());
  assert(!root->parent_id.has_value());
  assert(!root->child_id.has_value());
  assert(root->created_at_ms == now);
  assert(root->content == "content of " + prefix + "-root");

  SnippetQuery children;
  children.story     = story;
  children.parent_id = prefix + "-root";
  auto listed        = repo.ListSnippets(*tx, children);
  assert(listed.size() == 2);
  // Same timestamp: insertion order decides.
  assert(listed[0].id == prefix + "-a");
  assert(listed[1].id == prefix + "-b");

  children.order = SortOrder::Descending;
  children.limit = 1;
  listed         = repo.ListSnippets(*tx, children);
  assert(listed.size() == 1 && listed[0].id == prefix + "-b");

  SnippetQuery roots;
  roots.story      = story;
  roots.roots_only = true;
  listed           = repo.ListSnippets(*tx, roots);
  assert(listed.size() == 1 && listed[0].id == prefix + "-root");

  root->child_id = prefix + "-b";
  root->content  = "edited";
  assert(repo.UpdateSnippet(*tx, *root));

  SnippetQuery back_reference;
  back_reference.story    = story;
  back_reference.child_id = prefix + "-b";
  listed                  = repo.ListSnippets(*tx, back_reference);
  assert(listed.size() == 1 && listed[0].id == prefix + "-root");
  assert(listed[0].content == "edited");

  auto missing = repo.UpdateSnippet(*tx, Row(prefix + "-ghost", story, std::nullopt, now));
  assert(missing.code == ErrorCode::NotFound);

  assert(repo.DeleteSnippet(*tx, prefix + "-a"));
  assert(!repo.GetSnippet(*tx, prefix + "-a").has_value());
  tx->Commit();
}

void VerifyBranchReadWrite(Repository& repo, const std::string& prefix) {
  const auto story = prefix + "-story";
  const auto now   = NowMs();

  {
    auto tx = repo.Begin();
    assert(repo.UpsertBranch(*tx, BranchRecord{story, "older", "head-1", now}));
    assert(repo.UpsertBranch(*tx, BranchRecord{story, "newer", "head-2", now}));
    // Moving keeps the original creation time.
    assert(repo.UpsertBranch(*tx, BranchRecord{story, "older", "head-3", now + 1000}));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto older  = repo.GetBranch(*tx, story, "older");
    auto listed = repo.ListBranches(*tx, story);
    assert(older.has_value());
    assert(older->head_id == "head-3");
    assert(older->created_at_ms == now);
    assert(listed.size() == 2);
    assert(listed[0].name == "newer");
    assert(listed[1].name == "older");

    assert(repo.DeleteBranch(*tx, story, "older"));
    assert(repo.DeleteBranch(*tx, story, "never-there"));
    assert(!repo.GetBranch(*tx, story, "older").has_value());

    assert(repo.DeleteBranchesByStory(*tx, story));
    assert(repo.ListBranches(*tx, story).empty());
    tx->Commit();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertSnippet(*tx, Row(id, id + "-story", std::nullopt, NowMs())));
    tx->Rollback();
  }
  {
    // Destructor rolls back too.
    auto tx = repo.Begin();
    assert(repo.InsertSnippet(*tx, Row(id + "-dropped", id + "-story", std::nullopt, NowMs())));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetSnippet(*check_tx, id).has_value());
  assert(!repo.GetSnippet(*check_tx, id + "-dropped").has_value());
  check_tx->Commit();
}

void VerifyStoryMaintenance(Repository& repo, const std::string& prefix) {
  const auto now = NowMs();
  {
    auto tx = repo.Begin();
    assert(repo.InsertSnippet(*tx, Row(prefix + "-x", prefix + "-b-story", std::nullopt, now)));
    assert(repo.InsertSnippet(*tx, Row(prefix + "-y", prefix + "-a-story", std::nullopt, now)));
    tx->Commit();
  }

  auto tx      = repo.Begin();
  auto stories = repo.ListStories(*tx);
  auto a_pos   = std::find(stories.begin(), stories.end(), prefix + "-a-story");
  auto b_pos   = std::find(stories.begin(), stories.end(), prefix + "-b-story");
  assert(a_pos != stories.end() && b_pos != stories.end());
  assert(a_pos < b_pos);

  assert(repo.DeleteSnippetsByStory(*tx, prefix + "-a-story"));
  assert(!repo.GetSnippet(*tx, prefix + "-y").has_value());
  assert(repo.GetSnippet(*tx, prefix + "-x").has_value());
  tx->Commit();
}

// The same editing session must produce the same story on every backend.
std::string RunEditingSession(std::shared_ptr<Repository> repo, const std::string& story) {
  auto  rt      = storygraph::factory::BuildRuntime(std::move(repo));
  auto& service = *rt.story_service;

  storygraph::service::AppendRequest append;
  append.story   = story;
  append.kind    = "user";
  append.content = "Once";
  auto root      = service.Append(append);

  append.kind      = "ai";
  append.content   = "upon";
  append.parent_id = root.id;
  auto upon        = service.Append(append);

  append.content   = "a time";
  append.parent_id = upon.id;
  auto tail        = service.Append(append);

  service.Regenerate({story, tail.id, "a midnight", "ai", true, ""});
  service.InsertAbove({story, upon.id, "there was", "ai", true});
  service.InsertBelow({story, root.id, ",", "ai", ""});
  service.Delete(upon.id, story);

  auto path = service.ResolvePath(story);
  assert(service.BranchHealth(story).healthy);

  rt.lifecycle->DuplicateStoryAll(story, story + "-copy");
  assert(service.ResolvePath(story + "-copy").text == path.text);
  rt.lifecycle->DeleteStory(story + "-copy");
  return path.text;
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertSnippet(*tx, Row(id, id + "-story", std::nullopt, NowMs())));
    assert(repo->UpsertBranch(*tx, BranchRecord{id + "-story", "main", id, NowMs()}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetSnippet(*tx, id).has_value());
  assert(repo->GetBranch(*tx, id + "-story", "main")->head_id == id);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if STORYGRAPH_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("storygraph_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<storygraph::db::sqlite::SqliteDB>(db_path);
    storygraph::db::sql::RunMigrations(*db, storygraph::db::sql::SqliteSchema());
    return std::make_shared<storygraph::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if STORYGRAPH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("STORYGRAPH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("STORYGRAPH_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    {
      pqxx::connection conn(conninfo);
      pqxx::work       tx(conn);
      for (const auto& sql : storygraph::db::sql::PostgresSchema()) {
        tx.exec(sql);
      }
      tx.commit();
    }
    auto pool = std::make_shared<storygraph::db::postgres::PgPool>(conninfo);
    return std::make_shared<storygraph::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

std::string RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const auto run  = backend.name + "-" + std::to_string(NowMs());
  auto       repo = backend.make_repository();

  VerifySnippetReadWrite(*repo, run + "-snippets");
  VerifyBranchReadWrite(*repo, run + "-branches");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyStoryMaintenance(*repo, run + "-maintenance");
  auto text = RunEditingSession(repo, run + "-session");

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
  return text;
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if STORYGRAPH_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if STORYGRAPH_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  std::optional<std::string> expected;
  for (auto& backend : backends) {
    auto text = RunBackendSuite(backend);
    if (expected) {
      assert(text == *expected);
    }
    expected = text;
  }
  assert(expected == "Once\n\n,\n\nthere was\n\na midnight");

  std::cout << "storygraph_integration_repository_parity: pass\n";
  return 0;
}
