#include "pg_pool.hpp"

namespace storygraph::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(std::move(conn));
  }

  // Reserve the slot, then connect without holding the lock.
  ++live_connections_;
  lock.unlock();
  try {
    return Wrap(Connect());
  } catch (const std::exception&) {
    DropSlot();
    throw;
  }
}

std::unique_ptr<pqxx::connection> PgPool::Connect() const {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  PrepareStatements(*conn);
  return conn;
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_snippet",
               "INSERT INTO snippets(id,story,parent_id,child_id,kind,content,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");

  conn.prepare("get_snippet",
               "SELECT id,story,parent_id,child_id,kind,content,created_at_ms "
               "FROM snippets WHERE id=$1");

  // $2: roots only, $3/$4: optional parent/child filters, $5: LIMIT (NULL = all)
  conn.prepare("list_snippets_asc",
               "SELECT id,story,parent_id,child_id,kind,content,created_at_ms FROM snippets "
               "WHERE story=$1 AND ($2 = false OR parent_id IS NULL) "
               "AND ($3::text IS NULL OR parent_id=$3) AND ($4::text IS NULL OR child_id=$4) "
               "ORDER BY created_at_ms ASC, seq ASC LIMIT $5");

  conn.prepare("list_snippets_desc",
               "SELECT id,story,parent_id,child_id,kind,content,created_at_ms FROM snippets "
               "WHERE story=$1 AND ($2 = false OR parent_id IS NULL) "
               "AND ($3::text IS NULL OR parent_id=$3) AND ($4::text IS NULL OR child_id=$4) "
               "ORDER BY created_at_ms DESC, seq DESC LIMIT $5");

  conn.prepare("update_snippet", "UPDATE snippets SET parent_id=$2,child_id=$3,kind=$4,content=$5 WHERE id=$1");

  conn.prepare("delete_snippet", "DELETE FROM snippets WHERE id=$1");

  conn.prepare("upsert_branch",
               "INSERT INTO branches(story,name,head_id,created_at_ms) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(story,name) DO UPDATE SET head_id=EXCLUDED.head_id");

  conn.prepare("get_branch", "SELECT story,name,head_id,created_at_ms FROM branches WHERE story=$1 AND name=$2");

  conn.prepare("list_branches",
               "SELECT story,name,head_id,created_at_ms FROM branches WHERE story=$1 "
               "ORDER BY created_at_ms DESC, seq DESC");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [weak_self](pqxx::connection* released_conn) {
    std::unique_ptr<pqxx::connection> owned(released_conn);
    if (auto self = weak_self.lock()) {
      self->Release(std::move(owned));
    }
  });
}

void PgPool::Release(std::unique_ptr<pqxx::connection> conn) {
  // A connection lost to a server restart is not handed out again.
  if (!conn->is_open()) {
    conn.reset();
    DropSlot();
    return;
  }
  {
    std::lock_guard lock(mutex_);
    idle_.push_back(std::move(conn));
  }
  cv_.notify_one();
}

void PgPool::DropSlot() {
  {
    std::lock_guard lock(mutex_);
    --live_connections_;
  }
  cv_.notify_one();
}

} // namespace storygraph::db::postgres
