#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace storygraph::db::sqlite {

using storygraph::db::ErrorCode;
using storygraph::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr PrepareOrThrow(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::SnippetRecord ReadSnippet(sqlite3_stmt* st) {
    model::SnippetRecord r;
    r.id            = ColText(st, 0);
    r.story         = ColText(st, 1);
    r.parent_id     = ColOptText(st, 2);
    r.child_id      = ColOptText(st, 3);
    r.kind          = ColText(st, 4);
    r.content       = ColText(st, 5);
    r.created_at_ms = ColU64(st, 6);
    return r;
}

model::BranchRecord ReadBranch(sqlite3_stmt* st) {
    model::BranchRecord r;
    r.story         = ColText(st, 0);
    r.name          = ColText(st, 1);
    r.head_id       = ColText(st, 2);
    r.created_at_ms = ColU64(st, 3);
    return r;
}

void ThrowIfStepFailed(sqlite3* db, int rc) {
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    const int ext = sqlite3_extended_errcode(db);
    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (ext == SQLITE_CONSTRAINT_UNIQUE || ext == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Snippets
// ------------------------------------------------------------------

Result SqliteRepository::InsertSnippet(Transaction& t, const model::SnippetRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_SNIPPET, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    StmtPtr guard(st, &sqlite3_finalize);

    BindText(st, 1, r.id);
    BindText(st, 2, r.story);
    BindOptText(st, 3, r.parent_id);
    BindOptText(st, 4, r.child_id);
    BindText(st, 5, r.kind);
    BindText(st, 6, r.content);
    BindU64(st, 7, r.created_at_ms);

    return Translate(db, sqlite3_step(st));
}

Result SqliteRepository::InsertSnippets(Transaction& t, const std::vector<model::SnippetRecord>& rows) {
    for (const auto& r : rows) {
        auto result = InsertSnippet(t, r);
        if (!result) return result;
    }
    return Result::Ok();
}

std::optional<model::SnippetRecord>
SqliteRepository::GetSnippet(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_SNIPPET);

    BindText(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    ThrowIfStepFailed(db, rc);
    if (rc != SQLITE_ROW) return std::nullopt;

    return ReadSnippet(st.get());
}

std::vector<model::SnippetRecord>
SqliteRepository::ListSnippets(Transaction& t, const SnippetQuery& q) {
    auto* db = TX(t).Handle();

    std::string query = std::string("SELECT ") + sql::SNIPPET_COLUMNS + " FROM snippets WHERE story=?";
    if (q.roots_only) query += " AND parent_id IS NULL";
    if (q.parent_id) query += " AND parent_id=?";
    if (q.child_id) query += " AND child_id=?";
    query += q.order == SortOrder::Ascending ? " ORDER BY created_at_ms ASC, seq ASC"
                                             : " ORDER BY created_at_ms DESC, seq DESC";
    if (q.limit) query += " LIMIT ?";
    query += ";";

    auto st  = PrepareOrThrow(db, query);
    int  idx = 1;
    BindText(st.get(), idx++, q.story);
    if (q.parent_id) BindText(st.get(), idx++, *q.parent_id);
    if (q.child_id) BindText(st.get(), idx++, *q.child_id);
    if (q.limit) BindU64(st.get(), idx++, *q.limit);

    std::vector<model::SnippetRecord> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadSnippet(st.get()));
    }
    ThrowIfStepFailed(db, rc);
    return out;
}

Result SqliteRepository::UpdateSnippet(Transaction& t, const model::SnippetRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_SNIPPET, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    StmtPtr guard(st, &sqlite3_finalize);

    BindOptText(st, 1, r.parent_id);
    BindOptText(st, 2, r.child_id);
    BindText(st, 3, r.kind);
    BindText(st, 4, r.content);
    BindText(st, 5, r.id);

    auto result = Translate(db, sqlite3_step(st));
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "snippet " + r.id);
    return result;
}

Result SqliteRepository::DeleteSnippet(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_SNIPPET, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    StmtPtr guard(st, &sqlite3_finalize);

    BindText(st, 1, id);
    return Translate(db, sqlite3_step(st));
}

Result SqliteRepository::DeleteSnippetsByStory(Transaction& t, const std::string& story) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_SNIPPETS_BY_STORY, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    StmtPtr guard(st, &sqlite3_finalize);

    BindText(st, 1, story);
    return Translate(db, sqlite3_step(st));
}

std::vector<std::string> SqliteRepository::ListStories(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_STORIES);

    std::vector<std::string> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ColText(st.get(), 0));
    }
    ThrowIfStepFailed(db, rc);
    return out;
}

// ------------------------------------------------------------------
// Branches
// ------------------------------------------------------------------

Result SqliteRepository::UpsertBranch(Transaction& t, const model::BranchRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_BRANCH, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    StmtPtr guard(st, &sqlite3_finalize);

    BindText(st, 1, r.story);
    BindText(st, 2, r.name);
    BindText(st, 3, r.head_id);
    BindU64(st, 4, r.created_at_ms);

    return Translate(db, sqlite3_step(st));
}

std::optional<model::BranchRecord>
SqliteRepository::GetBranch(Transaction& t, const std::string& story, const std::string& name) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_BRANCH);

    BindText(st.get(), 1, story);
    BindText(st.get(), 2, name);

    int rc = sqlite3_step(st.get());
    ThrowIfStepFailed(db, rc);
    if (rc != SQLITE_ROW) return std::nullopt;

    return ReadBranch(st.get());
}

std::vector<model::BranchRecord>
SqliteRepository::ListBranches(Transaction& t, const std::string& story) {
    auto* db = TX(t).Handle();
    auto  st = PrepareOrThrow(db, sql::SELECT_BRANCHES_BY_STORY);

    BindText(st.get(), 1, story);

    std::vector<model::BranchRecord> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadBranch(st.get()));
    }
    ThrowIfStepFailed(db, rc);
    return out;
}

Result SqliteRepository::DeleteBranch(Transaction& t, const std::string& story, const std::string& name) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_BRANCH, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    StmtPtr guard(st, &sqlite3_finalize);

    BindText(st, 1, story);
    BindText(st, 2, name);
    return Translate(db, sqlite3_step(st));
}

Result SqliteRepository::DeleteBranchesByStory(Transaction& t, const std::string& story) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_BRANCHES_BY_STORY, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    StmtPtr guard(st, &sqlite3_finalize);

    BindText(st, 1, story);
    return Translate(db, sqlite3_step(st));
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

Result SqliteRepository::DeleteAll(Transaction&) {
    try {
        db_->Exec(sql::DELETE_ALL_BRANCHES);
        db_->Exec(sql::DELETE_ALL_SNIPPETS);
    } catch (const std::exception& e) {
        return Result::Err(ErrorCode::InternalError, e.what());
    }
    return Result::Ok();
}

} // namespace storygraph::db::sqlite
