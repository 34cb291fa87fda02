// src/cache/sqlite_cache_store.cpp
#include "cache/sqlite_cache_store.h"

#include <sqlite3.h>

#include <filesystem>
#include <string>
#include <system_error>

namespace cache {

struct SqliteCacheStore::Impl {
  sqlite3* db = nullptr;
  sqlite3_stmt* get_stmt = nullptr;
  sqlite3_stmt* set_stmt = nullptr;
  sqlite3_stmt* erase_stmt = nullptr;
  sqlite3_stmt* purge_stmt = nullptr;
  sqlite3_stmt* count_stmt = nullptr;
};

static std::string sqlite_msg(sqlite3* db, const char* what) {
  std::string msg = std::string("SqliteCacheStore: ") + what + " failed";
  if (db) msg += std::string(": ") + sqlite3_errmsg(db);
  return msg;
}

static void exec_or_throw(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite3_exec failed";
    if (err) sqlite3_free(err);
    throw CacheError("SqliteCacheStore: " + msg + " (sql=" + sql + ")");
  }
}

static void prepare_or_throw(sqlite3* db, const char* sql, sqlite3_stmt** stmt) {
  if (sqlite3_prepare_v2(db, sql, -1, stmt, nullptr) != SQLITE_OK) {
    throw CacheError(sqlite_msg(db, "sqlite3_prepare_v2"));
  }
}

static void step_done_or_throw(sqlite3* db, sqlite3_stmt* stmt, const char* what) {
  const int rc = sqlite3_step(stmt);
  sqlite3_reset(stmt);
  if (rc != SQLITE_DONE) {
    throw CacheError(sqlite_msg(db, what));
  }
}

SqliteCacheStore::SqliteCacheStore(const std::string& db_uri, int busy_timeout_ms) : p_(new Impl()) {
  const bool in_memory = db_uri.empty() || db_uri == ":memory:";
  if (!in_memory) {
    std::error_code ec;
    std::filesystem::path p(db_uri);
    if (p.has_parent_path()) {
      std::filesystem::create_directories(p.parent_path(), ec);
    }
  }

  try {
    const int rc = sqlite3_open(in_memory ? ":memory:" : db_uri.c_str(), &p_->db);
    if (rc != SQLITE_OK) {
      throw CacheError(sqlite_msg(p_->db, "sqlite3_open"));
    }
    sqlite3_busy_timeout(p_->db, busy_timeout_ms);

    if (in_memory) {
      exec_or_throw(p_->db, "PRAGMA temp_store=MEMORY;");
      exec_or_throw(p_->db, "PRAGMA synchronous=OFF;");
      exec_or_throw(p_->db, "PRAGMA journal_mode=MEMORY;");
    } else {
      exec_or_throw(p_->db, "PRAGMA journal_mode=WAL;");
      exec_or_throw(p_->db, "PRAGMA synchronous=NORMAL;");
    }

    exec_or_throw(p_->db,
                  "CREATE TABLE IF NOT EXISTS cell_cache("
                  "key TEXT PRIMARY KEY, "
                  "payload BLOB NOT NULL, "
                  "cell_version INTEGER NOT NULL, "
                  "expires_at REAL NOT NULL"
                  ");");
    exec_or_throw(p_->db, "CREATE INDEX IF NOT EXISTS cell_cache_expiry ON cell_cache(expires_at);");

    prepare_or_throw(p_->db,
                     "SELECT payload, cell_version, expires_at FROM cell_cache WHERE key = ?1;",
                     &p_->get_stmt);
    prepare_or_throw(p_->db,
                     "INSERT OR REPLACE INTO cell_cache(key, payload, cell_version, expires_at) "
                     "VALUES (?1, ?2, ?3, ?4);",
                     &p_->set_stmt);
    prepare_or_throw(p_->db, "DELETE FROM cell_cache WHERE key = ?1;", &p_->erase_stmt);
    prepare_or_throw(p_->db, "DELETE FROM cell_cache WHERE expires_at <= ?1;", &p_->purge_stmt);
    prepare_or_throw(p_->db, "SELECT COUNT(*) FROM cell_cache;", &p_->count_stmt);
  } catch (...) {
    close_impl(p_);
    p_ = nullptr;
    throw;
  }
}

SqliteCacheStore::~SqliteCacheStore() {
  close_impl(p_);
  p_ = nullptr;
}

void SqliteCacheStore::close_impl(Impl* p) {
  if (!p) return;
  if (p->get_stmt) sqlite3_finalize(p->get_stmt);
  if (p->set_stmt) sqlite3_finalize(p->set_stmt);
  if (p->erase_stmt) sqlite3_finalize(p->erase_stmt);
  if (p->purge_stmt) sqlite3_finalize(p->purge_stmt);
  if (p->count_stmt) sqlite3_finalize(p->count_stmt);
  if (p->db) sqlite3_close(p->db);
  delete p;
}

bool SqliteCacheStore::Get(const std::string& key, CacheRecord& out) {
  std::lock_guard<std::mutex> lk(mu_);
  sqlite3_stmt* stmt = p_->get_stmt;
  sqlite3_reset(stmt);
  sqlite3_clear_bindings(stmt);
  sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_DONE) {
    sqlite3_reset(stmt);
    return false;
  }
  if (rc != SQLITE_ROW) {
    sqlite3_reset(stmt);
    throw CacheError(sqlite_msg(p_->db, "sqlite3_step(get)"));
  }

  const void* blob = sqlite3_column_blob(stmt, 0);
  const int n = sqlite3_column_bytes(stmt, 0);
  out.payload.assign(static_cast<const char*>(blob), blob ? static_cast<std::size_t>(n) : 0u);
  out.cell_version = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 1));
  out.expires_at_s = sqlite3_column_double(stmt, 2);
  sqlite3_reset(stmt);
  return true;
}

void SqliteCacheStore::Set(const std::string& key, const CacheRecord& rec) {
  std::lock_guard<std::mutex> lk(mu_);
  sqlite3_stmt* stmt = p_->set_stmt;
  sqlite3_reset(stmt);
  sqlite3_clear_bindings(stmt);
  sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, rec.payload.data(), static_cast<int>(rec.payload.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(rec.cell_version));
  sqlite3_bind_double(stmt, 4, rec.expires_at_s);
  step_done_or_throw(p_->db, stmt, "sqlite3_step(set)");
}

void SqliteCacheStore::Erase(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  sqlite3_stmt* stmt = p_->erase_stmt;
  sqlite3_reset(stmt);
  sqlite3_clear_bindings(stmt);
  sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
  step_done_or_throw(p_->db, stmt, "sqlite3_step(erase)");
}

std::size_t SqliteCacheStore::Purge(double now_s) {
  std::lock_guard<std::mutex> lk(mu_);
  sqlite3_stmt* stmt = p_->purge_stmt;
  sqlite3_reset(stmt);
  sqlite3_bind_double(stmt, 1, now_s);
  step_done_or_throw(p_->db, stmt, "sqlite3_step(purge)");
  return static_cast<std::size_t>(sqlite3_changes(p_->db));
}

std::size_t SqliteCacheStore::Size() const {
  std::lock_guard<std::mutex> lk(mu_);
  sqlite3_stmt* stmt = p_->count_stmt;
  sqlite3_reset(stmt);
  const int rc = sqlite3_step(stmt);
  if (rc != SQLITE_ROW) {
    sqlite3_reset(stmt);
    throw CacheError(sqlite_msg(p_->db, "sqlite3_step(count)"));
  }
  const auto n = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  sqlite3_reset(stmt);
  return n;
}

} // namespace cache
