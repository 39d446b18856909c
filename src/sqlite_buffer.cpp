// -----------------------------------------------------------------------------
// sqlite_buffer.cpp: SQLite-backed durable buffer
//
// API, schema & eviction policy: see include/aqlink/buffer.hpp
// -----------------------------------------------------------------------------
#include "aqlink/buffer.hpp"

#include <glog/logging.h>
#include <sqlite3.h>

#include <memory>
#include <sstream>

namespace aqlink {

namespace {

constexpr const char* kCreateSql =
    "CREATE TABLE IF NOT EXISTS readings ("
    "  id      INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  payload TEXT    NOT NULL,"
    "  sent    INTEGER NOT NULL DEFAULT 0"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_readings_sent ON readings(sent);";

constexpr const char* kInsertSql   = "INSERT INTO readings (payload) VALUES (?1);";
constexpr const char* kMarkSentSql = "UPDATE readings SET sent = 1 WHERE id = ?1;";
constexpr const char* kUnsentSql   = "SELECT id, payload FROM readings WHERE sent = 0 ORDER BY id;";
constexpr const char* kEvictSql    =
    "DELETE FROM readings WHERE id IN (SELECT id FROM readings ORDER BY id LIMIT ?1);";

// Owns one prepared statement for the duration of a call.
using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    throw BufferError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
  }
  return StmtPtr(raw, &sqlite3_finalize);
}

void step_done(sqlite3* db, sqlite3_stmt* stmt, const char* what) {
  const int rc = sqlite3_step(stmt);
  if (rc != SQLITE_DONE) {
    throw BufferError(std::string(what) + " failed: " + sqlite3_errmsg(db));
  }
}

bool is_memory_path(const std::string& p) {
  return p.empty() || p == ":memory:" || p.rfind("file::memory:", 0) == 0;
}

} // namespace

SqliteBuffer::SqliteBuffer(SqliteBufferOptions opts)
: opts_(std::move(opts)), owner_(std::this_thread::get_id()) {
  if (opts_.eviction_batch == 0) throw BufferError("eviction_batch must be > 0");

  in_memory_ = is_memory_path(opts_.path);
  const std::string path = in_memory_ ? std::string(":memory:") : opts_.path;

  // NOMUTEX: the handle never leaves its thread, see check_owner().
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw BufferError("cannot open buffer database " + path + ": " + msg);
  }
  sqlite3_busy_timeout(db_, 2000);

  try {
    if (!in_memory_) {
      exec("PRAGMA journal_mode=WAL;");
      exec("PRAGMA synchronous=FULL;");
    }
    exec(kCreateSql);
  } catch (const BufferError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  LOG(INFO) << "buffer: opened " << path
            << " max_bytes=" << (opts_.max_bytes ? std::to_string(*opts_.max_bytes) : std::string("none"))
            << " eviction_batch=" << opts_.eviction_batch;
}

SqliteBuffer::~SqliteBuffer() {
  if (db_) {
    // Destruction off-thread is allowed: nothing else can be using the handle anymore.
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void SqliteBuffer::close() {
  if (!db_) return;
  check_owner();
  sqlite3_close(db_);
  db_ = nullptr;
  LOG(INFO) << "buffer: closed";
}

void SqliteBuffer::check_owner() const {
  if (std::this_thread::get_id() != owner_)
    throw BufferError("buffer used outside its owning thread");
  if (!db_)
    throw BufferError("buffer is closed");
}

void SqliteBuffer::exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw BufferError("sqlite exec failed: " + msg);
  }
}

int64_t SqliteBuffer::query_int(const char* sql) {
  StmtPtr stmt = prepare(db_, sql);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    throw BufferError(std::string("query returned no row: ") + sql);
  return sqlite3_column_int64(stmt.get(), 0);
}

uint64_t SqliteBuffer::db_file_size() {
  check_owner();
  if (in_memory_) return 0;
  const int64_t pages = query_int("PRAGMA page_count;");
  const int64_t free_pages = query_int("PRAGMA freelist_count;");
  const int64_t page_size = query_int("PRAGMA page_size;");
  const int64_t live = pages > free_pages ? pages - free_pages : 0;
  return static_cast<uint64_t>(live * page_size);
}

uint64_t SqliteBuffer::row_count() {
  check_owner();
  return static_cast<uint64_t>(query_int("SELECT COUNT(*) FROM readings;"));
}

// -----------------------------------------------------------------------------
// evict_until_below_limit()
// POLICY:
//   - oldest first, eviction_batch rows per round, sent flag ignored
//   - stops when under the cap or when no rows remain (never throws on empty)
// -----------------------------------------------------------------------------
void SqliteBuffer::evict_until_below_limit() {
  check_owner();
  if (!opts_.max_bytes) return;
  const uint64_t cap = *opts_.max_bytes;

  unsigned rounds = 0;
  uint64_t removed = 0;
  while (db_file_size() > cap) {
    if (row_count() == 0) {
      VLOG(1) << "buffer: nothing left to evict";
      break;
    }
    StmtPtr stmt = prepare(db_, kEvictSql);
    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(opts_.eviction_batch));
    step_done(db_, stmt.get(), "evict");
    removed += static_cast<uint64_t>(sqlite3_changes(db_));
    ++rounds;
  }

  if (rounds > 0) {
    LOG(WARNING) << "buffer: evicted " << removed << " rows in " << rounds
                 << " rounds, size now " << db_file_size() << " bytes (cap " << cap << ")";
  }
}

int64_t SqliteBuffer::append(const std::string& payload) {
  check_owner();

  if (opts_.max_bytes) {
    const uint64_t size = db_file_size();
    if (size > *opts_.max_bytes) {
      LOG(INFO) << "buffer: size " << size << " exceeds cap " << *opts_.max_bytes << ", evicting";
      evict_until_below_limit();
    }
  }

  StmtPtr stmt = prepare(db_, kInsertSql);
  sqlite3_bind_text(stmt.get(), 1, payload.data(), static_cast<int>(payload.size()), SQLITE_TRANSIENT);
  step_done(db_, stmt.get(), "append");
  const int64_t id = sqlite3_last_insert_rowid(db_);
  VLOG(1) << "buffer: appended row " << id;
  return id;
}

void SqliteBuffer::mark_sent(int64_t id) {
  check_owner();
  StmtPtr stmt = prepare(db_, kMarkSentSql);
  sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(id));
  step_done(db_, stmt.get(), "mark_sent");
  if (sqlite3_changes(db_) == 0) {
    LOG(WARNING) << "buffer: mark_sent found no row " << id;
  }
}

std::vector<BufferEntry> SqliteBuffer::unsent() {
  check_owner();
  std::vector<BufferEntry> rows;
  StmtPtr stmt = prepare(db_, kUnsentSql);

  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    BufferEntry e;
    e.id = sqlite3_column_int64(stmt.get(), 0);
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
    const int len = sqlite3_column_bytes(stmt.get(), 1);
    if (text) e.payload.assign(text, static_cast<std::size_t>(len));
    rows.push_back(std::move(e));
  }
  if (rc != SQLITE_DONE)
    throw BufferError(std::string("unsent scan failed: ") + sqlite3_errmsg(db_));
  return rows;
}

BufferStats SqliteBuffer::stats() {
  check_owner();
  BufferStats s;
  s.total_entries  = static_cast<uint64_t>(query_int("SELECT COUNT(*) FROM readings;"));
  s.sent_entries   = static_cast<uint64_t>(query_int("SELECT COUNT(*) FROM readings WHERE sent = 1;"));
  s.unsent_entries = s.total_entries - s.sent_entries;
  s.size_bytes     = db_file_size();
  s.max_bytes      = opts_.max_bytes;
  s.eviction_batch = opts_.eviction_batch;
  return s;
}

} // namespace aqlink
