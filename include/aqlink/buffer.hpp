/**
 * @page aq-buffer aqlink Durable Buffer
 * @file buffer.hpp
 * @brief Append-only on-disk store of outbound payloads with a sent flag and a size cap.
 *
 * @details
 * PURPOSE
 * -------
 * This is the durability boundary of the agent. Once `append()` returns, a
 * reading survives a crash, a power cut or a restart, and will be retried
 * until the broker acknowledges it or the size cap evicts it.
 *
 * SCHEMA
 * ------
 * ```
 *   CREATE TABLE readings (
 *     id       INTEGER PRIMARY KEY AUTOINCREMENT,
 *     payload  TEXT    NOT NULL,
 *     sent     INTEGER NOT NULL DEFAULT 0
 *   );
 *   CREATE INDEX idx_readings_sent ON readings(sent);
 * ```
 * AUTOINCREMENT keeps ids monotonic even after the newest rows were evicted,
 * so id order is insertion order.
 *
 * SIZE CAP AND EVICTION
 * ---------------------
 * - The cap is checked *before* each insert. If the store is over the cap,
 *   the oldest `eviction_batch` rows are deleted, by id, until it is under
 *   the cap or empty. Then the new row goes in.
 * - The cap can therefore be exceeded by roughly one row between checks.
 * - Eviction ignores `sent`. It is a disk guarantee, not a delivery one.
 * - "Size" means bytes held by live pages: (page_count - freelist_count) *
 *   page_size. Deleted rows return pages to the freelist, so this number
 *   drops as eviction proceeds even though the file itself does not shrink.
 *   In-memory stores report 0 and are never evicted.
 *
 * THREADING
 * ---------
 * A SqliteBuffer belongs to the thread that constructed it. Any call from
 * another thread throws BufferError. In the agent that thread is the
 * delivery loop, which builds the buffer itself through a factory.
 *
 * FAILURE MODEL
 * -------------
 * Every SQLite error surfaces as BufferError. The buffered publisher turns
 * that into a failed publish and logs it at ERROR.
 */
#ifndef AQLINK_BUFFER_HPP
#define AQLINK_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace aqlink {

/// Storage fault (I/O, corruption, misuse across threads).
class BufferError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct BufferEntry {
  int64_t     id{0};
  std::string payload;
};

struct BufferStats {
  uint64_t total_entries{0};
  uint64_t sent_entries{0};
  uint64_t unsent_entries{0};
  uint64_t size_bytes{0};
  std::optional<uint64_t> max_bytes;
  std::size_t eviction_batch{0};
};

/**
 * @brief What the buffered publisher needs from a store.
 */
class Buffer {
public:
  virtual ~Buffer() = default;

  /// Persist @p payload with sent=false. @return its row id.
  virtual int64_t append(const std::string& payload) = 0;

  /// Flag a row as delivered. Unknown ids are ignored.
  virtual void mark_sent(int64_t id) = 0;

  /// All rows with sent=false, oldest first.
  virtual std::vector<BufferEntry> unsent() = 0;

  virtual BufferStats stats() = 0;

  virtual void close() = 0;
};

struct SqliteBufferOptions {
  std::string path{"buffer.db"};               ///< file path, or ":memory:"
  std::optional<uint64_t> max_bytes;           ///< no cap when empty
  std::size_t eviction_batch{500};
};

class SqliteBuffer : public Buffer {
public:
  /// Opens (or creates) the database and schema. @throws BufferError
  explicit SqliteBuffer(SqliteBufferOptions opts);
  ~SqliteBuffer() override;

  SqliteBuffer(const SqliteBuffer&) = delete;
  SqliteBuffer& operator=(const SqliteBuffer&) = delete;

  int64_t append(const std::string& payload) override;
  void mark_sent(int64_t id) override;
  std::vector<BufferEntry> unsent() override;
  BufferStats stats() override;
  void close() override;

  /**
   * @brief Bytes of live pages for file databases, 0 for in-memory ones.
   *
   * Virtual so tests can simulate a large store without writing megabytes.
   */
  virtual uint64_t db_file_size();

  /// Delete oldest rows in batches while over the cap. No-op without a cap.
  void evict_until_below_limit();

  uint64_t row_count();
  bool in_memory() const { return in_memory_; }
  const SqliteBufferOptions& options() const { return opts_; }

private:
  void check_owner() const;
  void exec(const char* sql);
  int64_t query_int(const char* sql);

  SqliteBufferOptions opts_;
  sqlite3* db_{nullptr};
  bool in_memory_{false};
  std::thread::id owner_;
};

} // namespace aqlink

#endif // AQLINK_BUFFER_HPP
