#include <doctest/doctest.h>
#include "aqlink/buffer.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <thread>

#include <unistd.h>

using namespace aqlink;
namespace fs = std::filesystem;

namespace {

// Unique database path under the temp dir, removed with its WAL files.
struct TempDb {
    fs::path path;

    TempDb() {
        static std::atomic<int> seq{0};
        path = fs::temp_directory_path() /
               ("aqlink-test-" + std::to_string(::getpid()) + "-" + std::to_string(seq++) + ".db");
        cleanup();
    }
    ~TempDb() { cleanup(); }

    void cleanup() {
        std::error_code ec;
        fs::remove(path, ec);
        fs::remove(path.string() + "-wal", ec);
        fs::remove(path.string() + "-shm", ec);
    }
};

SqliteBufferOptions memory_opts() {
    SqliteBufferOptions o;
    o.path = ":memory:";
    return o;
}

// Reports 100 bytes per row instead of real page usage.
class SimulatedSizeBuffer : public SqliteBuffer {
public:
    using SqliteBuffer::SqliteBuffer;
    uint64_t db_file_size() override { return row_count() * 100; }
};

} // namespace

TEST_CASE("append returns increasing ids and unsent lists them oldest first") {
    SqliteBuffer b(memory_opts());
    const int64_t a = b.append("one");
    const int64_t c = b.append("two");
    const int64_t d = b.append("three");
    CHECK(a < c);
    CHECK(c < d);

    auto rows = b.unsent();
    REQUIRE(rows.size() == 3);
    CHECK(rows[0].id == a);
    CHECK(rows[0].payload == "one");
    CHECK(rows[1].payload == "two");
    CHECK(rows[2].payload == "three");
}

TEST_CASE("mark_sent removes a row from unsent and ignores unknown ids") {
    SqliteBuffer b(memory_opts());
    const int64_t a = b.append("a");
    const int64_t c = b.append("b");

    b.mark_sent(a);
    b.mark_sent(a);        // twice is fine
    b.mark_sent(9999);     // unknown: logged, no throw

    auto rows = b.unsent();
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].id == c);

    const BufferStats s = b.stats();
    CHECK(s.total_entries == 2);
    CHECK(s.sent_entries == 1);
    CHECK(s.unsent_entries == 1);
}

TEST_CASE("In-memory buffers report zero size and never evict") {
    SqliteBufferOptions o = memory_opts();
    o.max_bytes = 1;
    SqliteBuffer b(o);
    CHECK(b.in_memory());
    for (int i = 0; i < 20; ++i) b.append("row");
    CHECK(b.db_file_size() == 0);
    CHECK(b.row_count() == 20);
}

TEST_CASE("Rows survive closing and reopening the file") {
    TempDb db;
    SqliteBufferOptions o;
    o.path = db.path.string();

    int64_t kept = 0;
    {
        SqliteBuffer b(o);
        kept = b.append("keep me");
        const int64_t gone = b.append("sent");
        b.mark_sent(gone);
        b.close();
        b.close();  // idempotent
    }

    SqliteBuffer again(o);
    auto rows = again.unsent();
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].id == kept);
    CHECK(rows[0].payload == "keep me");
    CHECK(again.stats().total_entries == 2);
    CHECK(again.db_file_size() > 0);
}

TEST_CASE("Eviction removes the oldest rows in batches until under the cap") {
    SqliteBufferOptions o = memory_opts();
    o.max_bytes = 250;
    o.eviction_batch = 2;
    SimulatedSizeBuffer b(o);

    // Appends already trim to r3..r5 (300 bytes); one more round leaves r5.
    for (int i = 1; i <= 5; ++i) b.append("r" + std::to_string(i));
    CHECK(b.row_count() == 3);
    b.evict_until_below_limit();

    auto rows = b.unsent();
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].payload == "r5");
}

TEST_CASE("append evicts before inserting when over the cap") {
    SqliteBufferOptions o = memory_opts();
    o.max_bytes = 250;
    o.eviction_batch = 1;
    SimulatedSizeBuffer b(o);

    b.append("a");
    b.append("b");
    b.append("c");          // 200 <= 250 before insert: no eviction, now 300
    CHECK(b.row_count() == 3);

    b.append("d");          // 300 > 250: evict "a" (200), then insert
    auto rows = b.unsent();
    REQUIRE(rows.size() == 3);
    CHECK(rows[0].payload == "b");
    CHECK(rows[2].payload == "d");
}

TEST_CASE("Eviction ignores the sent flag and stops on an empty store") {
    SqliteBufferOptions o = memory_opts();
    o.max_bytes = 150;
    o.eviction_batch = 10;
    SimulatedSizeBuffer b(o);

    const int64_t a = b.append("x");
    b.append("y");
    b.mark_sent(a);
    b.evict_until_below_limit();     // 200 > 150: one batch takes both
    CHECK(b.row_count() == 0);

    b.evict_until_below_limit();     // empty: no throw, no loop
    CHECK(b.row_count() == 0);
}

TEST_CASE("Ids keep growing after the newest rows were evicted") {
    SqliteBufferOptions o = memory_opts();
    o.max_bytes = 0;
    SimulatedSizeBuffer b(o);

    const int64_t first = b.append("a");
    b.evict_until_below_limit();
    const int64_t second = b.append("b");
    CHECK(second > first);
}

TEST_CASE("Real file size drops as rows are evicted") {
    TempDb db;
    SqliteBufferOptions o;
    o.path = db.path.string();
    o.eviction_batch = 50;
    SqliteBuffer b(o);

    const std::string blob(1000, 'x');
    for (int i = 0; i < 200; ++i) b.append(blob);
    const uint64_t full = b.db_file_size();
    CHECK(full > 100u * 1000u);

    SqliteBufferOptions capped = o;
    capped.max_bytes = full / 2;
    b.close();

    SqliteBuffer c(capped);
    c.evict_until_below_limit();
    CHECK(c.db_file_size() <= full / 2);
    CHECK(c.row_count() > 0);
    CHECK(c.row_count() < 200);
    CHECK(c.stats().max_bytes == full / 2);
}

TEST_CASE("A buffer refuses calls from a thread that does not own it") {
    SqliteBuffer b(memory_opts());
    b.append("mine");

    bool threw = false;
    std::thread other([&] {
        try {
            b.append("theirs");
        } catch (const BufferError&) {
            threw = true;
        }
    });
    other.join();

    CHECK(threw);
    CHECK(b.row_count() == 1);
}

TEST_CASE("Calls after close() throw BufferError") {
    SqliteBuffer b(memory_opts());
    b.close();
    CHECK_THROWS_AS(b.append("late"), BufferError);
    CHECK_THROWS_AS(b.unsent(), BufferError);
}

TEST_CASE("Zero eviction batch and unopenable paths are rejected") {
    SqliteBufferOptions o = memory_opts();
    o.eviction_batch = 0;
    CHECK_THROWS_AS(SqliteBuffer{o}, BufferError);

    SqliteBufferOptions bad;
    bad.path = "/nonexistent-dir-for-aqlink/sub/buffer.db";
    CHECK_THROWS_AS(SqliteBuffer{bad}, BufferError);
}
