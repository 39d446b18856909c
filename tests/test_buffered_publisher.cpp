#include <doctest/doctest.h>
#include "aqlink/buffered_publisher.hpp"
#include "fakes.hpp"

#include <memory>

using namespace aqlink;
using namespace aqlink::testing;

static std::unique_ptr<SqliteBuffer> memory_buffer() {
    SqliteBufferOptions o;
    o.path = ":memory:";
    return std::make_unique<SqliteBuffer>(o);
}

TEST_CASE("A confirmed publish leaves nothing unsent") {
    auto pub = std::make_unique<ScriptedPublisher>();
    ScriptedPublisher* p = pub.get();
    BufferedPublisher bp(memory_buffer(), std::move(pub));

    CHECK(bp.publish("hello"));
    CHECK(p->delivered() == std::vector<std::string>{"hello"});
    CHECK(bp.unsent().empty());
    CHECK(bp.buffer().stats().sent_entries == 1);
}

TEST_CASE("A failed publish keeps the row for replay") {
    BufferedPublisher bp(memory_buffer(), std::make_unique<ScriptedPublisher>(std::deque<bool>{}, false));

    CHECK_FALSE(bp.publish("later"));
    auto rows = bp.unsent();
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].payload == "later");
}

TEST_CASE("Retrying one envelope reuses its buffer row") {
    auto pub = std::make_unique<ScriptedPublisher>(std::deque<bool>{false, false, true});
    BufferedPublisher bp(memory_buffer(), std::move(pub));

    Envelope env{"reading", std::nullopt};
    CHECK_FALSE(bp.deliver(env));
    REQUIRE(env.row_id.has_value());
    const int64_t id = *env.row_id;

    CHECK_FALSE(bp.deliver(env));
    CHECK(bp.deliver(env));
    CHECK(*env.row_id == id);

    const BufferStats s = bp.buffer().stats();
    CHECK(s.total_entries == 1);
    CHECK(s.unsent_entries == 0);
}

TEST_CASE("A transport exception is a failed publish, row kept") {
    BufferedPublisher bp(memory_buffer(), std::make_unique<ThrowingPublisher>());
    CHECK_FALSE(bp.publish("x"));
    CHECK(bp.unsent().size() == 1);
}

TEST_CASE("A non-standard throw from either side is still just a failure") {
    BufferedPublisher from_transport(memory_buffer(), std::make_unique<ForeignThrowPublisher>());
    Envelope env{"x", std::nullopt};
    CHECK_FALSE(from_transport.deliver(env));
    REQUIRE(env.row_id.has_value());
    CHECK(from_transport.unsent().size() == 1);

    auto pub = std::make_unique<ScriptedPublisher>();
    ScriptedPublisher* p = pub.get();
    BufferedPublisher from_buffer(std::make_unique<ForeignThrowBuffer>(), std::move(pub));
    CHECK_FALSE(from_buffer.publish("y"));
    CHECK(p->calls() == 0);
}

TEST_CASE("An append failure is reported as false and nothing is sent") {
    auto pub = std::make_unique<ScriptedPublisher>();
    ScriptedPublisher* p = pub.get();
    BufferedPublisher bp(std::make_unique<FailingBuffer>(), std::move(pub));

    Envelope env{"lost", std::nullopt};
    CHECK_FALSE(bp.deliver(env));
    CHECK_FALSE(env.row_id.has_value());
    CHECK(p->calls() == 0);
}

TEST_CASE("A mark_sent failure after delivery still counts as delivered") {
    BufferedPublisher bp(std::make_unique<MarkSentFailsBuffer>(), std::make_unique<ScriptedPublisher>());
    CHECK(bp.publish("delivered"));
    // The row stays unsent and may be sent again after a restart.
    CHECK(bp.unsent().size() == 1);
}

TEST_CASE("close() closes both sides once and later publishes fail") {
    auto pub = std::make_unique<ScriptedPublisher>();
    ScriptedPublisher* p = pub.get();
    BufferedPublisher bp(memory_buffer(), std::move(pub));

    bp.close();
    bp.close();
    CHECK(p->closed());
    CHECK_FALSE(bp.publish("after close"));
    CHECK(p->calls() == 0);
}
