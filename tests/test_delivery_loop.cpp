#include <doctest/doctest.h>
#include "aqlink/delivery_loop.hpp"
#include "fakes.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace aqlink;
using namespace aqlink::testing;
using namespace std::chrono_literals;

namespace {

DeliveryLoopOptions fast_poll() {
    DeliveryLoopOptions o;
    o.poll_interval = 20ms;
    return o;
}

// Factory over an in-memory buffer and a transport owned by the test.
OutboundFactory memory_factory(ScriptedPublisher& transport) {
    return [&transport] {
        SqliteBufferOptions o;
        o.path = ":memory:";
        return std::make_unique<BufferedPublisher>(std::make_unique<SqliteBuffer>(o),
                                                   std::make_unique<ForwardingPublisher>(transport));
    };
}

} // namespace

TEST_CASE("Queued payloads are delivered in order") {
    SampleQueue q(16);
    ScriptedPublisher transport;
    DeliveryLoop loop(q, memory_factory(transport),
                      std::make_unique<RecordingBackoff>(Seconds(0.0)), fast_poll());

    q.push_drop_oldest("a");
    q.push_drop_oldest("b");
    q.push_drop_oldest("c");
    loop.start();

    REQUIRE(eventually([&] { return loop.delivered() == 3; }));
    loop.stop();
    REQUIRE(loop.join_for(2000ms));

    CHECK(transport.delivered() == std::vector<std::string>{"a", "b", "c"});
    CHECK(loop.failed_attempts() == 0);
    CHECK(loop.state() == DeliveryLoop::State::Stopped);
    CHECK(transport.closed());
}

TEST_CASE("A failed payload is retried before anything newer") {
    SampleQueue q(16);
    ScriptedPublisher transport({false, false});
    auto backoff = std::make_unique<RecordingBackoff>(Seconds(0.01));
    RecordingBackoff* rec = backoff.get();
    DeliveryLoop loop(q, memory_factory(transport), std::move(backoff), fast_poll());

    q.push_drop_oldest("first");
    q.push_drop_oldest("second");
    loop.start();

    REQUIRE(eventually([&] { return loop.delivered() == 2; }));
    loop.stop();
    REQUIRE(loop.join_for(2000ms));

    CHECK(transport.attempts() == std::vector<std::string>{"first", "first", "first", "second"});
    CHECK(transport.delivered() == std::vector<std::string>{"first", "second"});
    CHECK(loop.failed_attempts() == 2);
    CHECK(loop.backlog_size() == 0);

    // First call resets after the publisher is built, then fail, fail, ok, ok.
    const std::vector<bool> calls = rec->calls();
    REQUIRE(calls.size() == 5);
    CHECK(calls[1] == false);
    CHECK(calls[2] == false);
    CHECK(calls[3] == true);
    CHECK(calls[4] == true);
}

TEST_CASE("stop() cuts a long backoff wait short") {
    SampleQueue q(4);
    ScriptedPublisher transport({}, false);
    DeliveryLoop loop(q, memory_factory(transport),
                      std::make_unique<RecordingBackoff>(Seconds(30.0)), fast_poll());

    q.push_drop_oldest("never");
    loop.start();
    REQUIRE(eventually([&] { return transport.calls() == 1; }));
    std::this_thread::sleep_for(20ms);

    const auto t0 = std::chrono::steady_clock::now();
    loop.stop();
    loop.stop();
    CHECK(loop.join_for(2000ms));
    CHECK(std::chrono::steady_clock::now() - t0 < 1s);
    CHECK(loop.backlog_size() == 1);
}

TEST_CASE("Unsent rows from a previous run are resumed first") {
    SampleQueue q(4);
    ScriptedPublisher transport;
    auto factory = [&transport] {
        SqliteBufferOptions o;
        o.path = ":memory:";
        auto buf = std::make_unique<SqliteBuffer>(o);
        buf->append("old-1");
        buf->append("old-2");
        return std::make_unique<BufferedPublisher>(std::move(buf),
                                                   std::make_unique<ForwardingPublisher>(transport));
    };
    DeliveryLoop loop(q, factory, std::make_unique<RecordingBackoff>(Seconds(0.0)), fast_poll());

    q.push_drop_oldest("new");
    loop.start();
    REQUIRE(eventually([&] { return loop.delivered() == 3; }));
    loop.stop();
    REQUIRE(loop.join_for(2000ms));

    CHECK(transport.delivered() == std::vector<std::string>{"old-1", "old-2", "new"});
}

TEST_CASE("Resuming can be turned off") {
    SampleQueue q(4);
    ScriptedPublisher transport;
    auto factory = [&transport] {
        SqliteBufferOptions o;
        o.path = ":memory:";
        auto buf = std::make_unique<SqliteBuffer>(o);
        buf->append("old");
        return std::make_unique<BufferedPublisher>(std::move(buf),
                                                   std::make_unique<ForwardingPublisher>(transport));
    };
    DeliveryLoopOptions opts = fast_poll();
    opts.resume_unsent = false;
    DeliveryLoop loop(q, factory, std::make_unique<RecordingBackoff>(Seconds(0.0)), opts);

    q.push_drop_oldest("new");
    loop.start();
    REQUIRE(eventually([&] { return loop.delivered() == 1; }));
    loop.stop();
    REQUIRE(loop.join_for(2000ms));

    CHECK(transport.delivered() == std::vector<std::string>{"new"});
}

TEST_CASE("A failing factory is retried with backoff") {
    SampleQueue q(4);
    ScriptedPublisher transport;
    std::atomic<int> builds{0};
    auto inner = memory_factory(transport);
    OutboundFactory factory = [&]() -> std::unique_ptr<BufferedPublisher> {
        const int n = ++builds;
        if (n == 1) throw BufferError("disk not mounted yet");
        if (n == 2) return nullptr;
        return inner();
    };
    DeliveryLoop loop(q, factory, std::make_unique<RecordingBackoff>(Seconds(0.01)), fast_poll());

    q.push_drop_oldest("eventually");
    loop.start();
    REQUIRE(eventually([&] { return loop.delivered() == 1; }));
    loop.stop();
    REQUIRE(loop.join_for(2000ms));

    CHECK(builds.load() == 3);
}

TEST_CASE("The publisher is built and used on the loop thread") {
    SampleQueue q(4);
    ScriptedPublisher transport;
    std::thread::id built_on;
    auto inner = memory_factory(transport);
    OutboundFactory factory = [&] {
        built_on = std::this_thread::get_id();
        return inner();
    };
    DeliveryLoop loop(q, factory, std::make_unique<RecordingBackoff>(Seconds(0.0)), fast_poll());

    q.push_drop_oldest("x");
    loop.start();
    // Would throw BufferError inside deliver() if the buffer crossed threads.
    REQUIRE(eventually([&] { return loop.delivered() == 1; }));
    loop.stop();
    REQUIRE(loop.join_for(2000ms));
    CHECK(built_on != std::this_thread::get_id());
}

TEST_CASE("Construction rejects missing collaborators") {
    SampleQueue q(4);
    ScriptedPublisher transport;
    CHECK_THROWS_AS(DeliveryLoop(q, OutboundFactory{}, std::make_unique<RecordingBackoff>(Seconds(0.0))),
                    std::invalid_argument);
    CHECK_THROWS_AS(DeliveryLoop(q, memory_factory(transport), nullptr), std::invalid_argument);
    CHECK(std::string(to_string(DeliveryLoop::State::Draining)) == "draining");
}
