#pragma once
// Scripted collaborators shared by the publisher, loop and end-to-end tests.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "aqlink/backoff.hpp"
#include "aqlink/buffer.hpp"
#include "aqlink/publisher.hpp"

namespace aqlink::testing {

// Plays back a list of outcomes, then keeps returning `fallback`.
class ScriptedPublisher : public Publisher {
public:
    explicit ScriptedPublisher(std::deque<bool> script = {}, bool fallback = true)
    : script_(std::move(script)), fallback_(fallback) {}

    bool publish(const std::string& payload) override {
        std::lock_guard<std::mutex> lk(mu_);
        ++calls_;
        attempts_.push_back(payload);
        bool ok = fallback_;
        if (!script_.empty()) { ok = script_.front(); script_.pop_front(); }
        if (ok) delivered_.push_back(payload);
        return ok;
    }

    void close() override { closed_ = true; }

    int calls() const { std::lock_guard<std::mutex> lk(mu_); return calls_; }
    std::vector<std::string> delivered() const { std::lock_guard<std::mutex> lk(mu_); return delivered_; }
    std::vector<std::string> attempts() const { std::lock_guard<std::mutex> lk(mu_); return attempts_; }
    bool closed() const { return closed_; }

private:
    mutable std::mutex mu_;
    std::deque<bool> script_;
    bool fallback_;
    int calls_{0};
    std::vector<std::string> attempts_;
    std::vector<std::string> delivered_;
    std::atomic<bool> closed_{false};
};

// Lets a test keep the transport while the loop owns the publisher.
class ForwardingPublisher : public Publisher {
public:
    explicit ForwardingPublisher(ScriptedPublisher& target) : target_(target) {}
    bool publish(const std::string& p) override { return target_.publish(p); }
    void close() override { target_.close(); }
private:
    ScriptedPublisher& target_;
};

class ThrowingPublisher : public Publisher {
public:
    bool publish(const std::string&) override { throw std::runtime_error("socket exploded"); }
    void close() override {}
};

// Throws something that is not a std::exception.
class ForeignThrowPublisher : public Publisher {
public:
    bool publish(const std::string&) override { throw 42; }
    void close() override {}
};

// Buffer whose append always fails, to exercise the message-loss path.
class FailingBuffer : public Buffer {
public:
    int64_t append(const std::string&) override { throw BufferError("disk full"); }
    void mark_sent(int64_t) override {}
    std::vector<BufferEntry> unsent() override { return {}; }
    BufferStats stats() override { return {}; }
    void close() override {}
};

// append fails with something that is not a std::exception.
class ForeignThrowBuffer : public FailingBuffer {
public:
    int64_t append(const std::string&) override { throw "no space"; }
};

// Same as SqliteBuffer, but mark_sent fails.
class MarkSentFailsBuffer : public SqliteBuffer {
public:
    MarkSentFailsBuffer() : SqliteBuffer(SqliteBufferOptions{":memory:", std::nullopt, 500}) {}
    void mark_sent(int64_t) override { throw BufferError("database is locked"); }
};

// Deterministic backoff that records every call.
class RecordingBackoff : public BackoffPolicy {
public:
    explicit RecordingBackoff(Seconds failure_delay) : delay_(failure_delay) {}

    Seconds next_delay(bool success) override {
        std::lock_guard<std::mutex> lk(mu_);
        calls_.push_back(success);
        return success ? Seconds(0.0) : delay_;
    }

    std::vector<bool> calls() const { std::lock_guard<std::mutex> lk(mu_); return calls_; }

private:
    mutable std::mutex mu_;
    Seconds delay_;
    std::vector<bool> calls_;
};

// Poll @p pred every few ms until it holds or @p timeout passes.
template <class Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace aqlink::testing
