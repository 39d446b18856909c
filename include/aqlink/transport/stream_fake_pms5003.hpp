#pragma once
/**
 * @file stream_fake_pms5003.hpp
 * @brief Deterministic PMS5003 simulator behind IByteStream (header-only).
 *
 * Speaks the same byte protocol as the sensor: it starts in active mode,
 * answers the passive-mode command with an 8-byte ack, and answers every
 * request-frame command with one frame built from a scripted list of
 * readings (the last one repeats once the list is exhausted). A fault mode
 * corrupts frames the way a noisy UART does. Used by the test suite and by
 * `aqlink-agent --test-mode`.
 */

#include "aqlink/pms5003.hpp"
#include "aqlink/transport/byte_stream.hpp"

#include <algorithm>
#include <cstring>
#include <mutex>
#include <vector>

namespace aqlink::transport {

enum class FakeFault : uint8_t {
  None = 0,
  BadChecksum = 1,   ///< checksum bytes zeroed
  Truncated = 2,     ///< only half the frame is delivered
  BadHeader = 3,     ///< first header byte flipped
  Silent = 4         ///< nothing is ever answered
};

class FakePms5003Stream : public IByteStream {
public:
  explicit FakePms5003Stream(std::vector<PmReading> readings = {PmReading{10, 12, 15, 10, 12, 15}},
                             Pms5003Protocol proto = {})
  : readings_(std::move(readings)), proto_(proto) {}

  std::size_t write(const uint8_t* data, std::size_t len) override {
    std::lock_guard<std::mutex> lk(mu_);
    ++writes_;
    if (!data || !len) return 0;

    if (matches(data, len, proto_.set_passive_cmd)) {
      passive_ = true;
      pending_ = make_ack();
    } else if (matches(data, len, proto_.request_frame_cmd)) {
      ++requests_;
      pending_.clear();
      if (passive_ && fault_ != FakeFault::Silent && !readings_.empty()) {
        const PmReading& r = readings_[std::min(next_, readings_.size() - 1)];
        if (next_ < readings_.size()) ++next_;
        FrameBuffer f = encode_frame(r, proto_);
        pending_.assign(f.begin(), f.end());
        corrupt(pending_);
      }
    }
    return len;
  }

  std::size_t read(uint8_t* out, std::size_t n) override {
    std::lock_guard<std::mutex> lk(mu_);
    const std::size_t take = std::min(n, pending_.size());
    if (take) std::memcpy(out, pending_.data(), take);
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(take));
    return take;
  }

  const char* name() const override { return "fake-pms5003"; }

  void set_fault(FakeFault f) { std::lock_guard<std::mutex> lk(mu_); fault_ = f; }
  bool passive() const        { std::lock_guard<std::mutex> lk(mu_); return passive_; }
  std::size_t requests() const { std::lock_guard<std::mutex> lk(mu_); return requests_; }
  std::size_t writes() const   { std::lock_guard<std::mutex> lk(mu_); return writes_; }

private:
  static bool matches(const uint8_t* data, std::size_t len, const CommandBytes& cmd) {
    return len == cmd.size() && std::equal(cmd.begin(), cmd.end(), data);
  }

  // Real sensors answer E1 with: header, 00 04, command byte, mode byte, checksum.
  std::vector<uint8_t> make_ack() const {
    std::vector<uint8_t> ack(proto_.header.begin(), proto_.header.end());
    ack.push_back(0x00);
    ack.push_back(0x04);
    ack.push_back(proto_.set_passive_cmd.size() > 2 ? proto_.set_passive_cmd[2] : 0x00);
    ack.push_back(0x00);
    const uint16_t sum = frame_checksum(ack.data(), ack.size());
    ack.push_back(static_cast<uint8_t>(sum >> 8));
    ack.push_back(static_cast<uint8_t>(sum & 0xFF));
    ack.resize(proto_.ack_length, 0x00);
    return ack;
  }

  void corrupt(std::vector<uint8_t>& f) const {
    switch (fault_) {
      case FakeFault::BadChecksum:
        f[proto_.checksum_offset] = 0x00;
        f[proto_.checksum_offset + 1] = 0x00;
        break;
      case FakeFault::Truncated:
        f.resize(f.size() / 2);
        break;
      case FakeFault::BadHeader:
        f[0] ^= 0xFF;
        break;
      case FakeFault::None:
      case FakeFault::Silent:
        break;
    }
  }

  mutable std::mutex mu_;
  std::vector<PmReading> readings_;
  Pms5003Protocol proto_;
  std::vector<uint8_t> pending_;
  std::size_t next_{0};
  std::size_t requests_{0};
  std::size_t writes_{0};
  bool passive_{false};
  FakeFault fault_{FakeFault::None};
};

} // namespace aqlink::transport
