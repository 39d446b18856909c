// -----------------------------------------------------------------------------
// pms5003.cpp: Implementation of the PMS5003 protocol driver
//
// API & frame layout:
//   see include/aqlink/pms5003.hpp
//
// This file focuses on the validation order and the retry/counter policy.
// -----------------------------------------------------------------------------
#include "aqlink/pms5003.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace aqlink {

namespace {

uint16_t be16(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

void put_be16(FrameBuffer& out, std::size_t at, uint16_t v) {
  out[at]     = static_cast<uint8_t>(v >> 8);
  out[at + 1] = static_cast<uint8_t>(v & 0xFF);
}

std::string hex(const uint8_t* p, std::size_t n) {
  static const char* digits = "0123456789abcdef";
  std::string s;
  s.reserve(n * 2);
  for (std::size_t i = 0; i < n; ++i) {
    s.push_back(digits[p[i] >> 4]);
    s.push_back(digits[p[i] & 0x0F]);
  }
  return s;
}

} // namespace

// ---------- layout helpers ----------

bool Pms5003Protocol::consistent(std::string* why) const {
  auto fail = [why](const char* msg) {
    if (why) *why = msg;
    return false;
  };
  if (frame_length == 0 || frame_length > kMaxFrameLength) return fail("frame_length out of range");
  if (header.empty() || header.size() > frame_length)      return fail("header does not fit in frame");
  if (checksum_offset + 2 != frame_length)                 return fail("checksum must be the last two bytes");
  if (data_words < 6)                                      return fail("need at least six data words");
  if (data_start_offset < header.size())                   return fail("data overlaps header");
  if (data_end_offset() > checksum_offset)                 return fail("data overlaps checksum");
  if (ack_length > kMaxFrameLength)                        return fail("ack_length out of range");
  if (set_passive_cmd.empty() || request_frame_cmd.empty()) return fail("commands must not be empty");
  return true;
}

const char* to_string(FrameStatus s) {
  switch (s) {
    case FrameStatus::Ok:          return "ok";
    case FrameStatus::BadLength:   return "bad-length";
    case FrameStatus::BadHeader:   return "bad-header";
    case FrameStatus::BadChecksum: return "bad-checksum";
  }
  return "unknown";
}

uint16_t frame_checksum(const uint8_t* frame, std::size_t count) {
  uint32_t sum = 0;
  for (std::size_t i = 0; i < count; ++i) sum += frame[i];
  return static_cast<uint16_t>(sum & 0xFFFF);
}

bool frame_checksum_ok(const uint8_t* frame, std::size_t len, const Pms5003Protocol& proto) {
  if (!frame || len < proto.frame_length) return false;
  const uint16_t expected   = be16(frame + proto.checksum_offset);
  const uint16_t calculated = frame_checksum(frame, proto.checksum_offset);
  return expected == calculated;
}

FrameStatus validate_frame(const uint8_t* frame, std::size_t len, const Pms5003Protocol& proto) {
  if (!frame || len != proto.frame_length) return FrameStatus::BadLength;
  if (!std::equal(proto.header.begin(), proto.header.end(), frame)) return FrameStatus::BadHeader;
  if (!frame_checksum_ok(frame, len, proto)) return FrameStatus::BadChecksum;
  return FrameStatus::Ok;
}

PmReading decode_frame(const uint8_t* frame, const Pms5003Protocol& proto) {
  const uint8_t* w = frame + proto.data_start_offset;
  PmReading r;
  r.pm1_cf   = be16(w + 0);
  r.pm25_cf  = be16(w + 2);
  r.pm10_cf  = be16(w + 4);
  r.pm1_atm  = be16(w + 6);
  r.pm25_atm = be16(w + 8);
  r.pm10_atm = be16(w + 10);
  return r;
}

FrameBuffer encode_frame(const PmReading& r, const Pms5003Protocol& proto) {
  FrameBuffer out;
  out.resize(proto.frame_length, 0);
  std::copy(proto.header.begin(), proto.header.end(), out.begin());

  // Length field counts everything after itself, checksum included.
  const std::size_t length_at = proto.header.size();
  if (length_at + 2 <= proto.data_start_offset)
    put_be16(out, length_at, static_cast<uint16_t>(proto.frame_length - length_at - 2));

  const uint16_t words[6] = {r.pm1_cf, r.pm25_cf, r.pm10_cf, r.pm1_atm, r.pm25_atm, r.pm10_atm};
  for (std::size_t i = 0; i < 6; ++i)
    put_be16(out, proto.data_start_offset + i * 2, words[i]);

  put_be16(out, proto.checksum_offset, frame_checksum(out.data(), proto.checksum_offset));
  return out;
}

// ---------- driver ----------

Pms5003::Pms5003(transport::IByteStream& port, Pms5003Config cfg, Pms5003Protocol proto)
: port_(port), cfg_(cfg), proto_(proto) {
  std::string why;
  if (!proto_.consistent(&why))
    throw std::invalid_argument("pms5003: inconsistent protocol layout: " + why);
  if (cfg_.max_retries < 1)
    throw std::invalid_argument("pms5003: max_retries must be >= 1");
}

bool Pms5003::begin() {
  LOG(INFO) << "pms5003: switching sensor on " << port_.name() << " to passive mode";
  port_.write(proto_.set_passive_cmd.data(), proto_.set_passive_cmd.size());

  FrameBuffer ack;
  ack.resize(proto_.ack_length);
  const std::size_t n = port_.read(ack.data(), ack.size());
  VLOG(1) << "pms5003: ack " << hex(ack.data(), n);
  if (n != proto_.ack_length) {
    LOG(WARNING) << "pms5003: short passive-mode ack (" << n << "/" << proto_.ack_length << " bytes)";
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// read_single_attempt(): request one frame and validate it.
// Counter policy:
//   - BadLength / BadHeader -> timeouts_
//   - BadChecksum           -> checksum_errors_
// -----------------------------------------------------------------------------
std::optional<PmReading> Pms5003::read_single_attempt() {
  port_.write(proto_.request_frame_cmd.data(), proto_.request_frame_cmd.size());

  frame_.resize(proto_.frame_length);
  const std::size_t n = port_.read(frame_.data(), proto_.frame_length);

  const FrameStatus st = validate_frame(frame_.data(), n, proto_);
  switch (st) {
    case FrameStatus::Ok:
      break;
    case FrameStatus::BadLength:
      ++timeouts_;
      LOG(WARNING) << "pms5003: frame length error, expected " << proto_.frame_length
                   << " got " << n << " bytes";
      return std::nullopt;
    case FrameStatus::BadHeader:
      ++timeouts_;
      LOG(WARNING) << "pms5003: frame header error, got "
                   << hex(frame_.data(), std::min(n, proto_.header.size()));
      return std::nullopt;
    case FrameStatus::BadChecksum:
      ++checksum_errors_;
      LOG(WARNING) << "pms5003: checksum mismatch, frame "
                   << std::hex << be16(frame_.data() + proto_.checksum_offset)
                   << " calculated " << frame_checksum(frame_.data(), proto_.checksum_offset)
                   << std::dec;
      return std::nullopt;
  }

  ++frames_ok_;
  PmReading r = decode_frame(frame_.data(), proto_);
  VLOG(1) << "pms5003: pm1=" << r.pm1_cf << " pm2.5=" << r.pm25_cf << " pm10=" << r.pm10_cf;
  return r;
}

std::optional<PmReading> Pms5003::read() {
  for (int attempt = 1; attempt <= cfg_.max_retries; ++attempt) {
    auto reading = read_single_attempt();
    if (reading) {
      if (attempt > 1) LOG(INFO) << "pms5003: read succeeded on attempt " << attempt;
      return reading;
    }

    if (attempt < cfg_.max_retries) {
      VLOG(1) << "pms5003: attempt " << attempt << "/" << cfg_.max_retries
              << " failed, retrying in " << cfg_.timeout.count() << " ms";
      if (cfg_.timeout.count() > 0) std::this_thread::sleep_for(cfg_.timeout);
    }
  }

  LOG(ERROR) << "pms5003: all " << cfg_.max_retries << " attempts failed"
             << " (checksum_errors=" << checksum_errors() << ", timeouts=" << timeouts() << ")";
  return std::nullopt;
}

} // namespace aqlink
