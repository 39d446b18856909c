/**
 * @page aq-pms5003 aqlink PMS5003 Protocol Driver
 * @file pms5003.hpp
 * @brief Passive-mode driver for the Plantower PMS5003 particulate sensor.
 *
 * @details
 * FRAME LAYOUT (reference configuration)
 * --------------------------------------
 * ```
 *  offset  size  field
 *  ------  ----  -------------------------------------------
 *     0     2    header            0x42 0x4D  ("BM")
 *     2     2    frame length      big-endian, 28 for a data frame
 *     4    26    data              13 big-endian uint16 words
 *    30     2    checksum          big-endian, sum(bytes[0..29]) & 0xFFFF
 * ```
 * Words 0..5 are PM1.0/PM2.5/PM10 (CF=1) followed by PM1.0/PM2.5/PM10
 * (atmospheric). Words 6..12 are particle counts and a reserved word; the
 * driver ignores them.
 *
 * PASSIVE MODE
 * ------------
 * Out of reset the sensor streams a frame every ~1 s. `begin()` switches it
 * to passive mode (`42 4D E1 00 00 E1`, answered by an 8-byte ack), after
 * which every `request-frame` command (`42 4D E2 00 00 E2`) yields exactly
 * one 32-byte frame. Request/response keeps the byte stream aligned, which
 * is why the driver does not need a resynchronizing decoder.
 *
 * RETRY POLICY
 * ------------
 * One `read()` makes up to `max_retries` attempts:
 *   - short read or wrong header  -> `timeouts` += 1
 *   - checksum mismatch           -> `checksum_errors` += 1
 * It sleeps `timeout` between attempts, never after the last one, and
 * returns `std::nullopt` when all attempts failed. Callers treat that as
 * "no data this cycle"; nothing here throws after construction.
 *
 * OVERRIDES
 * ---------
 * Layout (`Pms5003Protocol`) and retry policy (`Pms5003Config`) are separate
 * value types so a PMS7003/PMSA003 variant, or a test, can change one
 * without touching the other. Frames live in a fixed-capacity ETL vector;
 * the sampling path does no heap allocation per attempt.
 */
#ifndef AQLINK_PMS5003_HPP
#define AQLINK_PMS5003_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "etl/vector.h"
#include "aqlink/reading.hpp"
#include "aqlink/transport/byte_stream.hpp"

namespace aqlink {

static constexpr std::size_t kMaxFrameLength   = 64;  ///< largest frame any supported layout may declare
static constexpr std::size_t kMaxCommandLength = 8;

using CommandBytes = etl::vector<uint8_t, kMaxCommandLength>;
using FrameBuffer  = etl::vector<uint8_t, kMaxFrameLength>;

/**
 * @brief Byte layout of the sensor protocol. Defaults describe the PMS5003.
 */
struct Pms5003Protocol {
  CommandBytes header{0x42, 0x4D};
  std::size_t  frame_length{32};
  std::size_t  data_start_offset{4};
  std::size_t  data_words{13};
  std::size_t  checksum_offset{30};
  std::size_t  ack_length{8};
  CommandBytes set_passive_cmd{0x42, 0x4D, 0xE1, 0x00, 0x00, 0xE1};
  CommandBytes request_frame_cmd{0x42, 0x4D, 0xE2, 0x00, 0x00, 0xE2};

  std::size_t data_end_offset() const { return data_start_offset + data_words * 2; }

  /**
   * @brief Check that the offsets describe a decodable frame.
   * @param why  Optional; receives a short reason on failure.
   */
  bool consistent(std::string* why = nullptr) const;
};

/**
 * @brief Retry behaviour, independent of the byte layout.
 */
struct Pms5003Config {
  int max_retries{3};
  std::chrono::milliseconds timeout{1000};  ///< pause between failed attempts
};

enum class FrameStatus : uint8_t { Ok = 0, BadLength = 1, BadHeader = 2, BadChecksum = 3 };

const char* to_string(FrameStatus s);

/// Sum of the first @p count bytes, modulo 65536.
uint16_t frame_checksum(const uint8_t* frame, std::size_t count);

/// True when the trailing big-endian word equals frame_checksum() of everything before it.
bool frame_checksum_ok(const uint8_t* frame, std::size_t len, const Pms5003Protocol& proto);

/// Length, then header, then checksum, in that order.
FrameStatus validate_frame(const uint8_t* frame, std::size_t len, const Pms5003Protocol& proto);

/// Decode the first six data words. The frame must already be validated.
PmReading decode_frame(const uint8_t* frame, const Pms5003Protocol& proto);

/// Build a valid frame for @p r (unused words zero). Used by the simulator and tests.
FrameBuffer encode_frame(const PmReading& r, const Pms5003Protocol& proto);

/**
 * @class Pms5003
 * @brief Request/validate/decode loop over an IByteStream.
 *
 * The stream is borrowed and must outlive the driver. One sampling thread
 * drives read(); the counters may be read from any thread.
 */
class Pms5003 {
public:
  /**
   * @throws std::invalid_argument if @p proto is not consistent() or
   *         @p cfg.max_retries < 1.
   */
  explicit Pms5003(transport::IByteStream& port,
                   Pms5003Config cfg = {},
                   Pms5003Protocol proto = {});

  /**
   * @brief Put the sensor in passive mode and consume its acknowledgment.
   * @return true when a full-length ack came back.
   */
  bool begin();

  /**
   * @brief Read one measurement with retry.
   * @return The decoded reading, or std::nullopt once all attempts failed.
   */
  std::optional<PmReading> read();

  uint32_t timeouts() const        { return timeouts_.load(); }
  uint32_t checksum_errors() const { return checksum_errors_.load(); }
  uint32_t frames_ok() const       { return frames_ok_.load(); }

  const Pms5003Config&   config() const   { return cfg_; }
  const Pms5003Protocol& protocol() const { return proto_; }

private:
  std::optional<PmReading> read_single_attempt();

  transport::IByteStream& port_;
  Pms5003Config   cfg_;
  Pms5003Protocol proto_;
  FrameBuffer     frame_;

  std::atomic<uint32_t> timeouts_{0};
  std::atomic<uint32_t> checksum_errors_{0};
  std::atomic<uint32_t> frames_ok_{0};
};

} // namespace aqlink

#endif // AQLINK_PMS5003_HPP
