/**
 * @file buffered_publisher.hpp
 * @brief Write-ahead wrapper: persist first, then publish, then mark sent.
 *
 * @details
 * ```
 *   deliver(env)
 *     ├─ env.row_id empty ─► row_id = buffer.append(payload)   (durability point)
 *     ├─ publisher.publish(payload)
 *     │     ├─ true  ─► buffer.mark_sent(row_id) ─► true
 *     │     └─ false ─► row stays unsent          ─► false
 *     └─ any storage / transport exception ─► logged ─► false
 * ```
 * `publish(payload)` is `deliver()` on a fresh envelope. The delivery loop
 * keeps the envelope across retries so one message occupies one row no
 * matter how many attempts it takes.
 *
 * If `append()` fails the message exists only in memory; that is logged at
 * ERROR since it is the one path on which a reading can be lost for good.
 */
#ifndef AQLINK_BUFFERED_PUBLISHER_HPP
#define AQLINK_BUFFERED_PUBLISHER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "aqlink/buffer.hpp"
#include "aqlink/publisher.hpp"

namespace aqlink {

/// One outbound message plus the buffer row that backs it, once it has one.
struct Envelope {
  std::string payload;
  std::optional<int64_t> row_id;
};

class BufferedPublisher : public Publisher {
public:
  BufferedPublisher(std::unique_ptr<Buffer> buffer, std::unique_ptr<Publisher> publisher);
  ~BufferedPublisher() override;

  BufferedPublisher(const BufferedPublisher&) = delete;
  BufferedPublisher& operator=(const BufferedPublisher&) = delete;

  bool publish(const std::string& payload) override;

  /// Append if needed (filling env.row_id), publish, mark sent.
  bool deliver(Envelope& env);

  /// Rows still waiting for an ack, oldest first. Empty on storage error.
  std::vector<BufferEntry> unsent();

  /// Closes buffer and transport. Idempotent.
  void close() override;

  Buffer& buffer() { return *buffer_; }

private:
  std::unique_ptr<Buffer> buffer_;
  std::unique_ptr<Publisher> publisher_;
  bool closed_{false};
};

} // namespace aqlink

#endif // AQLINK_BUFFERED_PUBLISHER_HPP
