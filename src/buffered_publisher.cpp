// -----------------------------------------------------------------------------
// buffered_publisher.cpp: append, publish, mark sent
// -----------------------------------------------------------------------------
#include "aqlink/buffered_publisher.hpp"

#include <glog/logging.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace aqlink {

BufferedPublisher::BufferedPublisher(std::unique_ptr<Buffer> buffer,
                                     std::unique_ptr<Publisher> publisher)
: buffer_(std::move(buffer)), publisher_(std::move(publisher)) {
  if (!buffer_ || !publisher_) throw std::invalid_argument("BufferedPublisher needs a buffer and a publisher");
}

BufferedPublisher::~BufferedPublisher() {
  close();
}

bool BufferedPublisher::publish(const std::string& payload) {
  Envelope env{payload, std::nullopt};
  return deliver(env);
}

bool BufferedPublisher::deliver(Envelope& env) {
  if (closed_) return false;

  if (!env.row_id) {
    try {
      env.row_id = buffer_->append(env.payload);
    } catch (const std::exception& e) {
      LOG(ERROR) << "publisher: durable append failed, reading is held in memory only: " << e.what();
      return false;
    } catch (...) {
      LOG(ERROR) << "publisher: durable append failed with a non-standard exception, reading is held in memory only";
      return false;
    }
  }

  bool ok = false;
  try {
    ok = publisher_->publish(env.payload);
  } catch (const std::exception& e) {
    LOG(WARNING) << "publisher: transport error: " << e.what();
    return false;
  } catch (...) {
    LOG(WARNING) << "publisher: transport error: non-standard exception";
    return false;
  }

  if (!ok) {
    LOG(WARNING) << "publisher: publish failed, row " << *env.row_id << " stays unsent";
    return false;
  }

  try {
    buffer_->mark_sent(*env.row_id);
  } catch (const std::exception& e) {
    // Delivered already; the row may be sent again after a restart.
    LOG(WARNING) << "publisher: row " << *env.row_id << " delivered but not marked sent: " << e.what();
  }
  VLOG(1) << "publisher: row " << *env.row_id << " delivered";
  return true;
}

std::vector<BufferEntry> BufferedPublisher::unsent() {
  try {
    return buffer_->unsent();
  } catch (const std::exception& e) {
    LOG(ERROR) << "publisher: cannot list unsent rows: " << e.what();
    return {};
  }
}

void BufferedPublisher::close() {
  if (closed_) return;
  closed_ = true;
  try {
    buffer_->close();
  } catch (const std::exception& e) {
    LOG(WARNING) << "publisher: buffer close failed: " << e.what();
  }
  publisher_->close();
}

} // namespace aqlink
