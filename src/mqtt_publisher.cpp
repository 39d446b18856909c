// -----------------------------------------------------------------------------
// mqtt_publisher.cpp: libmosquitto QoS 1 transport
//
// Connection & ack model: see include/aqlink/mqtt_publisher.hpp
// -----------------------------------------------------------------------------
#include "aqlink/mqtt_publisher.hpp"

#include <glog/logging.h>
#include <mosquitto.h>

#include <stdexcept>
#include <utility>

namespace aqlink {

namespace {

std::once_flag g_lib_init;

void ensure_lib_init() {
  std::call_once(g_lib_init, [] {
    mosquitto_lib_init();
    int major = 0, minor = 0, rev = 0;
    mosquitto_lib_version(&major, &minor, &rev);
    VLOG(1) << "mqtt: libmosquitto " << major << "." << minor << "." << rev;
  });
}

} // namespace

MqttPublisher::MqttPublisher(MqttOptions opts) : opts_(std::move(opts)) {
  ensure_lib_init();

  mosq_ = mosquitto_new(opts_.client_id.empty() ? nullptr : opts_.client_id.c_str(),
                        /*clean_session=*/true, this);
  if (!mosq_) throw std::runtime_error("mosquitto_new failed for client " + opts_.client_id);

  mosquitto_connect_callback_set(mosq_, &MqttPublisher::on_connect);
  mosquitto_disconnect_callback_set(mosq_, &MqttPublisher::on_disconnect);
  mosquitto_publish_callback_set(mosq_, &MqttPublisher::on_publish);

  if (opts_.username && opts_.password) {
    mosquitto_username_pw_set(mosq_, opts_.username->c_str(), opts_.password->c_str());
  }
  mosquitto_reconnect_delay_set(mosq_, opts_.reconnect_delay_s, opts_.reconnect_delay_max_s,
                                /*exponential=*/true);

  LOG(INFO) << "mqtt: connecting to " << opts_.host << ":" << opts_.port
            << " topic=" << opts_.topic << " client_id=" << opts_.client_id;

  int rc = mosquitto_connect_async(mosq_, opts_.host.c_str(), opts_.port, opts_.keepalive_s);
  if (rc != MOSQ_ERR_SUCCESS) {
    // The network thread keeps retrying from here on.
    LOG(ERROR) << "mqtt: initial connect failed: " << mosquitto_strerror(rc);
  }

  rc = mosquitto_loop_start(mosq_);
  if (rc != MOSQ_ERR_SUCCESS) {
    mosquitto_destroy(mosq_);
    mosq_ = nullptr;
    throw std::runtime_error(std::string("mosquitto_loop_start failed: ") + mosquitto_strerror(rc));
  }
}

MqttPublisher::~MqttPublisher() {
  close();
  if (mosq_) {
    mosquitto_destroy(mosq_);
    mosq_ = nullptr;
  }
}

void MqttPublisher::close() {
  if (closed_.exchange(true)) return;
  LOG(INFO) << "mqtt: closing connection";

  // Wakes a publish that is still waiting for its ack.
  acks_.set_connected(false);
  if (mosq_) {
    mosquitto_disconnect(mosq_);
    mosquitto_loop_stop(mosq_, /*force=*/false);
  }
}

bool MqttPublisher::publish(const std::string& payload) {
  if (closed_ || !acks_.connected()) {
    LOG(WARNING) << "mqtt: not connected, cannot publish";
    return false;
  }

  int sent_mid = 0;
  const AckResult r = acks_.send_and_wait([&](int& mid) {
    const int rc = mosquitto_publish(mosq_, &mid, opts_.topic.c_str(),
                                     static_cast<int>(payload.size()), payload.data(),
                                     /*qos=*/1, /*retain=*/false);
    if (rc != MOSQ_ERR_SUCCESS) {
      LOG(ERROR) << "mqtt: publish failed: " << mosquitto_strerror(rc);
      return false;
    }
    sent_mid = mid;
    VLOG(1) << "mqtt: published mid " << mid << ", waiting for ack";
    return true;
  }, opts_.ack_timeout);

  switch (r) {
    case AckResult::Acked:
      return true;
    case AckResult::TimedOut:
      LOG(WARNING) << "mqtt: no ack for mid " << sent_mid << " within "
                   << opts_.ack_timeout.count() << " ms";
      return false;
    case AckResult::Disconnected:
      LOG(WARNING) << "mqtt: connection lost while waiting for mid " << sent_mid;
      return false;
    case AckResult::SendFailed:
      return false;
  }
  return false;
}

// -----------------------------------------------------------------------------
// libmosquitto callbacks (network thread)
// -----------------------------------------------------------------------------
void MqttPublisher::on_connect(struct mosquitto*, void* obj, int rc) {
  auto* self = static_cast<MqttPublisher*>(obj);
  if (rc == 0) {
    self->acks_.set_connected(true);
    LOG(INFO) << "mqtt: connected";
  } else {
    self->acks_.set_connected(false);
    LOG(ERROR) << "mqtt: connection refused: " << mosquitto_connack_string(rc);
  }
}

void MqttPublisher::on_disconnect(struct mosquitto*, void* obj, int rc) {
  auto* self = static_cast<MqttPublisher*>(obj);
  self->acks_.on_disconnect(rc);
  if (rc != 0) LOG(WARNING) << "mqtt: disconnected, rc=" << rc;
  else         LOG(INFO) << "mqtt: disconnected";
}

void MqttPublisher::on_publish(struct mosquitto*, void* obj, int mid) {
  auto* self = static_cast<MqttPublisher*>(obj);
  if (self->acks_.on_ack(mid)) VLOG(1) << "mqtt: ack for mid " << mid;
  else                         VLOG(1) << "mqtt: late ack for mid " << mid;
}

// -----------------------------------------------------------------------------
// AckTracker
// -----------------------------------------------------------------------------
const char* to_string(AckResult r) {
  switch (r) {
    case AckResult::Acked:        return "acked";
    case AckResult::TimedOut:     return "timed-out";
    case AckResult::Disconnected: return "disconnected";
    case AckResult::SendFailed:   return "send-failed";
  }
  return "unknown";
}

AckResult AckTracker::send_and_wait(const SendFn& send, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  if (!connected_) return AckResult::Disconnected;

  int mid = 0;
  if (!send(mid)) return AckResult::SendFailed;
  pending_[mid] = false;
  const uint64_t generation = disconnects_;

  cv_.wait_for(lk, timeout, [&] {
    return pending_[mid] || disconnects_ != generation || !connected_;
  });
  const bool acked = pending_[mid];
  pending_.erase(mid);

  if (disconnects_ != generation || !connected_) return AckResult::Disconnected;
  return acked ? AckResult::Acked : AckResult::TimedOut;
}

void AckTracker::set_connected(bool up) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    connected_ = up;
  }
  cv_.notify_all();
}

void AckTracker::on_disconnect(int rc) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    connected_ = false;
    ++disconnects_;
    disconnect_rc_ = rc;
  }
  cv_.notify_all();
}

bool AckTracker::on_ack(int mid) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = pending_.find(mid);
    if (it == pending_.end()) return false;
    it->second = true;
  }
  cv_.notify_all();
  return true;
}

std::optional<int> AckTracker::disconnect_reason() const {
  std::lock_guard<std::mutex> lk(mu_);
  return disconnect_rc_;
}

std::size_t AckTracker::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return pending_.size();
}

} // namespace aqlink
