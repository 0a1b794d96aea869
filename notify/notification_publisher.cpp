#include "notify/notification_publisher.hpp"

#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <functional>
#include <stdexcept>

namespace ledger {
namespace notify {

nlohmann::json toJson(const NotificationEvent& event) {
  nlohmann::json j;
  j["event_type"] = toString(event.event_type);
  j["txn_id"] = event.txn_id;
  j["target_id"] = event.target_id;
  j["counterparty_id"] = event.counterparty_id;
  j["amount"] = formatAmount(event.amount);
  if (event.balance_after) {
    j["balance_after"] = formatAmount(*event.balance_after);
  } else {
    j["balance_after"] = nullptr;
  }
  j["timestamp_us"] = toEpochMicros(event.timestamp);
  j["message"] = event.message;
  return j;
}

StreamEventSink::StreamEventSink(std::ostream& out) : out_(out) {
}

void StreamEventSink::deliver(const NotificationEvent& event) {
  std::string line = toJson(event).dump();
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line << '\n';
  out_.flush();
  if (!out_) {
    throw std::runtime_error("Notification stream is not writable");
  }
}

NotificationPublisher::NotificationPublisher(std::shared_ptr<EventSink> sink,
                                             config::PublisherConfig config)
    : sink_(std::move(sink)),
      config_(config),
      running_(false),
      pending_(0),
      delivered_(0),
      failed_(0) {
  size_t count = config_.partitions == 0 ? 1 : config_.partitions;
  for (size_t i = 0; i < count; ++i) {
    partitions_.push_back(std::make_unique<Partition>());
  }
}

NotificationPublisher::~NotificationPublisher() {
  stop();
}

bool NotificationPublisher::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_) return true;

  running_ = true;
  for (size_t i = 0; i < partitions_.size(); ++i) {
    partitions_[i]->worker =
        std::make_unique<std::thread>(&NotificationPublisher::workerThread, this, i);
  }

  LEDGER_LOG_BUILDER(INFO, "Notification publisher started")
      .field("partitions", static_cast<std::int64_t>(partitions_.size()));
  return true;
}

void NotificationPublisher::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_) return;

  running_ = false;
  for (auto& partition : partitions_) {
    if (partition->worker && partition->worker->joinable()) {
      partition->worker->join();
    }
    partition->worker.reset();
  }

  LEDGER_LOG_BUILDER(INFO, "Notification publisher stopped")
      .field("delivered", static_cast<std::int64_t>(delivered_.load()))
      .field("failed", static_cast<std::int64_t>(failed_.load()));
}

void NotificationPublisher::publish(const NotificationEvent& event) {
  pending_.fetch_add(1);
  partitions_[partitionFor(event.target_id)]->queue.enqueue(event);
  observability::getGlobalMetrics().incrementCounter(
      "ledger_notifications_published_total", {{"event_type", toString(event.event_type)}});
}

bool NotificationPublisher::flush(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (pending_.load() > 0) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

size_t NotificationPublisher::partitionFor(const std::string& target_id) const {
  return std::hash<std::string>{}(target_id) % partitions_.size();
}

NotificationPublisher::Stats NotificationPublisher::getStats() const {
  Stats stats;
  stats.delivered = delivered_.load();
  stats.failed = failed_.load();
  stats.pending = pending_.load();
  return stats;
}

void NotificationPublisher::workerThread(size_t index) {
  auto& queue = partitions_[index]->queue;
  // Drain what is left after stop() so nothing published is silently lost.
  while (running_ || !queue.empty()) {
    auto event = queue.dequeue();
    if (!event.has_value()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      continue;
    }

    deliver(*event);
    pending_.fetch_sub(1);
  }
}

void NotificationPublisher::deliver(const NotificationEvent& event) {
  auto& metrics = observability::getGlobalMetrics();
  int max_attempts = config_.max_delivery_attempts < 1 ? 1 : config_.max_delivery_attempts;

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    try {
      sink_->deliver(event);
      delivered_.fetch_add(1);
      metrics.incrementCounter("ledger_notifications_delivered_total",
                               {{"event_type", toString(event.event_type)}});
      return;
    } catch (const std::exception& e) {
      LEDGER_LOG_BUILDER(WARN, "Notification delivery failed")
          .correlation(event.txn_id)
          .field("event_type", toString(event.event_type))
          .field("target", observability::maskAccountId(event.target_id))
          .field("attempt", attempt)
          .field("error", e.what());
    }

    if (attempt < max_attempts) {
      std::this_thread::sleep_for(std::chrono::milliseconds(config_.retry_backoff_ms * attempt));
    }
  }

  failed_.fetch_add(1);
  metrics.incrementCounter("ledger_notifications_failed_total",
                           {{"event_type", toString(event.event_type)}});
  LEDGER_LOG_BUILDER(ERROR, "Notification dropped after retries")
      .correlation(event.txn_id)
      .field("event_type", toString(event.event_type))
      .field("target", observability::maskAccountId(event.target_id));
}

}  // namespace notify
}  // namespace ledger
