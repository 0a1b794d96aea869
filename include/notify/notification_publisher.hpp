#ifndef NOTIFICATION_PUBLISHER_HPP_
#define NOTIFICATION_PUBLISHER_HPP_

#include "concurrent/mpsc_queue.hpp"
#include "config/engine_config.hpp"
#include "ledger_types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <ostream>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace ledger {
namespace notify {

nlohmann::json toJson(const NotificationEvent& event);

/**
 * Destination of notification events, e.g. a message bus producer.
 * deliver() throws on failure; the publisher retries.
 */
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void deliver(const NotificationEvent& event) = 0;
};

/**
 * Writes each event as one JSON line.
 */
class StreamEventSink : public EventSink {
 public:
  explicit StreamEventSink(std::ostream& out);

  void deliver(const NotificationEvent& event) override;

 private:
  std::ostream& out_;
  std::mutex mutex_;
};

/**
 * Producer side of the at-least-once contract. publish() never blocks on
 * delivery.
 */
class EventPublisher {
 public:
  virtual ~EventPublisher() = default;
  virtual void publish(const NotificationEvent& event) = 0;
};

/**
 * Asynchronous publisher. Events are partitioned by target id, and each
 * partition is drained by a single worker, so events for one recipient keep
 * their relative order. A delivery that still fails after the configured
 * attempts is logged and counted, then dropped.
 */
class NotificationPublisher : public EventPublisher {
 public:
  NotificationPublisher(std::shared_ptr<EventSink> sink, config::PublisherConfig config);
  ~NotificationPublisher();

  // Non-copyable
  NotificationPublisher(const NotificationPublisher&) = delete;
  NotificationPublisher& operator=(const NotificationPublisher&) = delete;

  /**
   * Start the partition workers.
   */
  bool start();

  /**
   * Deliver what is queued, then stop the workers.
   */
  void stop();

  void publish(const NotificationEvent& event) override;

  /**
   * Waits until every published event has been delivered or given up on.
   * Returns false on timeout.
   */
  bool flush(std::chrono::milliseconds timeout);

  size_t partitionFor(const std::string& target_id) const;

  struct Stats {
    size_t delivered;
    size_t failed;
    size_t pending;
  };
  Stats getStats() const;

 private:
  struct Partition {
    concurrent::MpscQueue<NotificationEvent> queue;
    std::unique_ptr<std::thread> worker;
  };

  void workerThread(size_t index);
  void deliver(const NotificationEvent& event);

  std::shared_ptr<EventSink> sink_;
  config::PublisherConfig config_;
  std::vector<std::unique_ptr<Partition>> partitions_;
  std::atomic<bool> running_;
  std::mutex lifecycle_mutex_;

  std::atomic<size_t> pending_;
  std::atomic<size_t> delivered_;
  std::atomic<size_t> failed_;
};

}  // namespace notify
}  // namespace ledger

#endif  // NOTIFICATION_PUBLISHER_HPP_
