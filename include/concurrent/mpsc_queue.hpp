#ifndef MPSC_QUEUE_HPP_
#define MPSC_QUEUE_HPP_

#include <atomic>
#include <cstddef>
#include <optional>
#include <utility>

namespace ledger {
namespace concurrent {

/**
 * Lock-free Multiple Producer Single Consumer (MPSC) queue.
 * Producers never block; items come out in the order their enqueue calls
 * linked them in. Only one thread may call dequeue().
 */
template<typename T>
class MpscQueue {
 private:
  struct Node {
    std::optional<T> data;
    std::atomic<Node*> next;

    Node() : next(nullptr) {}
    explicit Node(T value) : data(std::move(value)), next(nullptr) {}
  };

 public:
  MpscQueue() : head_(new Node()), tail_(head_.load()), size_(0) {}

  ~MpscQueue() {
    while (dequeue()) {
    }
    delete head_.load();
  }

  // Non-copyable
  MpscQueue(const MpscQueue&) = delete;
  MpscQueue& operator=(const MpscQueue&) = delete;

  /**
   * Enqueue an item (thread-safe for multiple producers).
   */
  void enqueue(T item) {
    Node* node = new Node(std::move(item));
    Node* previous = tail_.exchange(node, std::memory_order_acq_rel);
    previous->next.store(node, std::memory_order_release);
    size_.fetch_add(1, std::memory_order_relaxed);
  }

  /**
   * Dequeue an item (single consumer only).
   * Returns empty optional if queue is empty, or if a producer has swapped
   * the tail but not linked its node yet.
   */
  std::optional<T> dequeue() {
    Node* head = head_.load(std::memory_order_relaxed);
    Node* next = head->next.load(std::memory_order_acquire);
    if (next == nullptr) {
      return std::nullopt;
    }

    std::optional<T> result = std::move(next->data);
    next->data.reset();
    head_.store(next, std::memory_order_relaxed);
    delete head;
    size_.fetch_sub(1, std::memory_order_relaxed);
    return result;
  }

  bool empty() const {
    return head_.load(std::memory_order_acquire)->next.load(std::memory_order_acquire) == nullptr;
  }

  /**
   * Approximate size, for monitoring only.
   */
  size_t size() const { return size_.load(std::memory_order_relaxed); }

 private:
  std::atomic<Node*> head_;
  std::atomic<Node*> tail_;
  std::atomic<size_t> size_;
};

}  // namespace concurrent
}  // namespace ledger

#endif  // MPSC_QUEUE_HPP_
