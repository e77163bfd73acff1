#ifndef CINEMA_LOCKFREE_QUEUE_HPP_
#define CINEMA_LOCKFREE_QUEUE_HPP_

#include <atomic>
#include <cstddef>
#include <optional>
#include <utility>

namespace cinema {
namespace concurrent {

/**
 * Lock-free Multiple Producer Single Consumer (MPSC) queue.
 * Producers link nodes with an atomic exchange on the tail; the single
 * consumer advances the head. T must be default-constructible for the
 * sentinel node.
 */
template<typename T>
class LockFreeQueue {
 private:
  struct Node {
    T data;
    std::atomic<Node*> next;

    explicit Node(T value) : data(std::move(value)), next(nullptr) {}
  };

 public:
  LockFreeQueue() : size_(0) {
    Node* dummy = new Node(T{});
    head_.store(dummy);
    tail_.store(dummy);
  }

  ~LockFreeQueue() {
    clear();
    delete head_.load();
  }

  // Non-copyable
  LockFreeQueue(const LockFreeQueue&) = delete;
  LockFreeQueue& operator=(const LockFreeQueue&) = delete;

  /**
   * Enqueue an item (thread-safe for multiple producers).
   */
  void enqueue(T item) {
    Node* new_node = new Node(std::move(item));
    Node* old_tail = tail_.exchange(new_node, std::memory_order_acq_rel);
    old_tail->next.store(new_node, std::memory_order_release);
    size_.fetch_add(1, std::memory_order_relaxed);
  }

  /**
   * Dequeue an item (single consumer only).
   * Returns empty optional if queue is empty, or if a producer has swapped
   * the tail but not yet linked its node.
   */
  std::optional<T> dequeue() {
    Node* head = head_.load(std::memory_order_relaxed);
    Node* next = head->next.load(std::memory_order_acquire);
    if (next == nullptr) {
      return std::nullopt;
    }

    T result = std::move(next->data);
    head_.store(next, std::memory_order_relaxed);
    delete head;
    size_.fetch_sub(1, std::memory_order_relaxed);
    return result;
  }

  /**
   * Check if queue is empty (consumer side).
   */
  bool empty() const {
    Node* head = head_.load(std::memory_order_relaxed);
    return head->next.load(std::memory_order_acquire) == nullptr;
  }

  /**
   * Approximate size, for monitoring only.
   */
  std::size_t size() const {
    return size_.load(std::memory_order_relaxed);
  }

  /**
   * Drop all linked elements (consumer side).
   */
  void clear() {
    while (dequeue().has_value()) {
    }
  }

 private:
  std::atomic<Node*> head_;
  std::atomic<Node*> tail_;
  std::atomic<std::size_t> size_;
};

}  // namespace concurrent
}  // namespace cinema

#endif  // CINEMA_LOCKFREE_QUEUE_HPP_
