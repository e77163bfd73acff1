#ifndef CINEMA_REQUEST_PROCESSOR_HPP_
#define CINEMA_REQUEST_PROCESSOR_HPP_

#include "concurrent/lockfree_queue.hpp"
#include "observability/metrics.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace cinema {
namespace concurrent {

/**
 * Fixed pool of worker threads running engine operations.
 *
 * Each worker drains its own MPSC queue; submissions are spread round-robin.
 * Results and exceptions travel back through the returned std::future.
 */
class RequestProcessor {
 public:
  using Task = std::function<void()>;

  explicit RequestProcessor(std::size_t num_worker_threads = 4,
                            observability::MetricsCollector* metrics = nullptr);
  ~RequestProcessor();

  // Non-copyable
  RequestProcessor(const RequestProcessor&) = delete;
  RequestProcessor& operator=(const RequestProcessor&) = delete;

  /**
   * Start the worker threads.
   */
  bool start();

  /**
   * Stop accepting work, let workers drain their queues, and join them.
   */
  void stop();

  bool isRunning() const { return running_; }

  /**
   * Queue `fn` for execution on a worker. Throws std::runtime_error when the
   * processor is not running.
   */
  template <typename F>
  auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using Result = std::invoke_result_t<std::decay_t<F>>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
    std::future<Result> future = task->get_future();
    enqueue([task]() { (*task)(); });
    return future;
  }

  std::size_t getQueueSize() const;

  /**
   * Get processing statistics.
   */
  struct Stats {
    std::size_t requests_processed;
    std::size_t requests_queued;
    double avg_processing_time_ms;
    double throughput_rps;
  };
  Stats getStats() const;

 private:
  struct Worker {
    LockFreeQueue<Task> queue;
    std::thread thread;
  };

  void enqueue(Task task);
  void workerLoop(Worker& worker);

  std::size_t num_workers_;
  observability::MetricsCollector* metrics_;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::atomic<bool> running_;
  // Workers leave only once this is set and their queue is empty. stop()
  // sets it after every enqueue() that passed the running_ check has pushed.
  std::atomic<bool> exit_requested_;
  std::atomic<std::size_t> submitters_;
  std::atomic<std::size_t> next_worker_;

  // Statistics
  std::atomic<std::size_t> requests_processed_;
  std::atomic<std::size_t> total_processing_time_us_;
  std::chrono::steady_clock::time_point started_at_;
};

}  // namespace concurrent
}  // namespace cinema

#endif  // CINEMA_REQUEST_PROCESSOR_HPP_
