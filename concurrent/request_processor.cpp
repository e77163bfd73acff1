#include "concurrent/request_processor.hpp"

#include "observability/logger.hpp"

namespace cinema {
namespace concurrent {

using observability::LogLevel;

RequestProcessor::RequestProcessor(std::size_t num_worker_threads,
                                   observability::MetricsCollector* metrics)
    : num_workers_(num_worker_threads == 0 ? 1 : num_worker_threads),
      metrics_(metrics),
      running_(false),
      exit_requested_(false),
      submitters_(0),
      next_worker_(0),
      requests_processed_(0),
      total_processing_time_us_(0) {
}

RequestProcessor::~RequestProcessor() {
  stop();
}

bool RequestProcessor::start() {
  if (running_) return true;

  started_at_ = std::chrono::steady_clock::now();
  workers_.clear();
  for (std::size_t i = 0; i < num_workers_; ++i) {
    workers_.push_back(std::make_unique<Worker>());
  }

  exit_requested_ = false;
  running_ = true;
  for (auto& worker : workers_) {
    Worker* w = worker.get();
    w->thread = std::thread([this, w]() { workerLoop(*w); });
  }

  LOG_BUILDER(LogLevel::INFO, "Request processor started")
      .field("workers", static_cast<int>(num_workers_));
  return true;
}

void RequestProcessor::stop() {
  if (!running_.exchange(false)) return;

  // A submitter past its running_ check is still pushing; wait it out.
  while (submitters_.load() > 0) {
    std::this_thread::yield();
  }
  exit_requested_ = true;

  for (auto& worker : workers_) {
    if (worker->thread.joinable()) {
      worker->thread.join();
    }
  }

  LOG_BUILDER(LogLevel::INFO, "Request processor stopped")
      .field("processed", static_cast<std::int64_t>(requests_processed_.load()));
}

void RequestProcessor::enqueue(Task task) {
  submitters_.fetch_add(1);
  if (!running_) {
    submitters_.fetch_sub(1);
    throw std::runtime_error("request processor is not running");
  }
  std::size_t index = next_worker_.fetch_add(1) % workers_.size();
  workers_[index]->queue.enqueue(std::move(task));
  submitters_.fetch_sub(1);
  if (metrics_) {
    metrics_->incrementGauge(observability::metric::kQueuedRequests);
  }
}

std::size_t RequestProcessor::getQueueSize() const {
  std::size_t total = 0;
  for (const auto& worker : workers_) {
    total += worker->queue.size();
  }
  return total;
}

RequestProcessor::Stats RequestProcessor::getStats() const {
  Stats stats;
  stats.requests_processed = requests_processed_.load();
  stats.requests_queued = getQueueSize();

  std::size_t total_time = total_processing_time_us_.load();
  if (stats.requests_processed > 0) {
    stats.avg_processing_time_ms = static_cast<double>(total_time) /
                                   stats.requests_processed / 1000.0;
  } else {
    stats.avg_processing_time_ms = 0.0;
  }

  auto uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_);
  stats.throughput_rps = uptime.count() > 0.0 ? stats.requests_processed / uptime.count() : 0.0;

  return stats;
}

void RequestProcessor::workerLoop(Worker& worker) {
  while (true) {
    auto task = worker.queue.dequeue();
    if (!task.has_value()) {
      // Drain before exiting so every accepted future gets a result.
      if (exit_requested_ && worker.queue.empty()) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::microseconds(200));
      continue;
    }

    if (metrics_) {
      metrics_->decrementGauge(observability::metric::kQueuedRequests);
    }

    auto start_time = std::chrono::steady_clock::now();
    // packaged_task stores any exception in the caller's future.
    (*task)();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time);

    requests_processed_.fetch_add(1);
    total_processing_time_us_.fetch_add(static_cast<std::size_t>(duration.count()));
  }
}

}  // namespace concurrent
}  // namespace cinema
