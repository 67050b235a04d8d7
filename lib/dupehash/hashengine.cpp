/**
 * @file hashengine.cpp
 * @brief Implementation of the hashing job coordinator and worker pool
 *
 * One coordinator per job owns the worker threads and is the only thread
 * that calls the consumer's callbacks. Workers communicate with it through a
 * ResultChannel.
 */

#include "hashengine.hpp"
#include "log.hpp"
#include "resultchannel.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <system_error>

namespace {

/**
 * @brief Invokes a consumer callback without letting it break the job
 *
 * A throwing callback is logged; the coordinator carries on so that the
 * remaining events, and onFinished in particular, are still delivered.
 */
template <typename Fn, typename... Args>
void notify(const char *event, const Fn &fn, Args &&...args) {
  if (!fn) {
    return;
  }
  try {
    fn(std::forward<Args>(args)...);
  } catch (const std::exception &e) {
    Log::logger()->error("{} callback threw: {}", event, e.what());
  } catch (...) {
    Log::logger()->error("{} callback threw an unknown exception", event);
  }
}

} // namespace

// ============================================================================
// HashJob
// ============================================================================

void HashJob::cancel() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_terminated || m_cancel.load()) {
    return;
  }

  m_cancel.store(true, std::memory_order_release);
  m_engine->requestCancel();
}

bool HashJob::isFinished() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_done;
}

void HashJob::wait() const {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_doneCv.wait(lock, [this]() { return m_done; });
}

bool HashJob::waitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_doneCv.wait_for(lock, timeout, [this]() { return m_done; });
}

// ============================================================================
// HashEngine
// ============================================================================

HashEngine::HashEngine(const IHashCalculator &calculator, int concurrency)
    : m_calculator(calculator),
      m_concurrency(concurrency > 0 ? concurrency : defaultConcurrency()) {}

HashEngine::~HashEngine() {
  std::shared_ptr<HashJob> job;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    job = m_activeJob;
  }

  if (job) {
    job->cancel();
  }

  if (m_coordinator.valid()) {
    m_coordinator.wait();
  }
}

int HashEngine::defaultConcurrency() {
  int cpu = static_cast<int>(std::thread::hardware_concurrency());
  if (cpu <= 0) {
    cpu = 4;
  }
  return std::max(2, std::min(cpu * 2, 32));
}

std::string HashEngine::statusMessage(SubmitStatus status) {
  switch (status) {
  case SubmitStatus::Started:
    return "Job started";
  case SubmitStatus::Busy:
    return "job already active";
  case SubmitStatus::InvalidConcurrency:
    return "concurrency must be at least 1";
  default:
    return "Unknown status";
  }
}

HashEngine::Submission
HashEngine::submit(const std::vector<std::string> &paths,
                   const JobCallbacks &callbacks) {
  return submit(paths, m_concurrency, callbacks);
}

/**
 * @brief Starts a hashing job if the engine is idle
 *
 * Implementation flow:
 * 1. Reject when a job is Running/Cancelling, or when called from the
 *    coordinator of the previous job (its future cannot wait on itself)
 * 2. Switch to Running and create the job handle
 * 3. Launch the coordinator with std::async
 * 4. Outside the lock, wait for the previous coordinator to return; it has
 *    already released the engine and is at most finishing onFinished()
 *
 * @see runJob()
 */
HashEngine::Submission
HashEngine::submit(const std::vector<std::string> &paths, int concurrency,
                   const JobCallbacks &callbacks) {
  Submission submission;

  if (concurrency < 1) {
    submission.status = SubmitStatus::InvalidConcurrency;
    Log::logger()->warn("Rejected job: {}",
                        statusMessage(submission.status));
    return submission;
  }

  std::future<void> previous;
  {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_state != JobState::Idle ||
        (m_coordinator.valid() &&
         m_coordinatorThread == std::this_thread::get_id())) {
      submission.status = SubmitStatus::Busy;
      Log::logger()->warn("Rejected job: {}",
                          statusMessage(submission.status));
      return submission;
    }

    const int total = static_cast<int>(paths.size());
    const int workers = std::min(concurrency, total);

    auto job = std::make_shared<HashJob>(HashJob::Key(), this, total);
    m_state = JobState::Running;
    m_activeJob = job;
    previous = std::move(m_coordinator);
    m_coordinatorThread = std::thread::id();

    try {
      m_coordinator =
          std::async(std::launch::async, [this, job, paths, workers,
                                          callbacks]() {
            runJob(job, paths, workers, callbacks);
          });
    } catch (const std::system_error &e) {
      Log::logger()->error("Cannot start job coordinator: {}", e.what());
      m_state = JobState::Idle;
      m_activeJob.reset();
      m_coordinator = std::move(previous);
      throw;
    }

    submission.status = SubmitStatus::Started;
    submission.job = job;
  }

  if (previous.valid()) {
    previous.wait();
  }

  return submission;
}

JobState HashEngine::state() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_state;
}

void HashEngine::requestCancel() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_state == JobState::Running) {
    m_state = JobState::Cancelling;
    Log::logger()->info("Cancel requested");
  }
}

/**
 * @brief Coordinator body of one job
 *
 * Implementation flow:
 * 1. Emit onProgress(0, total)
 * 2. Start the worker threads, each registered as a channel producer
 * 3. Drain the channel: for every result, onResult then onProgress(k, total)
 * 4. Join the workers
 * 5. Release the engine (state back to Idle)
 * 6. Emit onFinished, then wake HashJob::wait()
 *
 * If a worker thread cannot be created the job continues with the ones that
 * did start; with none at all it is cancelled and finishes empty.
 */
void HashEngine::runJob(std::shared_ptr<HashJob> job,
                        std::vector<std::string> paths, int workers,
                        JobCallbacks callbacks) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_coordinatorThread = std::this_thread::get_id();
  }

  const int total = job->total();
  Log::logger()->info("Hashing {} file(s) with {} worker(s)", total, workers);

  notify("progress", callbacks.onProgress, 0, total);

  ResultChannel channel;
  std::atomic<std::size_t> next{0};
  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(workers));

  for (int i = 0; i < workers; ++i) {
    channel.addProducer();
    try {
      pool.emplace_back([this, &job, &paths, &next, &channel]() {
        workerLoop(*job, paths, next, channel);
        channel.producerDone();
      });
    } catch (const std::system_error &e) {
      channel.producerDone();
      Log::logger()->error("Cannot start worker thread: {}", e.what());
      if (pool.empty()) {
        job->cancel();
      }
      break;
    }
  }

  HashResult result;
  int completed = 0;
  while (channel.pop(result)) {
    ++completed;
    job->m_completed.store(completed);
    notify("result", callbacks.onResult, result);
    notify("progress", callbacks.onProgress, completed, total);
  }

  for (auto &worker : pool) {
    worker.join();
  }

  {
    std::lock_guard<std::mutex> jobLock(job->m_mutex);
    std::lock_guard<std::mutex> lock(m_mutex);
    job->m_terminated = true;
    m_state = JobState::Idle;
    m_activeJob.reset();
  }

  Log::logger()->info("Finished: {}/{} file(s){}", completed, total,
                      job->isCancelled() ? " (cancelled)" : "");

  notify("finished", callbacks.onFinished);

  {
    std::lock_guard<std::mutex> lock(job->m_mutex);
    job->m_done = true;
  }
  job->m_doneCv.notify_all();
}

/**
 * @brief Pulls tasks from the shared backlog until it is empty or cancelled
 *
 * The cancel flag is checked before taking each task, so once it is set no
 * new file is started by this worker.
 */
void HashEngine::workerLoop(HashJob &job,
                            const std::vector<std::string> &paths,
                            std::atomic<std::size_t> &next,
                            ResultChannel &channel) const {
  while (!job.m_cancel.load(std::memory_order_acquire)) {
    const std::size_t index = next.fetch_add(1);
    if (index >= paths.size()) {
      break;
    }
    channel.push(runTask(paths[index], job.m_cancel));
  }
}

/**
 * @brief Digests one file, converting any exception into a failure result
 */
HashResult HashEngine::runTask(const std::string &path,
                               const std::atomic<bool> &cancel) const {
  const auto start = std::chrono::steady_clock::now();
  auto elapsed = [&start]() {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         start)
        .count();
  };

  try {
    HashResult result = m_calculator.calculate(path, cancel);
    Log::logger()->debug("{} {} ({} bytes)", path,
                         result.isSuccess() ? result.getDigest()
                                            : result.getError(),
                         result.getFileSize());
    return result;
  } catch (const std::exception &e) {
    Log::logger()->warn("Unexpected error hashing {}: {}", path, e.what());
    return HashResult::failure(path, e.what(), 0, elapsed());
  } catch (...) {
    Log::logger()->warn("Unexpected error hashing {}", path);
    return HashResult::failure(path, "unknown error", 0, elapsed());
  }
}
