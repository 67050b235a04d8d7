/**
 * @file hashengine.hpp
 * @brief Concurrent, cancellable hashing of a file list
 *
 * This header defines HashEngine, which runs one hashing job at a time on a
 * bounded pool of worker threads, and HashJob, the handle a caller uses to
 * follow and cancel that job.
 */

#ifndef HASHENGINE_HPP
#define HASHENGINE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "hashresult.hpp"
#include "ihashcalculator.hpp"

class HashEngine;
class ResultChannel;

/**
 * @brief Lifecycle of the engine
 *
 * Idle allows a new submission (and changes to the path queue). Running and
 * Cancelling both mean a job owns the engine.
 */
enum class JobState { Idle, Running, Cancelling };

/**
 * @brief Event sinks of a hashing job
 *
 * All three are called from the job's coordinator thread, one at a time and
 * never concurrently with each other. Empty functions are skipped.
 *
 * Event order:
 * - onProgress(0, total)
 * - for every finished file: onResult(result), then onProgress(k, total)
 * - onFinished(), exactly once and always last
 */
struct JobCallbacks {
  using ProgressCallback = std::function<void(int completed, int total)>;
  using ResultCallback = std::function<void(const HashResult &result)>;
  using FinishedCallback = std::function<void()>;

  ProgressCallback onProgress;
  ResultCallback onResult;
  FinishedCallback onFinished;
};

/**
 * @class HashJob
 * @brief Handle to one submitted hashing job
 *
 * The handle stays usable after the job ends; cancel() then does nothing.
 */
class HashJob {
public:
  // Construction token; only HashEngine can create one
  class Key {
    friend class HashEngine;
    Key() {}
  };

  HashJob(Key, HashEngine *engine, int total)
      : m_engine(engine), m_total(total) {}

  HashJob(const HashJob &) = delete;
  HashJob &operator=(const HashJob &) = delete;

  /**
   * @brief Requests cooperative cancellation
   *
   * Sets the job's cancel flag. Files being digested stop at their next chunk
   * boundary and report "cancelled"; files not yet started are skipped and
   * produce no result. Safe to call any number of times, from any thread,
   * also after the job finished.
   */
  void cancel();

  bool isCancelled() const { return m_cancel.load(); }

  // True once onFinished() has returned
  bool isFinished() const;

  // Blocks until onFinished() has returned
  void wait() const;

  // Returns isFinished() after waiting at most timeout
  bool waitFor(std::chrono::milliseconds timeout) const;

  int total() const { return m_total; }
  int completed() const { return m_completed.load(); }

private:
  friend class HashEngine;

  HashEngine *m_engine;
  const int m_total;

  std::atomic<bool> m_cancel{false};
  std::atomic<int> m_completed{0};

  mutable std::mutex m_mutex;
  mutable std::condition_variable m_doneCv;

  // Engine released this job; guarded by m_mutex
  bool m_terminated = false;

  // onFinished returned; guarded by m_mutex
  bool m_done = false;
};

/**
 * @class HashEngine
 * @brief Runs hashing jobs on a bounded worker pool
 *
 * Each job gets a coordinator (started with std::async) that spawns
 * min(concurrency, total) worker threads. Workers take the next path from a
 * shared backlog until it is empty or the job is cancelled, digest it with the
 * injected IHashCalculator and pass the result to the coordinator, which
 * delivers the callbacks.
 *
 * Only one job may be active. submit() on a busy engine is rejected with
 * SubmitStatus::Busy and has no side effects.
 *
 * Example usage:
 * @code
 * Md5Calculator md5;
 * HashEngine engine(md5);
 * JobCallbacks callbacks;
 * callbacks.onResult = [](const HashResult &r) { ... };
 * auto submission = engine.submit(paths, 8, callbacks);
 * if (submission.ok()) submission.job->wait();
 * @endcode
 *
 * @note The calculator must outlive the engine
 * @note Do not destroy the engine from one of its own callbacks
 */
class HashEngine {
public:
  enum class SubmitStatus { Started, Busy, InvalidConcurrency };

  struct Submission {
    SubmitStatus status = SubmitStatus::Busy;
    std::shared_ptr<HashJob> job;

    bool ok() const { return status == SubmitStatus::Started; }
  };

  /**
   * @param calculator Digest routine used by every worker
   * @param concurrency Worker count used by submit() overloads without one;
   *                    values below 1 select defaultConcurrency()
   */
  explicit HashEngine(const IHashCalculator &calculator, int concurrency = 0);

  // Cancels an active job and waits for it to finish
  ~HashEngine();

  HashEngine(const HashEngine &) = delete;
  HashEngine &operator=(const HashEngine &) = delete;

  /**
   * @brief CPU count * 2, clamped to [2, 32]
   *
   * Four CPUs are assumed when the count is unknown.
   */
  static int defaultConcurrency();

  static std::string statusMessage(SubmitStatus status);

  Submission submit(const std::vector<std::string> &paths,
                    const JobCallbacks &callbacks);

  /**
   * @brief Starts hashing paths with the given number of workers
   *
   * @param paths Files to digest, each yields at most one result
   * @param concurrency Maximum number of files digested in parallel (>= 1)
   * @param callbacks Event sinks, see JobCallbacks for ordering
   *
   * @return Submission Started with a job handle, or Busy /
   *         InvalidConcurrency without one. Submitting from inside a
   *         callback of the engine's own job is reported as Busy.
   */
  Submission submit(const std::vector<std::string> &paths, int concurrency,
                    const JobCallbacks &callbacks);

  JobState state() const;
  bool isActive() const { return state() != JobState::Idle; }

  int concurrency() const { return m_concurrency; }

private:
  friend class HashJob;

  // Called by HashJob::cancel() with the job's mutex held
  void requestCancel();

  void runJob(std::shared_ptr<HashJob> job, std::vector<std::string> paths,
              int workers, JobCallbacks callbacks);

  void workerLoop(HashJob &job, const std::vector<std::string> &paths,
                  std::atomic<std::size_t> &next,
                  ResultChannel &channel) const;

  HashResult runTask(const std::string &path,
                     const std::atomic<bool> &cancel) const;

  const IHashCalculator &m_calculator;
  const int m_concurrency;

  mutable std::mutex m_mutex;
  JobState m_state = JobState::Idle;
  std::shared_ptr<HashJob> m_activeJob;
  std::future<void> m_coordinator;
  std::thread::id m_coordinatorThread;
};

#endif // HASHENGINE_HPP
