#ifndef RESULTCHANNEL_HPP
#define RESULTCHANNEL_HPP

#include <condition_variable>
#include <deque>
#include <mutex>

#include "hashresult.hpp"

/**
 * @brief Many-producer, single-consumer queue of finished results
 *
 * Worker threads push results as they complete; the job coordinator pops
 * them in arrival order. Each producer registers with addProducer() before it
 * starts and calls producerDone() when it exits. Once every registered
 * producer is done and the queue is drained, pop() returns false.
 */
class ResultChannel {
public:
  void addProducer() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_producers;
  }

  void producerDone() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      --m_producers;
    }
    m_ready.notify_one();
  }

  void push(HashResult result) {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_queue.push_back(std::move(result));
    }
    m_ready.notify_one();
  }

  /**
   * @brief Blocks until a result is available or all producers finished
   * @return false when the channel is closed and empty
   */
  bool pop(HashResult &out) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_ready.wait(lock, [this]() { return !m_queue.empty() || m_producers == 0; });

    if (m_queue.empty()) {
      return false;
    }

    out = std::move(m_queue.front());
    m_queue.pop_front();
    return true;
  }

private:
  std::mutex m_mutex;
  std::condition_variable m_ready;
  std::deque<HashResult> m_queue;
  int m_producers = 0;
};

#endif // RESULTCHANNEL_HPP
