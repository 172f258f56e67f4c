/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHANNEL_HPP
#define CHANNEL_HPP

/**
 * @file Channel.hpp
 * @brief Ordered, thread-safe, single-consumer message pipe between contexts
 *
 * A Channel carries values from any number of producers to one consumer.
 * Messages are received in the order they were sent. Once closed, sends are
 * rejected (return false) and blocked receivers wake up; messages already
 * queued can still be drained.
 *
 * There is no request/response pairing: a consumer correlates by content.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace Wayfarer {

template <typename T> class Channel {
public:
  using Clock = std::chrono::steady_clock;

  Channel() = default;
  ~Channel() { close(); }

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  /**
   * @brief Queue a message for the consumer
   * @return false if the channel is closed; the message is dropped
   */
  bool send(T message) {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (m_closed) {
        return false;
      }
      m_queue.push_back(std::move(message));
      m_totalSent.fetch_add(1, std::memory_order_relaxed);
    }
    m_condition.notify_one();
    return true;
  }

  /**
   * @brief Non-blocking receive
   * @return true if a message was moved into @p out
   */
  bool tryReceive(T &out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queue.empty()) {
      return false;
    }
    out = std::move(m_queue.front());
    m_queue.pop_front();
    return true;
  }

  /**
   * @brief Block until a message arrives, the deadline passes, or the channel
   * is closed and empty
   * @return true if a message was moved into @p out
   */
  bool receiveUntil(T &out, Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait_until(lock, deadline,
                           [this] { return m_closed || !m_queue.empty(); });
    if (m_queue.empty()) {
      return false;
    }
    out = std::move(m_queue.front());
    m_queue.pop_front();
    return true;
  }

  /**
   * @brief Move every queued message into @p out (appending), in send order
   * @return number of messages drained
   */
  size_t drain(std::vector<T> &out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = m_queue.size();
    for (auto &message : m_queue) {
      out.push_back(std::move(message));
    }
    m_queue.clear();
    return count;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_closed = true;
    }
    m_condition.notify_all();
  }

  [[nodiscard]] bool isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
  }

  [[nodiscard]] size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
  }

  [[nodiscard]] size_t getTotalSent() const {
    return m_totalSent.load(std::memory_order_relaxed);
  }

private:
  mutable std::mutex m_mutex{};
  std::condition_variable m_condition{};
  std::deque<T> m_queue{};
  bool m_closed{false};
  std::atomic<size_t> m_totalSent{0};
};

} // namespace Wayfarer

#endif // CHANNEL_HPP
