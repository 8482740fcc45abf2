// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * work_queue.hpp
 *
 * Blocking FIFO with join-on-drain semantics for fixed-size worker pools.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_METADATA_WORK_QUEUE_HPP
#define DATADEM_METADATA_WORK_QUEUE_HPP

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace datadem {

/**
 * @brief Multi-producer, multi-consumer work queue.
 *
 * Every item taken with pop() must be acknowledged with taskDone().
 * join() returns once all pushed items have been acknowledged. close()
 * wakes consumers; pop() then returns nullopt once the queue is empty.
 *
 * @code
 *   WorkQueue<Job> queue;
 *   // workers: while (auto job = queue.pop()) { run(*job); queue.taskDone(); }
 *   for (auto& job : jobs) queue.push(job);
 *   queue.join();
 *   queue.close();
 * @endcode
 */
template <typename T>
class WorkQueue {
 public:
  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      items_.push(std::move(item));
      ++unfinished_;
    }
    cv_.notify_one();
  }

  /// Block until an item is available, or the queue is closed and empty.
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop();
    return item;
  }

  void taskDone() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unfinished_ > 0 && --unfinished_ == 0) idle_cv_.notify_all();
  }

  /// Block until every pushed item has been acknowledged.
  void join() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return unfinished_ == 0; });
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  size_t pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unfinished_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::queue<T> items_;
  size_t unfinished_ = 0;
  bool closed_ = false;
};

}  // namespace datadem

#endif  // DATADEM_METADATA_WORK_QUEUE_HPP
