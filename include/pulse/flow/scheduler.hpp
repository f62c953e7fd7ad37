#pragma once
/**
 * @file scheduler.hpp
 * @brief Fixed worker pool that drives asynchronous processor tasks.
 *
 * Tasks are polled from a shared run queue. A task is in exactly one of
 * Idle, Scheduled, Running, Notified (woken while running) or Done, so
 * duplicate wakes collapse into one poll and a wake that lands while the
 * task runs is never lost: the task is requeued when the poll returns.
 *
 * Two ways to drive tasks:
 *  - start()/join(): worker threads plus a timer thread;
 *  - run_until_stalled(): the calling thread polls until nothing is runnable
 *    (deterministic; for tests and single-threaded embedding).
 *
 * A Scheduler may be destroyed before the tasks it spawned: from then on
 * their wake() is a no-op.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "pulse/config/config_loader.hpp"
#include "pulse/flow/status.hpp"
#include "pulse/flow/waker.hpp"

namespace pulse::flow {

class Scheduler;

/// @brief Tasks' shared back-reference to their scheduler; cleared by ~Scheduler().
struct SchedulerAnchor {
  std::mutex mu;
  Scheduler* owner{nullptr};   ///< Guarded by mu
};

/**
 * @brief Unit of schedulable work. Always owned through std::shared_ptr.
 */
class Task : public Wakeable, public std::enable_shared_from_this<Task> {
public:
  ~Task() override = default;

  /// @brief Make the task runnable (no-op if already queued, or done).
  void wake() noexcept final;

  /// @brief True once a poll returned Complete.
  bool done() const noexcept;

protected:
  /// @brief One poll. @p self is this task's own waker.
  virtual PollStatus run(Scheduler& sched, const Waker& self) = 0;

private:
  friend class Scheduler;

  enum State : std::uint8_t { Idle = 0, Scheduled, Running, Notified, Done };

  std::shared_ptr<SchedulerAnchor> anchor_;   ///< Set once by Scheduler::spawn()
  std::atomic<std::uint8_t>        state_{Idle};
};

/// @brief Cumulative scheduler counters.
struct SchedulerStats {
  std::uint64_t polls{0};
  std::uint64_t yields{0};
  std::uint64_t timer_wakes{0};
  std::uint64_t pin_failures{0};
  std::size_t   live_tasks{0};
  std::size_t   workers{0};
};

class Scheduler final {
public:
  explicit Scheduler(config::EngineConfig cfg = config::Loader::defaults());
  ~Scheduler();

  Scheduler(const Scheduler&)            = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  /// @brief Adopt @p task and make it runnable.
  void spawn(std::shared_ptr<Task> task);

  /// @brief Launch the worker pool and the timer thread. Idempotent.
  void start();

  /// @brief Block until every spawned task is done, then stop the pool.
  void join();

  /// @brief Like join() but gives up after @p timeout. @return true if all tasks finished.
  bool join_for(std::chrono::nanoseconds timeout);

  /// @brief Stop worker and timer threads; unfinished tasks stay unfinished.
  void stop();

  /**
   * @brief Poll runnable tasks on the calling thread until none is left.
   * @details Due timers are fired between polls (never waited for).
   *          Must not be used while the pool is running (throws std::logic_error).
   * @return Number of polls performed.
   */
  std::size_t run_until_stalled(std::size_t max_polls = std::numeric_limits<std::size_t>::max());

  /// @brief Wake @p w at @p deadline (timer suspension).
  void wake_at(std::chrono::steady_clock::time_point deadline, Waker w);

  /// @brief Tasks spawned and not yet done.
  std::size_t live_tasks() const noexcept { return live_.load(std::memory_order_acquire); }

  SchedulerStats stats() const noexcept;
  const config::EngineConfig& config() const noexcept { return cfg_; }

private:
  friend class Task;

  struct Timer {
    std::chrono::steady_clock::time_point deadline;
    std::uint64_t                         seq;
    Waker                                 waker;
    bool operator>(const Timer& o) const noexcept {
      return deadline != o.deadline ? deadline > o.deadline : seq > o.seq;
    }
  };

  void enqueue(std::shared_ptr<Task> task);
  std::shared_ptr<Task> try_dequeue();
  void run_task(const std::shared_ptr<Task>& task);
  void worker_loop(std::size_t index);
  void timer_loop();
  std::size_t fire_due_timers(std::chrono::steady_clock::time_point now);

  config::EngineConfig             cfg_;
  std::shared_ptr<SchedulerAnchor> anchor_;

  std::mutex                          run_mu_;
  std::condition_variable             run_cv_;
  std::deque<std::shared_ptr<Task>>   run_queue_;
  std::vector<std::shared_ptr<Task>>  tasks_;   ///< Ownership of spawned tasks
  bool                                stopping_{false};
  bool                                started_{false};
  std::vector<std::thread>            workers_;

  std::mutex              timer_mu_;
  std::condition_variable timer_cv_;
  std::priority_queue<Timer, std::vector<Timer>, std::greater<Timer>> timers_;
  std::uint64_t           timer_seq_{0};
  bool                    timer_stopping_{false};
  std::thread             timer_thread_;

  std::mutex              done_mu_;
  std::condition_variable done_cv_;
  std::atomic<std::size_t> live_{0};

  std::atomic<std::uint64_t> polls_{0};
  std::atomic<std::uint64_t> yields_{0};
  std::atomic<std::uint64_t> timer_wakes_{0};
  std::atomic<std::uint64_t> pin_failures_{0};
};

} // namespace pulse::flow
