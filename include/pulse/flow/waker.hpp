#pragma once
/**
 * @file waker.hpp
 * @brief Wake handles and the park slot links use to suspend and resume tasks.
 *
 * Suspension is a returned Pending plus a Waker left in a TaskPark. Whoever
 * changes the awaited condition (data pushed, space freed, link closed)
 * calls unpark_and_wake() and every parked waker is notified once.
 *
 * A park holds several wakers: a synchronous stage's input link can be
 * pulled on behalf of different tasks, and each must hear about new data.
 */

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace pulse::flow {

/// @brief Something that can be rescheduled (a task, a test double).
class Wakeable {
public:
  virtual ~Wakeable() = default;
  /// Idempotent; safe from any thread.
  virtual void wake() noexcept = 0;
};

using Waker = std::shared_ptr<Wakeable>;

/**
 * @brief Parking slot for wakers waiting on one link condition.
 *
 * States: Empty, Parked (one or more wakers), Dead (the other side is gone
 * and will never notify again; park() then refuses so the caller retries and
 * observes the terminal state itself).
 *
 * Lost-wakeup rule: after park() the caller issues a seq_cst fence and
 * re-checks its condition; the notifier publishes its change, fences, then
 * calls unpark_and_wake(). One of the two always sees the other.
 */
class TaskPark final {
public:
  TaskPark() = default;
  TaskPark(const TaskPark&)            = delete;
  TaskPark& operator=(const TaskPark&) = delete;

  /// @brief Leave @p w here. @return false if the park is dead (nothing stored).
  bool park(const Waker& w);

  /// @brief Wake and remove every parked waker. Cheap when nothing is parked.
  void unpark_and_wake() noexcept;

  /// @brief Wake everything and refuse future parks.
  void die_and_wake() noexcept;

  /// @brief True once die_and_wake() ran.
  bool dead() const noexcept { return dead_.load(std::memory_order_acquire); }

  /// @brief Number of wakers currently parked (observer; racy).
  std::size_t parked() const;

private:
  void take_all(std::vector<Waker>& out) noexcept;

  std::atomic<bool>  armed_{false};
  std::atomic<bool>  dead_{false};
  mutable std::mutex mu_;
  std::vector<Waker> wakers_;
};

} // namespace pulse::flow
