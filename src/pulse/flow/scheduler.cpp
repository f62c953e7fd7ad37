#include "pulse/flow/scheduler.hpp"

#include <stdexcept>
#include <utility>

#include "pulse/os/rt.hpp"
#include "pulse/os/rt_profile.hpp"

namespace pulse::flow {

// ----------------------------------------------------------------------------
// Task
// ----------------------------------------------------------------------------

void Task::wake() noexcept {
  if (!anchor_) return;  // not spawned yet
  std::uint8_t s = state_.load(std::memory_order_acquire);
  for (;;) {
    if (s == Idle) {
      // The anchor lock keeps the scheduler alive until the task is queued.
      std::lock_guard<std::mutex> lk(anchor_->mu);
      if (anchor_->owner == nullptr) return;  // scheduler destroyed
      if (state_.compare_exchange_strong(s, Scheduled, std::memory_order_acq_rel,
                                         std::memory_order_acquire)) {
        anchor_->owner->enqueue(shared_from_this());
        return;
      }
    } else if (s == Running) {
      if (state_.compare_exchange_weak(s, Notified, std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        return;
      }
    } else {
      return;  // Scheduled, Notified or Done: nothing to add
    }
  }
}

bool Task::done() const noexcept {
  return state_.load(std::memory_order_acquire) == Done;
}

// ----------------------------------------------------------------------------
// Scheduler
// ----------------------------------------------------------------------------

Scheduler::Scheduler(config::EngineConfig cfg)
  : cfg_(std::move(cfg)), anchor_(std::make_shared<SchedulerAnchor>()) {
  anchor_->owner = this;
}

Scheduler::~Scheduler() {
  stop();
  std::lock_guard<std::mutex> lk(anchor_->mu);
  anchor_->owner = nullptr;
}

void Scheduler::spawn(std::shared_ptr<Task> task) {
  task->anchor_ = anchor_;
  {
    std::lock_guard<std::mutex> lk(run_mu_);
    tasks_.push_back(task);
  }
  live_.fetch_add(1, std::memory_order_acq_rel);
  task->wake();
}

void Scheduler::enqueue(std::shared_ptr<Task> task) {
  {
    std::lock_guard<std::mutex> lk(run_mu_);
    run_queue_.push_back(std::move(task));
  }
  run_cv_.notify_one();
}

std::shared_ptr<Task> Scheduler::try_dequeue() {
  std::lock_guard<std::mutex> lk(run_mu_);
  if (run_queue_.empty()) return nullptr;
  auto t = std::move(run_queue_.front());
  run_queue_.pop_front();
  return t;
}

void Scheduler::run_task(const std::shared_ptr<Task>& task) {
  task->state_.store(Task::Running, std::memory_order_release);
  const Waker self = task;
  const PollStatus st = task->run(*this, self);
  polls_.fetch_add(1, std::memory_order_relaxed);

  switch (st) {
    case PollStatus::Complete: {
      task->state_.store(Task::Done, std::memory_order_release);
      if (live_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        std::lock_guard<std::mutex> lk(done_mu_);
        done_cv_.notify_all();
      }
      return;
    }
    case PollStatus::Yield:
      yields_.fetch_add(1, std::memory_order_relaxed);
      task->state_.store(Task::Scheduled, std::memory_order_release);
      enqueue(task);
      return;
    case PollStatus::Pending: {
      std::uint8_t expected = Task::Running;
      if (task->state_.compare_exchange_strong(expected, Task::Idle,
                                               std::memory_order_acq_rel)) {
        return;
      }
      // Woken during the poll.
      task->state_.store(Task::Scheduled, std::memory_order_release);
      enqueue(task);
      return;
    }
  }
}

void Scheduler::start() {
  std::lock_guard<std::mutex> lk(run_mu_);
  if (started_) return;
  started_  = true;
  stopping_ = false;
  {
    std::lock_guard<std::mutex> tlk(timer_mu_);
    timer_stopping_ = false;
  }
  const std::size_t n = cfg_.resolved_workers();
  workers_.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    workers_.emplace_back([this, i] { worker_loop(i); });
  }
  timer_thread_ = std::thread([this] { timer_loop(); });
}

void Scheduler::worker_loop(std::size_t index) {
  if (cfg_.pin_workers) {
    os::RtConfig rc;
    rc.cpu      = cfg_.first_cpu + static_cast<int>(index);
    rc.policy   = os::RtSchedPolicy::RoundRobin;
    rc.priority = cfg_.rt_priority;
    if (!os::bind_and_prioritize(rc)) {
      pin_failures_.fetch_add(1, std::memory_order_relaxed);
    }
  }
  for (;;) {
    std::shared_ptr<Task> task;
    {
      std::unique_lock<std::mutex> lk(run_mu_);
      run_cv_.wait(lk, [this] { return stopping_ || !run_queue_.empty(); });
      if (stopping_) return;
      task = std::move(run_queue_.front());
      run_queue_.pop_front();
    }
    run_task(task);
  }
}

std::size_t Scheduler::fire_due_timers(std::chrono::steady_clock::time_point now) {
  std::vector<Waker> due;
  {
    std::lock_guard<std::mutex> lk(timer_mu_);
    while (!timers_.empty() && timers_.top().deadline <= now) {
      due.push_back(timers_.top().waker);
      timers_.pop();
    }
  }
  for (const auto& w : due) w->wake();
  timer_wakes_.fetch_add(due.size(), std::memory_order_relaxed);
  return due.size();
}

void Scheduler::timer_loop() {
  if (cfg_.pin_workers && cfg_.rt_priority) {
    // Unpinned, but above the workers so deadlines are not starved.
    os::RtConfig rc;
    rc.policy   = os::RtSchedPolicy::RoundRobin;
    rc.priority = os::prio::kTimer;
    if (!os::bind_and_prioritize(rc)) {
      pin_failures_.fetch_add(1, std::memory_order_relaxed);
    }
  }
  for (;;) {
    fire_due_timers(std::chrono::steady_clock::now());
    std::unique_lock<std::mutex> lk(timer_mu_);
    if (timer_stopping_) return;
    if (timers_.empty()) {
      timer_cv_.wait(lk);
    } else {
      timer_cv_.wait_until(lk, timers_.top().deadline);
    }
    if (timer_stopping_) return;
  }
}

void Scheduler::wake_at(std::chrono::steady_clock::time_point deadline, Waker w) {
  {
    std::lock_guard<std::mutex> lk(timer_mu_);
    timers_.push(Timer{deadline, timer_seq_++, std::move(w)});
  }
  timer_cv_.notify_one();
}

void Scheduler::join() {
  start();
  {
    std::unique_lock<std::mutex> lk(done_mu_);
    done_cv_.wait(lk, [this] { return live_.load(std::memory_order_acquire) == 0; });
  }
  stop();
}

bool Scheduler::join_for(std::chrono::nanoseconds timeout) {
  start();
  bool finished = false;
  {
    std::unique_lock<std::mutex> lk(done_mu_);
    finished = done_cv_.wait_for(lk, timeout, [this] {
      return live_.load(std::memory_order_acquire) == 0;
    });
  }
  if (finished) stop();
  return finished;
}

void Scheduler::stop() {
  {
    std::lock_guard<std::mutex> lk(run_mu_);
    if (!started_) return;
    stopping_ = true;
  }
  run_cv_.notify_all();
  {
    std::lock_guard<std::mutex> lk(timer_mu_);
    timer_stopping_ = true;
  }
  timer_cv_.notify_all();

  for (auto& w : workers_) {
    if (w.joinable()) w.join();
  }
  if (timer_thread_.joinable()) timer_thread_.join();

  std::lock_guard<std::mutex> lk(run_mu_);
  workers_.clear();
  started_  = false;
  stopping_ = false;
}

std::size_t Scheduler::run_until_stalled(std::size_t max_polls) {
  {
    std::lock_guard<std::mutex> lk(run_mu_);
    if (started_) {
      throw std::logic_error("Scheduler::run_until_stalled: worker pool is running");
    }
  }
  std::size_t polls = 0;
  while (polls < max_polls) {
    fire_due_timers(std::chrono::steady_clock::now());
    auto task = try_dequeue();
    if (!task) break;
    run_task(task);
    ++polls;
  }
  return polls;
}

SchedulerStats Scheduler::stats() const noexcept {
  SchedulerStats s;
  s.polls        = polls_.load(std::memory_order_relaxed);
  s.yields       = yields_.load(std::memory_order_relaxed);
  s.timer_wakes  = timer_wakes_.load(std::memory_order_relaxed);
  s.pin_failures = pin_failures_.load(std::memory_order_relaxed);
  s.live_tasks   = live_.load(std::memory_order_relaxed);
  s.workers      = cfg_.resolved_workers();
  return s;
}

} // namespace pulse::flow
