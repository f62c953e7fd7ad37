#include "pulse/flow/waker.hpp"

#include <algorithm>

namespace pulse::flow {

bool TaskPark::park(const Waker& w) {
  std::lock_guard<std::mutex> lk(mu_);
  if (dead_.load(std::memory_order_relaxed)) return false;
  if (std::find(wakers_.begin(), wakers_.end(), w) == wakers_.end()) {
    wakers_.push_back(w);
  }
  armed_.store(true, std::memory_order_relaxed);
  return true;
}

void TaskPark::take_all(std::vector<Waker>& out) noexcept {
  std::lock_guard<std::mutex> lk(mu_);
  out.swap(wakers_);
  armed_.store(false, std::memory_order_relaxed);
}

void TaskPark::unpark_and_wake() noexcept {
  if (!armed_.load(std::memory_order_relaxed)) return;
  std::vector<Waker> woken;
  take_all(woken);
  for (const auto& w : woken) w->wake();
}

void TaskPark::die_and_wake() noexcept {
  std::vector<Waker> woken;
  {
    std::lock_guard<std::mutex> lk(mu_);
    dead_.store(true, std::memory_order_release);
    woken.swap(wakers_);
    armed_.store(false, std::memory_order_relaxed);
  }
  for (const auto& w : woken) w->wake();
}

std::size_t TaskPark::parked() const {
  std::lock_guard<std::mutex> lk(mu_);
  return wakers_.size();
}

} // namespace pulse::flow
