#include "pulse/flow/link.hpp"

#include <string>
#include <utility>

namespace pulse::flow {

class Link::EndGuard {
public:
  EndGuard(std::atomic<bool>& flag, LinkId id, const char* end, obs::Observer* observer) noexcept
    : flag_(flag) {
    if (flag_.exchange(true, std::memory_order_acquire)) {
      invariant_violation("link " + std::to_string(id) + ": concurrent " + end + "s", observer);
    }
  }
  ~EndGuard() { flag_.store(false, std::memory_order_release); }
  EndGuard(const EndGuard&)            = delete;
  EndGuard& operator=(const EndGuard&) = delete;

private:
  std::atomic<bool>& flag_;
};

pulse_detail::expected<std::unique_ptr<Link>, mem::SpscError>
Link::create(LinkId id, std::size_t capacity, std::string type) {
  auto ring = mem::SpscQueue<mem::Packet>::with_capacity(capacity);
  if (!ring) {
    return pulse_detail::unexpected<mem::SpscError>(ring.error());
  }
  return std::unique_ptr<Link>(new Link(id, std::move(*ring), std::move(type)));
}

Link::Link(LinkId id, mem::SpscQueue<mem::Packet> ring, std::string type) noexcept
  : id_(id), type_(std::move(type)), ring_(std::move(ring)) {}

void Link::attach_producer(LinkEnd end) noexcept {
  if (producer_.node != kNoProcessor) {
    invariant_violation("link " + std::to_string(id_) + ": two producers", observer_);
  }
  producer_ = end;
}

void Link::attach_consumer(LinkEnd end) noexcept {
  if (consumer_.node != kNoProcessor) {
    invariant_violation("link " + std::to_string(id_) + ": two consumers", observer_);
  }
  consumer_ = end;
}

PushStatus Link::try_push(mem::Packet&& p) noexcept {
  EndGuard guard(in_push_, id_, "producer", observer_);
  if (consumer_closed_.load(std::memory_order_acquire) ||
      producer_closed_.load(std::memory_order_relaxed)) {
    return PushStatus::Closed;
  }
  if (!ring_.push(std::move(p))) {
    full_events_.fetch_add(1, std::memory_order_relaxed);
    return PushStatus::Full;
  }
  pushed_.fetch_add(1, std::memory_order_relaxed);
  std::atomic_thread_fence(std::memory_order_seq_cst);
  data_park_.unpark_and_wake();
  return PushStatus::Accepted;
}

bool Link::park_producer(const Waker& w) {
  if (!space_park_.park(w)) return false;  // consumer gone
  std::atomic_thread_fence(std::memory_order_seq_cst);
  // Re-check after publishing the waker (see TaskPark).
  return ring_.full() && !consumer_closed_.load(std::memory_order_acquire);
}

void Link::close_producer() noexcept {
  producer_closed_.store(true, std::memory_order_release);
  std::atomic_thread_fence(std::memory_order_seq_cst);
  data_park_.die_and_wake();
}

void Link::count_dropped(std::uint64_t n) noexcept {
  dropped_.fetch_add(n, std::memory_order_relaxed);
}

PullStatus Link::try_pull(mem::Packet& out) noexcept {
  EndGuard guard(in_pull_, id_, "consumer", observer_);
  if (consumer_closed_.load(std::memory_order_relaxed)) {
    return PullStatus::Closed;
  }
  if (ring_.pop(out)) {
    pulled_.fetch_add(1, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_seq_cst);
    space_park_.unpark_and_wake();
    return PullStatus::Ready;
  }
  if (!producer_closed_.load(std::memory_order_acquire)) {
    return PullStatus::Empty;
  }
  // Producer closed: anything pushed before the close is visible now.
  if (ring_.pop(out)) {
    pulled_.fetch_add(1, std::memory_order_relaxed);
    return PullStatus::Ready;
  }
  return PullStatus::Closed;
}

bool Link::park_consumer(const Waker& w) {
  if (!data_park_.park(w)) return false;  // producer gone
  std::atomic_thread_fence(std::memory_order_seq_cst);
  return ring_.empty() && !producer_closed_.load(std::memory_order_acquire);
}

std::size_t Link::close_consumer() noexcept {
  EndGuard guard(in_pull_, id_, "consumer", observer_);
  consumer_closed_.store(true, std::memory_order_release);
  std::size_t drained = 0;
  mem::Packet p;
  while (ring_.pop(p)) {
    ++drained;
  }
  dropped_.fetch_add(drained, std::memory_order_relaxed);
  std::atomic_thread_fence(std::memory_order_seq_cst);
  space_park_.die_and_wake();
  return drained;
}

LinkStats Link::stats() const noexcept {
  LinkStats s;
  s.id              = id_;
  s.producer        = producer_;
  s.consumer        = consumer_;
  s.capacity        = ring_.capacity();
  s.depth           = ring_.approx_size();
  s.pushed          = pushed_.load(std::memory_order_relaxed);
  s.pulled          = pulled_.load(std::memory_order_relaxed);
  s.dropped         = dropped_.load(std::memory_order_relaxed);
  s.full_events     = full_events_.load(std::memory_order_relaxed);
  s.producer_closed = producer_closed();
  s.consumer_closed = consumer_closed();
  return s;
}

} // namespace pulse::flow
