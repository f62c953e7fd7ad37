#include "pulse/processors/channel.hpp"

#include <utility>

namespace pulse::processors {

pulse_detail::expected<std::shared_ptr<PacketChannel>, SetupError>
PacketChannel::create(std::size_t capacity) {
  if (capacity == 0) {
    return pulse_detail::unexpected<SetupError>(SetupError::ZeroCapacity);
  }
  return std::make_shared<PacketChannel>(capacity);
}

PacketChannel::PacketChannel(std::size_t capacity) : capacity_(capacity) {}

// Both notify helpers release the lock before waking a task.
void PacketChannel::notify_data(std::unique_lock<std::mutex>& lk) {
  flow::Waker w = std::move(data_waker_);
  data_waker_.reset();
  lk.unlock();
  data_cv_.notify_one();
  if (w) w->wake();
}

void PacketChannel::notify_space(std::unique_lock<std::mutex>& lk) {
  flow::Waker w = std::move(space_waker_);
  space_waker_.reset();
  lk.unlock();
  space_cv_.notify_one();
  if (w) w->wake();
}

flow::PushStatus PacketChannel::try_send(mem::Packet&& p, const flow::Waker& w) {
  std::unique_lock<std::mutex> lk(mu_);
  if (closed_) return flow::PushStatus::Closed;
  if (queue_.size() >= capacity_) {
    if (w) space_waker_ = w;
    return flow::PushStatus::Full;
  }
  queue_.push_back(std::move(p));
  notify_data(lk);
  return flow::PushStatus::Accepted;
}

flow::PullStatus PacketChannel::try_recv(mem::Packet& out, const flow::Waker& w) {
  std::unique_lock<std::mutex> lk(mu_);
  if (!queue_.empty()) {
    out = std::move(queue_.front());
    queue_.pop_front();
    notify_space(lk);
    return flow::PullStatus::Ready;
  }
  if (closed_) return flow::PullStatus::Closed;
  if (w) data_waker_ = w;
  return flow::PullStatus::Empty;
}

bool PacketChannel::send(mem::Packet&& p) {
  std::unique_lock<std::mutex> lk(mu_);
  space_cv_.wait(lk, [this] { return closed_ || queue_.size() < capacity_; });
  if (closed_) return false;
  queue_.push_back(std::move(p));
  notify_data(lk);
  return true;
}

std::optional<mem::Packet> PacketChannel::recv() {
  std::unique_lock<std::mutex> lk(mu_);
  data_cv_.wait(lk, [this] { return closed_ || !queue_.empty(); });
  if (queue_.empty()) return std::nullopt;
  mem::Packet p = std::move(queue_.front());
  queue_.pop_front();
  notify_space(lk);
  return p;
}

std::optional<mem::Packet> PacketChannel::recv_for(std::chrono::nanoseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  if (!data_cv_.wait_for(lk, timeout, [this] { return closed_ || !queue_.empty(); })) {
    return std::nullopt;
  }
  if (queue_.empty()) return std::nullopt;
  mem::Packet p = std::move(queue_.front());
  queue_.pop_front();
  notify_space(lk);
  return p;
}

void PacketChannel::close() noexcept {
  flow::Waker dw;
  flow::Waker sw;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return;
    closed_ = true;
    dw = std::move(data_waker_);
    sw = std::move(space_waker_);
  }
  data_cv_.notify_all();
  space_cv_.notify_all();
  if (dw) dw->wake();
  if (sw) sw->wake();
}

bool PacketChannel::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

std::size_t PacketChannel::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

} // namespace pulse::processors
