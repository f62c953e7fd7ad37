#include "pulse/processors/sinks.hpp"

#include <utility>

namespace pulse::processors {

using flow::PollStatus;
using flow::PullStatus;
using flow::PushStatus;

// ----------------------------------------------------------------------------
// CollectorSink
// ----------------------------------------------------------------------------

CollectorSink::CollectorSink(std::string name, std::optional<std::size_t> permits)
  : AsyncProcessor(std::move(name), flow::PortLayout::uniform(1, 0)), permits_(permits) {}

PollStatus CollectorSink::poll(flow::TaskContext& ctx) {
  for (;;) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (permits_ && *permits_ == 0) {
        waker_ = ctx.waker();   // grant() resumes us
        return PollStatus::Pending;
      }
    }
    mem::Packet p;
    switch (ctx.pull(0, p)) {
      case PullStatus::Empty:
        return PollStatus::Pending;
      case PullStatus::Closed:
        closed_.store(true, std::memory_order_release);
        return PollStatus::Complete;
      case PullStatus::Ready:
        break;
    }
    {
      std::lock_guard<std::mutex> lk(mu_);
      packets_.push_back(std::move(p));
      if (permits_) --*permits_;
    }
    ctx.spend();
    if (ctx.budget_spent()) return PollStatus::Yield;
  }
}

void CollectorSink::wake_parked(std::unique_lock<std::mutex>& lk) {
  flow::Waker w = std::move(waker_);
  waker_.reset();
  lk.unlock();
  if (w) w->wake();
}

void CollectorSink::grant(std::size_t n) {
  std::unique_lock<std::mutex> lk(mu_);
  if (permits_) *permits_ += n;
  wake_parked(lk);
}

void CollectorSink::grant_unlimited() {
  std::unique_lock<std::mutex> lk(mu_);
  permits_.reset();
  wake_parked(lk);
}

std::size_t CollectorSink::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return packets_.size();
}

std::vector<std::uint64_t> CollectorSink::seqs() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::uint64_t> out;
  out.reserve(packets_.size());
  for (const auto& p : packets_) out.push_back(p.meta().seq);
  return out;
}

std::vector<std::string> CollectorSink::tags() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  out.reserve(packets_.size());
  for (const auto& p : packets_) out.push_back(p.meta().tag);
  return out;
}

std::vector<mem::Packet> CollectorSink::take() {
  std::lock_guard<std::mutex> lk(mu_);
  return std::exchange(packets_, {});
}

// ----------------------------------------------------------------------------
// BlackHoleSink
// ----------------------------------------------------------------------------

BlackHoleSink::BlackHoleSink(std::string name)
  : AsyncProcessor(std::move(name), flow::PortLayout::uniform(1, 0)) {}

PollStatus BlackHoleSink::poll(flow::TaskContext& ctx) {
  for (;;) {
    mem::Packet p;
    switch (ctx.pull(0, p)) {
      case PullStatus::Empty:  return PollStatus::Pending;
      case PullStatus::Closed: return PollStatus::Complete;
      case PullStatus::Ready:  break;
    }
    consumed_.fetch_add(1, std::memory_order_relaxed);
    ctx.spend();
    if (ctx.budget_spent()) return PollStatus::Yield;
  }
}

// ----------------------------------------------------------------------------
// ChannelSink
// ----------------------------------------------------------------------------

pulse_detail::expected<std::unique_ptr<ChannelSink>, SetupError>
ChannelSink::create(std::string name, std::shared_ptr<PacketChannel> channel) {
  if (!channel) {
    return pulse_detail::unexpected<SetupError>(SetupError::NullChannel);
  }
  return std::unique_ptr<ChannelSink>(new ChannelSink(std::move(name), std::move(channel)));
}

ChannelSink::ChannelSink(std::string name, std::shared_ptr<PacketChannel> channel)
  : AsyncProcessor(std::move(name), flow::PortLayout::uniform(1, 0)),
    channel_(std::move(channel)) {}

PollStatus ChannelSink::poll(flow::TaskContext& ctx) {
  for (;;) {
    if (!held_) {
      mem::Packet p;
      switch (ctx.pull(0, p)) {
        case PullStatus::Empty:
          return PollStatus::Pending;
        case PullStatus::Closed:
          channel_->close();
          return PollStatus::Complete;
        case PullStatus::Ready:
          held_ = std::move(p);
          break;
      }
    }
    switch (channel_->try_send(std::move(*held_), ctx.waker())) {
      case PushStatus::Accepted:
        held_.reset();
        break;
      case PushStatus::Full:
        return PollStatus::Pending;
      case PushStatus::Closed:
        ctx.drop(std::move(*held_), "channel closed");
        held_.reset();
        return PollStatus::Complete;   // reader went away
    }
    ctx.spend();
    if (ctx.budget_spent()) return PollStatus::Yield;
  }
}

void ChannelSink::drain_held(std::vector<mem::Packet>& out) {
  channel_->close();   // the external side must not wait on a retired adapter
  if (held_) {
    out.push_back(std::move(*held_));
    held_.reset();
  }
}

} // namespace pulse::processors
