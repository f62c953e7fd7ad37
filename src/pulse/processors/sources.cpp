#include "pulse/processors/sources.hpp"

#include <utility>

namespace pulse::processors {

using flow::PollStatus;
using flow::PullStatus;
using flow::PushStatus;

// ----------------------------------------------------------------------------
// VectorSource
// ----------------------------------------------------------------------------

VectorSource::VectorSource(std::string name, std::vector<mem::Packet> packets, bool linger,
                           std::uint16_t ingress_port)
  : AsyncProcessor(std::move(name), flow::PortLayout::uniform(0, 1)), linger_(linger) {
  for (auto& p : packets) {
    p.meta().ingress_port = ingress_port;
    packets_.push_back(std::move(p));
  }
}

std::unique_ptr<VectorSource> VectorSource::sequence(std::string name, std::uint64_t count,
                                                     const std::string& tag, bool linger,
                                                     std::uint16_t ingress_port) {
  std::vector<mem::Packet> packets;
  packets.reserve(count);
  for (std::uint64_t i = 0; i < count; ++i) packets.push_back(mem::make_packet(i, tag));
  return std::make_unique<VectorSource>(std::move(name), std::move(packets), linger,
                                        ingress_port);
}

PollStatus VectorSource::poll(flow::TaskContext& ctx) {
  while (!packets_.empty()) {
    switch (ctx.push(0, std::move(packets_.front()))) {
      case PushStatus::Accepted:
        packets_.pop_front();
        pushed_.fetch_add(1, std::memory_order_relaxed);
        break;
      case PushStatus::Full:
        blocked_.fetch_add(1, std::memory_order_relaxed);
        return PollStatus::Pending;
      case PushStatus::Closed:
        packets_.pop_front();
        return PollStatus::Complete;   // the rest is surrendered through drain_held()
    }
    ctx.spend();
    if (ctx.budget_spent()) return PollStatus::Yield;
  }
  return linger_ ? PollStatus::Pending : PollStatus::Complete;
}

void VectorSource::drain_held(std::vector<mem::Packet>& out) {
  for (auto& p : packets_) out.push_back(std::move(p));
  packets_.clear();
}

// ----------------------------------------------------------------------------
// ChannelSource
// ----------------------------------------------------------------------------

pulse_detail::expected<std::unique_ptr<ChannelSource>, SetupError>
ChannelSource::create(std::string name, std::shared_ptr<PacketChannel> channel,
                      std::uint16_t ingress_port) {
  if (!channel) {
    return pulse_detail::unexpected<SetupError>(SetupError::NullChannel);
  }
  return std::unique_ptr<ChannelSource>(
      new ChannelSource(std::move(name), std::move(channel), ingress_port));
}

ChannelSource::ChannelSource(std::string name, std::shared_ptr<PacketChannel> channel,
                             std::uint16_t ingress_port)
  : AsyncProcessor(std::move(name), flow::PortLayout::uniform(0, 1)),
    channel_(std::move(channel)),
    ingress_port_(ingress_port) {}

PollStatus ChannelSource::poll(flow::TaskContext& ctx) {
  for (;;) {
    if (!held_) {
      mem::Packet p;
      switch (channel_->try_recv(p, ctx.waker())) {
        case PullStatus::Empty:  return PollStatus::Pending;
        case PullStatus::Closed: return PollStatus::Complete;
        case PullStatus::Ready:
          // Entry into the graph: restamp what the external side built.
          p.meta().ingress_port = ingress_port_;
          p.meta().ingress_time = std::chrono::steady_clock::now();
          held_ = std::move(p);
          break;
      }
    }
    switch (ctx.push(0, std::move(*held_))) {
      case PushStatus::Accepted: held_.reset(); break;
      case PushStatus::Full:     return PollStatus::Pending;
      case PushStatus::Closed:
        held_.reset();
        channel_->close();
        return PollStatus::Complete;
    }
    ctx.spend();
    if (ctx.budget_spent()) return PollStatus::Yield;
  }
}

void ChannelSource::drain_held(std::vector<mem::Packet>& out) {
  channel_->close();   // the external side must not wait on a retired adapter
  if (held_) {
    out.push_back(std::move(*held_));
    held_.reset();
  }
}

// ----------------------------------------------------------------------------
// IntervalSource
// ----------------------------------------------------------------------------

IntervalSource::IntervalSource(std::string name, std::chrono::nanoseconds period,
                               std::uint64_t count, std::string tag,
                               std::uint16_t ingress_port)
  : AsyncProcessor(std::move(name), flow::PortLayout::uniform(0, 1)),
    period_(period),
    count_(count),
    tag_(std::move(tag)),
    ingress_port_(ingress_port) {}

PollStatus IntervalSource::poll(flow::TaskContext& ctx) {
  using clock = std::chrono::steady_clock;
  for (;;) {
    if (!held_) {
      const std::uint64_t seq = emitted_.load(std::memory_order_relaxed);
      if (count_ != 0 && seq >= count_) return PollStatus::Complete;
      const auto now = clock::now();
      if (!next_due_) next_due_ = now;
      if (now < *next_due_) {
        ctx.wake_after(*next_due_ - now);
        return PollStatus::Pending;
      }
      held_ = mem::make_packet(seq, tag_);
      held_->meta().ingress_port = ingress_port_;
    }
    switch (ctx.push(0, std::move(*held_))) {
      case PushStatus::Accepted:
        held_.reset();
        emitted_.fetch_add(1, std::memory_order_relaxed);
        *next_due_ += period_;
        break;
      case PushStatus::Full:
        return PollStatus::Pending;
      case PushStatus::Closed:
        held_.reset();
        return PollStatus::Complete;
    }
    ctx.spend();
    if (ctx.budget_spent()) return PollStatus::Yield;
  }
}

void IntervalSource::drain_held(std::vector<mem::Packet>& out) {
  if (held_) {
    out.push_back(std::move(*held_));
    held_.reset();
  }
}

} // namespace pulse::processors
