#include "pulse/processors/queue_stage.hpp"

#include <utility>

namespace pulse::processors {

using flow::PollStatus;
using flow::PullStatus;
using flow::PushStatus;

QueueStage::QueueStage(std::string name, Transform::Fn fn)
  : AsyncProcessor(std::move(name), flow::PortLayout::uniform(1, 1)), fn_(std::move(fn)) {}

PollStatus QueueStage::poll(flow::TaskContext& ctx) {
  for (;;) {
    if (!held_) {
      mem::Packet p;
      switch (ctx.pull(0, p)) {
        case PullStatus::Empty:  return PollStatus::Pending;
        case PullStatus::Closed: return PollStatus::Complete;
        case PullStatus::Ready:  break;
      }
      if (fn_) {
        std::optional<mem::Packet> r = fn_(std::move(p));
        if (!r) continue;
        held_ = std::move(*r);
      } else {
        held_ = std::move(p);
      }
    }

    switch (ctx.push(0, std::move(*held_))) {
      case PushStatus::Accepted:
        held_.reset();
        ++forwarded_;
        break;
      case PushStatus::Full:
        return PollStatus::Pending;
      case PushStatus::Closed:
        held_.reset();
        return PollStatus::Complete;   // nobody downstream; stop consuming
    }

    ctx.spend();
    if (ctx.budget_spent()) return PollStatus::Yield;
  }
}

void QueueStage::drain_held(std::vector<mem::Packet>& out) {
  if (held_) {
    out.push_back(std::move(*held_));
    held_.reset();
  }
}

} // namespace pulse::processors
