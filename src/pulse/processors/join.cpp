#include "pulse/processors/join.hpp"

#include <algorithm>
#include <utility>

namespace pulse::processors {

using flow::PollStatus;
using flow::PullStatus;
using flow::PushStatus;

pulse_detail::expected<std::unique_ptr<Join>, SetupError>
Join::create(std::string name, std::size_t inputs) {
  if (inputs == 0) {
    return pulse_detail::unexpected<SetupError>(SetupError::NoInputs);
  }
  return std::unique_ptr<Join>(new Join(std::move(name), inputs));
}

Join::Join(std::string name, std::size_t inputs)
  : AsyncProcessor(std::move(name), flow::PortLayout::uniform(inputs, 1)),
    closed_(inputs, false) {}

PollStatus Join::poll(flow::TaskContext& ctx) {
  const std::size_t n = closed_.size();
  for (;;) {
    if (held_) {
      switch (ctx.push(0, std::move(*held_))) {
        case PushStatus::Accepted: held_.reset(); break;
        case PushStatus::Full:     return PollStatus::Pending;
        case PushStatus::Closed:   held_.reset(); return PollStatus::Complete;
      }
      ctx.spend();
      if (ctx.budget_spent()) return PollStatus::Yield;
    }

    // Every input that reports Empty leaves a wake behind, so any of them
    // can resume this task.
    for (std::size_t k = 0; k < n && !held_; ++k) {
      const std::size_t i = (next_ + k) % n;
      if (closed_[i]) continue;
      mem::Packet p;
      switch (ctx.pull(i, p)) {
        case PullStatus::Ready:
          held_ = std::move(p);
          next_ = (i + 1) % n;
          break;
        case PullStatus::Closed:
          closed_[i] = true;
          break;
        case PullStatus::Empty:
          break;
      }
    }
    if (held_) continue;
    const bool all_closed = std::all_of(closed_.begin(), closed_.end(), [](bool c) { return c; });
    return all_closed ? PollStatus::Complete : PollStatus::Pending;
  }
}

void Join::drain_held(std::vector<mem::Packet>& out) {
  if (held_) {
    out.push_back(std::move(*held_));
    held_.reset();
  }
}

} // namespace pulse::processors
