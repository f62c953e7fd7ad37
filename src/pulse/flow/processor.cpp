#include "pulse/flow/processor.hpp"

#include <string>
#include <utility>

#include "pulse/flow/graph.hpp"
#include "pulse/flow/scheduler.hpp"

namespace pulse::flow {

PortLayout PortLayout::uniform(std::size_t n_in, std::size_t n_out, const std::string& type) {
  PortLayout layout;
  layout.inputs.reserve(n_in);
  layout.outputs.reserve(n_out);
  for (std::size_t i = 0; i < n_in; ++i) {
    layout.inputs.push_back(PortSpec{"in" + std::to_string(i), type});
  }
  for (std::size_t i = 0; i < n_out; ++i) {
    layout.outputs.push_back(PortSpec{"out" + std::to_string(i), type});
  }
  return layout;
}

ProcessorBase::ProcessorBase(std::string name, PortLayout ports)
  : name_(std::move(name)), ports_(std::move(ports)) {}

void Emitter::emit(std::size_t port, mem::Packet&& p) {
  if (port >= outputs_) {
    throw ProcessorError("emit to output " + std::to_string(port) + " of " +
                         std::to_string(outputs_));
  }
  pending_.emplace_back(port, std::move(p));
  ++emitted_;
}

// ----------------------------------------------------------------------------
// TaskContext: thin forwarding into the graph's pull/push machinery
// ----------------------------------------------------------------------------

PullStatus TaskContext::pull(std::size_t input, mem::Packet& out) {
  const LinkId lid = graph_.input_link(id_, input);
  if (lid == kNoLink) {
    throw ProcessorError("pull from input " + std::to_string(input) + " out of range");
  }
  return graph_.pull_link(lid, out, waker_);
}

PushStatus TaskContext::push(std::size_t output, mem::Packet&& p) {
  const LinkId lid = graph_.output_link(id_, output);
  if (lid == kNoLink) {
    throw ProcessorError("push to output " + std::to_string(output) + " out of range");
  }
  return graph_.push_link(id_, lid, std::move(p), waker_);
}

void TaskContext::close_output(std::size_t output) noexcept {
  const LinkId lid = graph_.output_link(id_, output);
  if (lid != kNoLink) {
    graph_.links_[lid]->close_producer();
  }
}

void TaskContext::close_input(std::size_t input) noexcept {
  const LinkId lid = graph_.input_link(id_, input);
  if (lid != kNoLink) {
    graph_.close_input(*graph_.nodes_[id_], lid);
  }
}

void TaskContext::drop(mem::Packet&& p, std::string_view reason) {
  mem::Packet gone = std::move(p);
  graph_.account_drop(*graph_.nodes_[id_], 1, reason);
}

void TaskContext::wake_after(std::chrono::nanoseconds delay) {
  sched_->wake_at(std::chrono::steady_clock::now() + delay, waker_);
}

std::size_t TaskContext::inputs() const noexcept {
  return graph_.base(id_)->ports().inputs.size();
}

std::size_t TaskContext::outputs() const noexcept {
  return graph_.base(id_)->ports().outputs.size();
}

} // namespace pulse::flow
