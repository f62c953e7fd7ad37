#pragma once
/**
 * @file processor.hpp
 * @brief Processor contract: synchronous (inline transform) and asynchronous (task).
 *
 * Synchronous processors have exactly one input and run inline on the thread
 * of whichever task pulls one of their outputs. They must not block.
 *
 * Asynchronous processors are driven by the scheduler. A poll pulls, works,
 * pushes, and returns Pending as soon as a pull reports Empty or a push
 * reports Full (the TaskContext has already registered the wake). A packet
 * refused with Full stays with the processor until a later poll retries it.
 *
 * Processors signal a fault by throwing; the engine isolates the processor,
 * drops what it holds with accounting and closes its links.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pulse/flow/port.hpp"
#include "pulse/flow/status.hpp"
#include "pulse/flow/waker.hpp"
#include "pulse/mem/packet.hpp"

namespace pulse::flow {

class Graph;
class Scheduler;

/// @brief Name and port declarations shared by both processor kinds.
class ProcessorBase {
public:
  ProcessorBase(std::string name, PortLayout ports);
  virtual ~ProcessorBase() = default;

  ProcessorBase(const ProcessorBase&)            = delete;
  ProcessorBase& operator=(const ProcessorBase&) = delete;

  const std::string& name() const noexcept { return name_; }
  const PortLayout&  ports() const noexcept { return ports_; }

private:
  std::string name_;
  PortLayout  ports_;
};

/// @brief Output buffer handed to SyncProcessor::process().
class Emitter final {
public:
  using Pending = std::deque<std::pair<std::size_t, mem::Packet>>;

  Emitter(Pending& pending, std::size_t outputs) noexcept
    : pending_(pending), outputs_(outputs) {}

  /// @brief Queue @p p for output @p port. Throws ProcessorError if out of range.
  void emit(std::size_t port, mem::Packet&& p);

  /// @brief Number of output ports.
  std::size_t outputs() const noexcept { return outputs_; }

  /// @brief Packets emitted during this call.
  std::size_t emitted() const noexcept { return emitted_; }

private:
  Pending&    pending_;
  std::size_t outputs_;
  std::size_t emitted_{0};
};

/**
 * @brief Transform-and-return stage with one input and one or more outputs.
 */
class SyncProcessor : public ProcessorBase {
public:
  using ProcessorBase::ProcessorBase;

  /// @brief Consume one packet, emit zero or more. Must not block.
  virtual void process(mem::Packet&& packet, Emitter& out) = 0;
};

/**
 * @brief Engine services available to an asynchronous processor during poll().
 */
class TaskContext final {
public:
  TaskContext(const TaskContext&)            = delete;
  TaskContext& operator=(const TaskContext&) = delete;

  /**
   * @brief Pull from input @p input, cascading through synchronous producers.
   * @return Ready (packet in @p out), Empty (wake registered: return Pending),
   *         or Closed (that input will never produce again).
   */
  PullStatus pull(std::size_t input, mem::Packet& out);

  /**
   * @brief Push to output @p output.
   * @return Accepted; Full (packet untouched, wake registered: keep it and return
   *         Pending); Closed (consumer gone, packet dropped with accounting).
   */
  PushStatus push(std::size_t output, mem::Packet&& p);

  /// @brief Close one output early (the consumer sees Closed after draining).
  void close_output(std::size_t output) noexcept;

  /// @brief Stop consuming one input; queued packets are dropped with accounting.
  void close_input(std::size_t input) noexcept;

  /// @brief Drop a packet with accounting (e.g. an adapter that cannot deliver it).
  void drop(mem::Packet&& p, std::string_view reason);

  /// @brief Wake handle of the running task (give it to external event sources).
  const Waker& waker() const noexcept { return waker_; }

  /// @brief Schedule a wake after @p delay (a timer suspension).
  void wake_after(std::chrono::nanoseconds delay);

  /// @brief Count work done in this poll; built-ins yield once the budget is spent.
  void spend(std::uint32_t n = 1) noexcept { spent_ += n; }
  [[nodiscard]] bool budget_spent() const noexcept { return spent_ >= budget_; }

  std::size_t inputs() const noexcept;
  std::size_t outputs() const noexcept;
  ProcessorId id() const noexcept { return id_; }

private:
  friend class Graph;
  TaskContext(Graph& graph, ProcessorId id, Waker waker, Scheduler* sched,
              std::uint32_t budget) noexcept
    : graph_(graph), id_(id), waker_(std::move(waker)), sched_(sched), budget_(budget) {}

  Graph&        graph_;
  ProcessorId   id_;
  Waker         waker_;
  Scheduler*    sched_;
  std::uint32_t budget_;
  std::uint32_t spent_{0};
};

/**
 * @brief Schedulable stage: sources, sinks, merges, task boundaries.
 */
class AsyncProcessor : public ProcessorBase {
public:
  using ProcessorBase::ProcessorBase;

  /// @brief Run until blocked, finished, or the budget is spent.
  virtual PollStatus poll(TaskContext& ctx) = 0;

  /// @brief Hand over packets still held (teardown/fault); the engine drops them with accounting.
  virtual void drain_held(std::vector<mem::Packet>& out) { (void)out; }
};

} // namespace pulse::flow
