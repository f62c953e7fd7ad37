#pragma once
/**
 * @file graph.hpp
 * @brief Router topology: processors and links in index-addressed arenas.
 *
 * Construction (GraphBuilder) validates every wiring rule up front:
 *  - each port carries at most one link, and both ends share an element type;
 *  - synchronous processors have exactly one input and at least one output;
 *  - every declared port is connected;
 *  - any cycle passes through at least one asynchronous processor.
 *
 * At run time the graph implements the pull protocol: an asynchronous task
 * pulls a link; if the link is fed by a synchronous processor the pull
 * recurses into that processor ("pump"), which flushes what it already holds
 * or pulls its own input, processes, and emits. Demand therefore starts at
 * the egress and travels backward; data only moves in answer to it.
 *
 * Lifetime: the Graph must outlive every scheduler run that drives it.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pulse/compat/expected.hpp"
#include "pulse/config/config_loader.hpp"
#include "pulse/flow/link.hpp"
#include "pulse/flow/port.hpp"
#include "pulse/flow/processor.hpp"
#include "pulse/flow/status.hpp"
#include "pulse/obs/observability.hpp"

namespace pulse::flow {

class Scheduler;

namespace detail {
struct Node;
} // namespace detail

/// Reasons graph construction was rejected.
enum class GraphError : std::uint8_t {
  NullProcessor = 1,   ///< add() was given nullptr
  UnknownProcessor,    ///< PortRef names no processor
  PortOutOfRange,      ///< PortRef port index not declared
  OutputPortInUse,     ///< Output port already linked
  InputPortInUse,      ///< Input port already linked
  TypeMismatch,        ///< Element types of the two ports differ
  ZeroCapacity,        ///< Link capacity must be >= 1
  CapacityTooLarge,    ///< Link capacity above LINK_MAX_CAPACITY
  AllocationFailed,    ///< Link ring could not be allocated
  SyncArity,           ///< Sync processor without exactly one input / any output
  UnconnectedPort,     ///< A declared port has no link
  SyncCycle,           ///< Cycle made only of synchronous processors
  AlreadyBuilt         ///< build() called twice
};

std::string_view to_string(GraphError e) noexcept;

/// @brief Point-in-time view of one processor.
struct ProcessorStats {
  ProcessorId    id{kNoProcessor};
  std::string    name;
  ProcessorKind  kind{ProcessorKind::Sync};
  ProcessorState state{ProcessorState::Running};
  std::uint64_t  dropped{0};   ///< Packets it held when it was closed or failed
  std::string    fault;        ///< what() of the fault, if Failed
};

/// @brief Point-in-time view of the whole graph.
struct GraphStats {
  std::vector<ProcessorStats> processors;
  std::vector<LinkStats>      links;
};

class Graph;

/**
 * @brief Collects processors and links and validates them into a Graph.
 */
class GraphBuilder final {
public:
  explicit GraphBuilder(config::EngineConfig cfg = config::Loader::defaults());
  ~GraphBuilder();

  GraphBuilder(const GraphBuilder&)            = delete;
  GraphBuilder& operator=(const GraphBuilder&) = delete;

  /// @brief Event sink for faults, closures and drops (default: obs::make_simple_observer()).
  GraphBuilder& observer(obs::Observer* o) noexcept;

  /// @brief Add a synchronous processor. @return its id (kNoProcessor for nullptr).
  ProcessorId add(std::unique_ptr<SyncProcessor> p);
  /// @brief Add an asynchronous processor. @return its id (kNoProcessor for nullptr).
  ProcessorId add(std::unique_ptr<AsyncProcessor> p);

  /// @brief Link output @p from to input @p to with EngineConfig::default_link_capacity.
  pulse_detail::expected<LinkId, GraphError> connect(PortRef from, PortRef to);

  /// @brief Link output @p from to input @p to with an explicit capacity (>= 1).
  pulse_detail::expected<LinkId, GraphError>
  connect(PortRef from, PortRef to, std::size_t capacity);

  /// @brief Validate and produce a runnable graph. The builder is spent afterwards.
  pulse_detail::expected<std::unique_ptr<Graph>, GraphError> build();

private:
  ProcessorId adopt(std::unique_ptr<detail::Node> node);
  std::optional<GraphError> check_port(PortRef ref, bool output) const;
  bool has_sync_cycle() const;

  config::EngineConfig                       cfg_;
  obs::Observer*                             observer_;
  std::vector<std::unique_ptr<detail::Node>> nodes_;
  std::vector<std::unique_ptr<Link>>         links_;
  std::optional<GraphError>                  deferred_;
  bool                                       built_{false};
};

/**
 * @brief A validated, runnable router graph.
 */
class Graph final {
public:
  ~Graph();

  Graph(const Graph&)            = delete;
  Graph& operator=(const Graph&) = delete;

  /// @brief Create one task per asynchronous processor on @p sched and make them runnable.
  void spawn(Scheduler& sched);

  /// @brief spawn(), run the worker pool until every task completes, then shutdown().
  void run(Scheduler& sched);

  /**
   * @brief Tear a processor down: its links close, held packets are dropped
   *        with accounting, neighbours observe Closed. Thread-safe.
   */
  void teardown(ProcessorId id);

  /**
   * @brief Close every link and drop in-flight packets with accounting.
   * @details Call once no scheduler is driving the graph. Idempotent; the
   *          destructor calls it.
   */
  void shutdown() noexcept;

  // ---------------------------- Observers ---------------------------------
  std::size_t processor_count() const noexcept;
  std::size_t link_count() const noexcept { return links_.size(); }
  const Link& link(LinkId id) const { return *links_.at(id); }
  ProcessorState state(ProcessorId id) const;
  ProcessorKind  kind(ProcessorId id) const;
  const std::string& name(ProcessorId id) const;

  /// @brief Link attached to output @p port of @p id (kNoLink if none).
  LinkId output_link(ProcessorId id, std::size_t port = 0) const;
  /// @brief Link attached to input @p port of @p id (kNoLink if none).
  LinkId input_link(ProcessorId id, std::size_t port = 0) const;

  /// @brief Asynchronous processors without inputs.
  std::vector<ProcessorId> ingress() const;
  /// @brief Asynchronous processors without outputs.
  std::vector<ProcessorId> egress() const;

  GraphStats stats() const;

  /// @brief Typed access to a processor (nullptr if the id or the type does not match).
  template <class P>
  P* processor(ProcessorId id) const noexcept {
    return dynamic_cast<P*>(base(id));
  }

private:
  friend class GraphBuilder;
  friend class TaskContext;
  friend class ProcessorTask;

  enum class PumpResult : std::uint8_t {
    Progress,   ///< Something moved; the caller re-checks its link
    Idle,       ///< Upstream empty; wake registered
    Blocked,    ///< Held output refused with Full; wake registered
    Busy,       ///< Another task is pumping this node
    Closed      ///< Node retired
  };
  enum class FlushResult : std::uint8_t { Nothing, Drained, Partial, Stuck };

  Graph(config::EngineConfig cfg, obs::Observer* observer,
        std::vector<std::unique_ptr<detail::Node>> nodes,
        std::vector<std::unique_ptr<Link>> links);

  ProcessorBase* base(ProcessorId id) const noexcept;

  PollStatus poll_async(ProcessorId id, Scheduler& sched, const Waker& self);
  PullStatus pull_link(LinkId id, mem::Packet& out, const Waker& w);
  PushStatus push_link(ProcessorId from, LinkId id, mem::Packet&& p, const Waker& w);
  PumpResult pump(detail::Node& node, const Waker& w);
  FlushResult flush_pending(detail::Node& node, const Waker& w);

  void retire(detail::Node& node, ProcessorState final_state, std::string_view reason);
  void close_input(detail::Node& node, LinkId id) noexcept;
  void close_upstream_if_orphaned(LinkId id);
  void account_drop(detail::Node& node, std::uint64_t n, std::string_view reason);

  config::EngineConfig                       cfg_;
  obs::Observer*                             observer_;
  std::vector<std::unique_ptr<detail::Node>> nodes_;
  std::vector<std::unique_ptr<Link>>         links_;
  std::vector<detail::Node*>                 sync_producer_;   ///< Per link: sync node feeding it, or nullptr
  std::atomic<bool>                          shut_down_{false};
};

} // namespace pulse::flow
