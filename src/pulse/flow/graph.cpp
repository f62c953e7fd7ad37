#include "pulse/flow/graph.hpp"

#include <exception>
#include <mutex>
#include <string>
#include <utility>
#include <variant>

#include "pulse/flow/scheduler.hpp"

namespace pulse::flow {

namespace detail {

/// @brief Arena slot: one processor plus the engine-side state around it.
struct Node {
  using Variant = std::variant<std::unique_ptr<SyncProcessor>, std::unique_ptr<AsyncProcessor>>;

  Node(ProcessorId node_id, Variant p, const PortLayout& ports)
    : id(node_id),
      proc(std::move(p)),
      in_links(ports.inputs.size(), kNoLink),
      out_links(ports.outputs.size(), kNoLink) {}

  ProcessorBase* base() const noexcept {
    return std::visit([](const auto& p) -> ProcessorBase* { return p.get(); }, proc);
  }
  ProcessorKind kind() const noexcept {
    return proc.index() == 0 ? ProcessorKind::Sync : ProcessorKind::Async;
  }
  SyncProcessor*  sync() const noexcept { return std::get<0>(proc).get(); }
  AsyncProcessor* async() const noexcept { return std::get<1>(proc).get(); }

  ProcessorId         id;
  Variant             proc;
  std::vector<LinkId> in_links;
  std::vector<LinkId> out_links;

  std::atomic<ProcessorState> state{ProcessorState::Running};
  std::atomic<bool>           stop_requested{false};
  std::atomic<std::uint64_t>  dropped{0};

  // Sync nodes: held outputs, guarded by pump_mu together with the processor.
  std::mutex       pump_mu;
  Emitter::Pending pending;

  // Async nodes: the task driving poll(). spawn_mu orders spawn() against teardown().
  std::mutex            spawn_mu;
  std::shared_ptr<Task> task;
  bool                  spawned{false};

  mutable std::mutex fault_mu;
  std::string        fault;
};

} // namespace detail

using detail::Node;

namespace {
constexpr const char* kUnknownFault = "unknown exception";
} // namespace

std::string_view to_string(GraphError e) noexcept {
  switch (e) {
    case GraphError::NullProcessor:    return "null_processor";
    case GraphError::UnknownProcessor: return "unknown_processor";
    case GraphError::PortOutOfRange:   return "port_out_of_range";
    case GraphError::OutputPortInUse:  return "output_port_in_use";
    case GraphError::InputPortInUse:   return "input_port_in_use";
    case GraphError::TypeMismatch:     return "type_mismatch";
    case GraphError::ZeroCapacity:     return "zero_capacity";
    case GraphError::CapacityTooLarge: return "capacity_too_large";
    case GraphError::AllocationFailed: return "allocation_failed";
    case GraphError::SyncArity:        return "sync_arity";
    case GraphError::UnconnectedPort:  return "unconnected_port";
    case GraphError::SyncCycle:        return "sync_cycle";
    case GraphError::AlreadyBuilt:     return "already_built";
  }
  return "unknown";
}

// ----------------------------------------------------------------------------
// ProcessorTask: one per asynchronous node
// ----------------------------------------------------------------------------

class ProcessorTask final : public Task {
public:
  ProcessorTask(Graph& graph, ProcessorId id) noexcept : graph_(graph), id_(id) {}

protected:
  PollStatus run(Scheduler& sched, const Waker& self) override {
    return graph_.poll_async(id_, sched, self);
  }

private:
  Graph&      graph_;
  ProcessorId id_;
};

// ----------------------------------------------------------------------------
// GraphBuilder
// ----------------------------------------------------------------------------

GraphBuilder::GraphBuilder(config::EngineConfig cfg)
  : cfg_(std::move(cfg)), observer_(obs::make_simple_observer()) {}

GraphBuilder::~GraphBuilder() = default;

GraphBuilder& GraphBuilder::observer(obs::Observer* o) noexcept {
  observer_ = o != nullptr ? o : obs::make_simple_observer();
  return *this;
}

ProcessorId GraphBuilder::adopt(std::unique_ptr<Node> node) {
  const ProcessorId id = node->id;
  nodes_.push_back(std::move(node));
  return id;
}

ProcessorId GraphBuilder::add(std::unique_ptr<SyncProcessor> p) {
  if (!p) {
    if (!deferred_) deferred_ = GraphError::NullProcessor;
    return kNoProcessor;
  }
  const PortLayout& ports = p->ports();
  const auto id = static_cast<ProcessorId>(nodes_.size());
  return adopt(std::make_unique<Node>(id, Node::Variant{std::move(p)}, ports));
}

ProcessorId GraphBuilder::add(std::unique_ptr<AsyncProcessor> p) {
  if (!p) {
    if (!deferred_) deferred_ = GraphError::NullProcessor;
    return kNoProcessor;
  }
  const PortLayout& ports = p->ports();
  const auto id = static_cast<ProcessorId>(nodes_.size());
  return adopt(std::make_unique<Node>(id, Node::Variant{std::move(p)}, ports));
}

std::optional<GraphError> GraphBuilder::check_port(PortRef ref, bool output) const {
  if (ref.node >= nodes_.size()) return GraphError::UnknownProcessor;
  const Node& n = *nodes_[ref.node];
  const auto& links = output ? n.out_links : n.in_links;
  if (ref.port >= links.size()) return GraphError::PortOutOfRange;
  if (links[ref.port] != kNoLink) {
    return output ? GraphError::OutputPortInUse : GraphError::InputPortInUse;
  }
  return std::nullopt;
}

pulse_detail::expected<LinkId, GraphError> GraphBuilder::connect(PortRef from, PortRef to) {
  return connect(from, to, cfg_.default_link_capacity);
}

pulse_detail::expected<LinkId, GraphError>
GraphBuilder::connect(PortRef from, PortRef to, std::size_t capacity) {
  using Err = pulse_detail::unexpected<GraphError>;
  if (built_) return Err(GraphError::AlreadyBuilt);
  if (auto e = check_port(from, true)) return Err(*e);
  if (auto e = check_port(to, false)) return Err(*e);
  if (capacity == 0) return Err(GraphError::ZeroCapacity);
  if (capacity > config::constants::LINK_MAX_CAPACITY) return Err(GraphError::CapacityTooLarge);

  const PortSpec& out_spec = nodes_[from.node]->base()->ports().outputs[from.port];
  const PortSpec& in_spec  = nodes_[to.node]->base()->ports().inputs[to.port];
  if (out_spec.type != in_spec.type) return Err(GraphError::TypeMismatch);

  const auto id = static_cast<LinkId>(links_.size());
  auto link = Link::create(id, capacity, out_spec.type);
  if (!link) {
    switch (link.error()) {
      case mem::SpscError::CapacityZero:     return Err(GraphError::ZeroCapacity);
      case mem::SpscError::CapacityTooLarge: return Err(GraphError::CapacityTooLarge);
      case mem::SpscError::AllocationFailed: break;
    }
    return Err(GraphError::AllocationFailed);
  }
  (*link)->report_to(observer_);
  (*link)->attach_producer(LinkEnd{from.node, from.port});
  (*link)->attach_consumer(LinkEnd{to.node, to.port});
  nodes_[from.node]->out_links[from.port] = id;
  nodes_[to.node]->in_links[to.port]      = id;
  links_.push_back(std::move(*link));
  return id;
}

bool GraphBuilder::has_sync_cycle() const {
  // Iterative three-colour DFS over sync -> sync edges only.
  enum : std::uint8_t { White, Grey, Black };
  std::vector<std::uint8_t> colour(nodes_.size(), White);
  std::vector<std::pair<ProcessorId, std::size_t>> stack;

  for (ProcessorId root = 0; root < nodes_.size(); ++root) {
    if (colour[root] != White || nodes_[root]->kind() != ProcessorKind::Sync) continue;
    stack.emplace_back(root, 0);
    colour[root] = Grey;
    while (!stack.empty()) {
      auto& [node, next] = stack.back();
      const auto& outs = nodes_[node]->out_links;
      if (next == outs.size()) {
        colour[node] = Black;
        stack.pop_back();
        continue;
      }
      const LinkId lid = outs[next++];
      const ProcessorId succ = links_[lid]->consumer().node;
      if (nodes_[succ]->kind() != ProcessorKind::Sync) continue;
      if (colour[succ] == Grey) return true;
      if (colour[succ] == White) {
        colour[succ] = Grey;
        stack.emplace_back(succ, 0);
      }
    }
  }
  return false;
}

pulse_detail::expected<std::unique_ptr<Graph>, GraphError> GraphBuilder::build() {
  using Err = pulse_detail::unexpected<GraphError>;
  if (built_) return Err(GraphError::AlreadyBuilt);
  if (deferred_) return Err(*deferred_);

  for (const auto& n : nodes_) {
    if (n->kind() == ProcessorKind::Sync &&
        (n->in_links.size() != 1 || n->out_links.empty())) {
      return Err(GraphError::SyncArity);
    }
  }
  for (const auto& n : nodes_) {
    for (LinkId l : n->in_links) {
      if (l == kNoLink) return Err(GraphError::UnconnectedPort);
    }
    for (LinkId l : n->out_links) {
      if (l == kNoLink) return Err(GraphError::UnconnectedPort);
    }
  }
  if (has_sync_cycle()) return Err(GraphError::SyncCycle);

  built_ = true;
  return std::unique_ptr<Graph>(
      new Graph(cfg_, observer_, std::move(nodes_), std::move(links_)));
}

// ----------------------------------------------------------------------------
// Graph: construction and observers
// ----------------------------------------------------------------------------

Graph::Graph(config::EngineConfig cfg, obs::Observer* observer,
             std::vector<std::unique_ptr<Node>> nodes,
             std::vector<std::unique_ptr<Link>> links)
  : cfg_(std::move(cfg)),
    observer_(observer),
    nodes_(std::move(nodes)),
    links_(std::move(links)),
    sync_producer_(links_.size(), nullptr) {
  for (const auto& l : links_) {
    l->report_to(observer_);
    Node& producer = *nodes_[l->producer().node];
    if (producer.kind() == ProcessorKind::Sync) {
      sync_producer_[l->id()] = &producer;
    }
  }
}

Graph::~Graph() {
  shutdown();
}

std::size_t Graph::processor_count() const noexcept {
  return nodes_.size();
}

ProcessorBase* Graph::base(ProcessorId id) const noexcept {
  if (id >= nodes_.size()) return nullptr;
  return nodes_[id]->base();
}

ProcessorState Graph::state(ProcessorId id) const {
  return nodes_.at(id)->state.load(std::memory_order_acquire);
}

ProcessorKind Graph::kind(ProcessorId id) const {
  return nodes_.at(id)->kind();
}

const std::string& Graph::name(ProcessorId id) const {
  return nodes_.at(id)->base()->name();
}

LinkId Graph::output_link(ProcessorId id, std::size_t port) const {
  if (id >= nodes_.size() || port >= nodes_[id]->out_links.size()) return kNoLink;
  return nodes_[id]->out_links[port];
}

LinkId Graph::input_link(ProcessorId id, std::size_t port) const {
  if (id >= nodes_.size() || port >= nodes_[id]->in_links.size()) return kNoLink;
  return nodes_[id]->in_links[port];
}

std::vector<ProcessorId> Graph::ingress() const {
  std::vector<ProcessorId> ids;
  for (const auto& n : nodes_) {
    if (n->kind() == ProcessorKind::Async && n->in_links.empty()) ids.push_back(n->id);
  }
  return ids;
}

std::vector<ProcessorId> Graph::egress() const {
  std::vector<ProcessorId> ids;
  for (const auto& n : nodes_) {
    if (n->kind() == ProcessorKind::Async && n->out_links.empty()) ids.push_back(n->id);
  }
  return ids;
}

GraphStats Graph::stats() const {
  GraphStats s;
  s.processors.reserve(nodes_.size());
  for (const auto& n : nodes_) {
    ProcessorStats p;
    p.id      = n->id;
    p.name    = n->base()->name();
    p.kind    = n->kind();
    p.state   = n->state.load(std::memory_order_acquire);
    p.dropped = n->dropped.load(std::memory_order_relaxed);
    {
      std::lock_guard<std::mutex> lk(n->fault_mu);
      p.fault = n->fault;
    }
    s.processors.push_back(std::move(p));
  }
  s.links.reserve(links_.size());
  for (const auto& l : links_) s.links.push_back(l->stats());
  return s;
}

// ----------------------------------------------------------------------------
// Graph: lifecycle
// ----------------------------------------------------------------------------

void Graph::spawn(Scheduler& sched) {
  for (auto& n : nodes_) {
    if (n->kind() != ProcessorKind::Async) continue;
    std::lock_guard<std::mutex> lk(n->spawn_mu);
    if (n->spawned) continue;
    if (n->state.load(std::memory_order_acquire) != ProcessorState::Running) continue;
    n->task = std::make_shared<ProcessorTask>(*this, n->id);
    sched.spawn(n->task);
    n->spawned = true;
  }
}

void Graph::run(Scheduler& sched) {
  spawn(sched);
  sched.join();
  shutdown();
}

void Graph::teardown(ProcessorId id) {
  Node& node = *nodes_.at(id);
  node.stop_requested.store(true, std::memory_order_release);
  if (node.kind() == ProcessorKind::Sync) {
    std::lock_guard<std::mutex> lk(node.pump_mu);
    retire(node, ProcessorState::Closed, "teardown");
    return;
  }
  std::lock_guard<std::mutex> lk(node.spawn_mu);
  if (node.spawned) {
    node.task->wake();  // the next poll retires it on its own thread
  } else {
    retire(node, ProcessorState::Closed, "teardown");
  }
}

void Graph::shutdown() noexcept {
  if (shut_down_.exchange(true, std::memory_order_acq_rel)) return;
  for (auto& n : nodes_) {
    if (n->kind() == ProcessorKind::Sync) {
      std::lock_guard<std::mutex> lk(n->pump_mu);
      retire(*n, ProcessorState::Closed, "shutdown");
    } else {
      retire(*n, ProcessorState::Closed, "shutdown");
    }
  }
}

// ----------------------------------------------------------------------------
// Graph: pull protocol
// ----------------------------------------------------------------------------

PollStatus Graph::poll_async(ProcessorId id, Scheduler& sched, const Waker& self) {
  Node& node = *nodes_[id];
  if (node.state.load(std::memory_order_acquire) != ProcessorState::Running) {
    return PollStatus::Complete;
  }
  if (node.stop_requested.load(std::memory_order_acquire)) {
    retire(node, ProcessorState::Closed, "teardown");
    return PollStatus::Complete;
  }

  TaskContext ctx(*this, id, self, &sched, cfg_.poll_budget);
  PollStatus st = PollStatus::Pending;
  try {
    st = node.async()->poll(ctx);
  } catch (const std::exception& e) {
    retire(node, ProcessorState::Failed, e.what());
    return PollStatus::Complete;
  } catch (...) {
    retire(node, ProcessorState::Failed, kUnknownFault);
    return PollStatus::Complete;
  }
  if (st == PollStatus::Complete) {
    retire(node, ProcessorState::Closed, "complete");
  }
  return st;
}

PullStatus Graph::pull_link(LinkId id, mem::Packet& out, const Waker& w) {
  Link& link = *links_[id];
  Node* upstream = sync_producer_[id];

  for (std::uint32_t round = 0; round < cfg_.pull_budget; ++round) {
    const PullStatus st = link.try_pull(out);
    if (st != PullStatus::Empty) return st;

    if (upstream == nullptr) {
      if (link.park_consumer(w)) return PullStatus::Empty;
      continue;
    }
    switch (pump(*upstream, w)) {
      case PumpResult::Progress:
      case PumpResult::Closed:
        continue;
      case PumpResult::Idle:
      case PumpResult::Blocked:
        // Also listen here: another consumer of the same node may make it emit.
        if (link.park_consumer(w)) return PullStatus::Empty;
        continue;
      case PumpResult::Busy:
        w->wake();
        return PullStatus::Empty;
    }
  }
  // Cascade budget spent: let other tasks run, come back later.
  w->wake();
  return PullStatus::Empty;
}

PushStatus Graph::push_link(ProcessorId from, LinkId id, mem::Packet&& p, const Waker& w) {
  Link& link = *links_[id];
  for (;;) {
    switch (link.try_push(std::move(p))) {
      case PushStatus::Accepted:
        return PushStatus::Accepted;
      case PushStatus::Closed: {
        mem::Packet gone = std::move(p);
        link.count_dropped(1);
        account_drop(*nodes_[from], 1, "output closed");
        return PushStatus::Closed;
      }
      case PushStatus::Full:
        if (link.park_producer(w)) return PushStatus::Full;
        break;  // space appeared or consumer left: retry
    }
  }
}

Graph::FlushResult Graph::flush_pending(Node& node, const Waker& w) {
  if (node.pending.empty()) return FlushResult::Nothing;
  bool moved = false;
  while (!node.pending.empty()) {
    auto& [port, packet] = node.pending.front();
    Link& link = *links_[node.out_links[port]];
    const PushStatus st = link.try_push(std::move(packet));
    if (st == PushStatus::Full) {
      if (link.park_producer(w)) return moved ? FlushResult::Partial : FlushResult::Stuck;
      continue;
    }
    if (st == PushStatus::Closed) {
      link.count_dropped(1);
      account_drop(node, 1, "output closed");
    }
    node.pending.pop_front();
    moved = true;
  }
  return FlushResult::Drained;
}

Graph::PumpResult Graph::pump(Node& node, const Waker& w) {
  std::unique_lock<std::mutex> lk(node.pump_mu, std::try_to_lock);
  if (!lk.owns_lock()) return PumpResult::Busy;
  if (node.state.load(std::memory_order_acquire) != ProcessorState::Running) {
    return PumpResult::Closed;
  }
  if (node.stop_requested.load(std::memory_order_acquire)) {
    retire(node, ProcessorState::Closed, "teardown");
    return PumpResult::Closed;
  }

  switch (flush_pending(node, w)) {
    case FlushResult::Stuck:   return PumpResult::Blocked;
    case FlushResult::Partial:
    case FlushResult::Drained: return PumpResult::Progress;
    case FlushResult::Nothing: break;
  }

  mem::Packet packet;
  const PullStatus st = pull_link(node.in_links.front(), packet, w);
  if (st == PullStatus::Empty) return PumpResult::Idle;
  if (st == PullStatus::Closed) {
    retire(node, ProcessorState::Closed, "input closed");
    return PumpResult::Closed;
  }

  try {
    Emitter emitter(node.pending, node.out_links.size());
    node.sync()->process(std::move(packet), emitter);
  } catch (const std::exception& e) {
    account_drop(node, 1, "fault");   // the packet being processed
    retire(node, ProcessorState::Failed, e.what());
    return PumpResult::Closed;
  } catch (...) {
    account_drop(node, 1, "fault");
    retire(node, ProcessorState::Failed, kUnknownFault);
    return PumpResult::Closed;
  }
  // Zero outputs still count as progress: the caller pulls upstream again.
  (void)flush_pending(node, w);
  return PumpResult::Progress;
}

// ----------------------------------------------------------------------------
// Graph: closure
// ----------------------------------------------------------------------------

void Graph::account_drop(Node& node, std::uint64_t n, std::string_view reason) {
  if (n == 0) return;
  node.dropped.fetch_add(n, std::memory_order_relaxed);
  obs::EngineEvent ev;
  ev.kind      = obs::EventKind::PacketDropped;
  ev.processor = node.base()->name();
  ev.count     = n;
  ev.reason    = std::string(reason);
  observer_->record(ev);
}

void Graph::close_input(Node& node, LinkId id) noexcept {
  const std::size_t drained = links_[id]->close_consumer();
  account_drop(node, drained, "input closed");
  close_upstream_if_orphaned(id);
}

void Graph::close_upstream_if_orphaned(LinkId id) {
  Node* up = sync_producer_[id];
  if (up == nullptr) return;
  std::lock_guard<std::mutex> lk(up->pump_mu);
  if (up->state.load(std::memory_order_acquire) != ProcessorState::Running) return;
  for (LinkId l : up->out_links) {
    if (!links_[l]->consumer_closed()) return;
  }
  retire(*up, ProcessorState::Closed, "consumers closed");
}

void Graph::retire(Node& node, ProcessorState final_state, std::string_view reason) {
  ProcessorState expected = ProcessorState::Running;
  if (!node.state.compare_exchange_strong(expected, final_state, std::memory_order_acq_rel)) {
    return;
  }
  if (final_state == ProcessorState::Failed) {
    std::lock_guard<std::mutex> lk(node.fault_mu);
    node.fault = std::string(reason);
  }

  std::uint64_t held = 0;
  if (node.kind() == ProcessorKind::Sync) {
    held = node.pending.size();
    node.pending.clear();
  } else {
    std::vector<mem::Packet> surrendered;
    try {
      node.async()->drain_held(surrendered);
    } catch (const std::exception& e) {
      observer_->record(obs::EngineEvent{obs::EventKind::ProcessorFault, node.base()->name(), 1,
                                         std::string("drain_held: ") + e.what()});
    } catch (...) {
      observer_->record(obs::EngineEvent{obs::EventKind::ProcessorFault, node.base()->name(), 1,
                                         std::string("drain_held: ") + kUnknownFault});
    }
    held = surrendered.size();
  }
  account_drop(node, held, final_state == ProcessorState::Failed ? "fault" : "teardown");

  for (LinkId l : node.out_links) links_[l]->close_producer();
  for (LinkId l : node.in_links) close_input(node, l);

  obs::EngineEvent ev;
  ev.kind      = final_state == ProcessorState::Failed ? obs::EventKind::ProcessorFault
                                                       : obs::EventKind::ProcessorClosed;
  ev.processor = node.base()->name();
  ev.count     = 0;
  ev.reason    = std::string(reason);
  observer_->record(ev);
}

} // namespace pulse::flow
