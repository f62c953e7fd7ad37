/**
 * @file test_graph.cpp
 * @brief Tests for GraphBuilder validation, Graph observers and teardown.
 *
 * Every wiring rule is checked at construction time and reported as a
 * GraphError; a graph that builds is runnable.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "pulse/flow/graph.hpp"
#include "pulse/flow/scheduler.hpp"
#include "pulse/processors/queue_stage.hpp"
#include "pulse/processors/sinks.hpp"
#include "pulse/processors/sources.hpp"
#include "pulse/processors/transform.hpp"

using pulse::flow::GraphBuilder;
using pulse::flow::GraphError;
using pulse::flow::PortLayout;
using pulse::flow::PortSpec;
using pulse::flow::ProcessorKind;
using pulse::flow::ProcessorState;
using pulse::flow::SyncProcessor;
using pulse::flow::in;
using pulse::flow::kNoLink;
using pulse::flow::kNoProcessor;
using pulse::flow::out;
using pulse::processors::BlackHoleSink;
using pulse::processors::CollectorSink;
using pulse::processors::Identity;
using pulse::processors::QueueStage;
using pulse::processors::VectorSource;

namespace {

/// Sync stage with a configurable port layout (for arity/type checks).
class ShapedSync final : public SyncProcessor {
public:
  explicit ShapedSync(PortLayout ports) : SyncProcessor("shaped", std::move(ports)) {}
  void process(pulse::mem::Packet&& p, pulse::flow::Emitter& e) override { e.emit(0, std::move(p)); }
};

PortLayout frame_layout() {
  PortLayout l;
  l.inputs.push_back(PortSpec{"in", "frame"});
  l.outputs.push_back(PortSpec{"out", "frame"});
  return l;
}

std::unique_ptr<VectorSource> source(const char* name = "src") {
  return VectorSource::sequence(name, 0);
}

} // namespace

// ---------- connect() ----------

TEST(GraphBuilder, Connect_RejectsUnknownProcessorAndPort) {
  GraphBuilder b;
  const auto s = b.add(source());
  const auto k = b.add(std::make_unique<BlackHoleSink>());

  auto unknown = b.connect(out(s), in(42));
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error(), GraphError::UnknownProcessor);

  auto bad_port = b.connect(out(s, 1), in(k));
  ASSERT_FALSE(bad_port);
  EXPECT_EQ(bad_port.error(), GraphError::PortOutOfRange);

  auto no_input = b.connect(out(k), in(s));   // sink has no outputs
  ASSERT_FALSE(no_input);
  EXPECT_EQ(no_input.error(), GraphError::PortOutOfRange);
}

/**
 * @test GraphBuilder_Connect_OnePortOneLink
 * @brief A port carries at most one link; fan-out needs an explicit processor.
 */
TEST(GraphBuilder, Connect_OnePortOneLink) {
  GraphBuilder b;
  const auto s  = b.add(source());
  const auto k1 = b.add(std::make_unique<BlackHoleSink>("k1"));
  const auto k2 = b.add(std::make_unique<BlackHoleSink>("k2"));
  const auto s2 = b.add(source("src2"));

  ASSERT_TRUE(b.connect(out(s), in(k1)));
  auto twice_out = b.connect(out(s), in(k2));
  ASSERT_FALSE(twice_out);
  EXPECT_EQ(twice_out.error(), GraphError::OutputPortInUse);

  auto twice_in = b.connect(out(s2), in(k1));
  ASSERT_FALSE(twice_in);
  EXPECT_EQ(twice_in.error(), GraphError::InputPortInUse);
}

TEST(GraphBuilder, Connect_RejectsTypeMismatchAndBadCapacity) {
  GraphBuilder b;
  const auto s = b.add(source());
  const auto f = b.add(std::make_unique<ShapedSync>(frame_layout()));
  const auto k = b.add(std::make_unique<BlackHoleSink>());

  auto mismatch = b.connect(out(s), in(f));
  ASSERT_FALSE(mismatch);
  EXPECT_EQ(mismatch.error(), GraphError::TypeMismatch);

  auto zero = b.connect(out(s), in(k), 0);
  ASSERT_FALSE(zero);
  EXPECT_EQ(zero.error(), GraphError::ZeroCapacity);

  auto huge = b.connect(out(s), in(k), pulse::config::constants::LINK_MAX_CAPACITY + 1);
  ASSERT_FALSE(huge);
  EXPECT_EQ(huge.error(), GraphError::CapacityTooLarge);
}

TEST(GraphBuilder, Connect_DefaultCapacityFromConfig) {
  pulse::config::EngineConfig cfg;
  cfg.default_link_capacity = 3;
  GraphBuilder b(cfg);
  const auto s = b.add(source());
  const auto k = b.add(std::make_unique<BlackHoleSink>());
  auto l = b.connect(out(s), in(k));
  ASSERT_TRUE(l);
  auto g = b.build();
  ASSERT_TRUE(g);
  EXPECT_EQ((*g)->link(*l).capacity(), 3u);
}

// ---------- build() ----------

TEST(GraphBuilder, Build_RejectsNullProcessor) {
  GraphBuilder b;
  EXPECT_EQ(b.add(std::unique_ptr<SyncProcessor>{}), kNoProcessor);
  auto g = b.build();
  ASSERT_FALSE(g);
  EXPECT_EQ(g.error(), GraphError::NullProcessor);
}

TEST(GraphBuilder, Build_RejectsUnconnectedPort) {
  GraphBuilder b;
  const auto s = b.add(source());
  const auto i = b.add(std::make_unique<Identity>());
  b.add(std::make_unique<BlackHoleSink>());
  ASSERT_TRUE(b.connect(out(s), in(i)));
  auto g = b.build();   // identity output and sink input dangle
  ASSERT_FALSE(g);
  EXPECT_EQ(g.error(), GraphError::UnconnectedPort);
}

TEST(GraphBuilder, Build_RejectsSyncArity) {
  GraphBuilder two_inputs;
  const auto a = two_inputs.add(source("a"));
  const auto c = two_inputs.add(source("c"));
  const auto m = two_inputs.add(std::make_unique<ShapedSync>(PortLayout::uniform(2, 1)));
  const auto k = two_inputs.add(std::make_unique<BlackHoleSink>());
  ASSERT_TRUE(two_inputs.connect(out(a), in(m, 0)));
  ASSERT_TRUE(two_inputs.connect(out(c), in(m, 1)));
  ASSERT_TRUE(two_inputs.connect(out(m), in(k)));
  auto g1 = two_inputs.build();
  ASSERT_FALSE(g1);
  EXPECT_EQ(g1.error(), GraphError::SyncArity);

  GraphBuilder no_outputs;
  const auto s = no_outputs.add(source());
  const auto d = no_outputs.add(std::make_unique<ShapedSync>(PortLayout::uniform(1, 0)));
  ASSERT_TRUE(no_outputs.connect(out(s), in(d)));
  auto g2 = no_outputs.build();
  ASSERT_FALSE(g2);
  EXPECT_EQ(g2.error(), GraphError::SyncArity);
}

/**
 * @test GraphBuilder_Build_SyncCycleRejected_AsyncCycleAllowed
 * @brief A loop of synchronous stages would make the pull cascade recurse
 *        forever; putting an asynchronous stage in the loop breaks it.
 */
TEST(GraphBuilder, Build_SyncCycleRejected_AsyncCycleAllowed) {
  GraphBuilder sync_loop;
  const auto a = sync_loop.add(std::make_unique<Identity>("a"));
  const auto b = sync_loop.add(std::make_unique<Identity>("b"));
  ASSERT_TRUE(sync_loop.connect(out(a), in(b)));
  ASSERT_TRUE(sync_loop.connect(out(b), in(a)));
  auto g1 = sync_loop.build();
  ASSERT_FALSE(g1);
  EXPECT_EQ(g1.error(), GraphError::SyncCycle);

  GraphBuilder async_loop;
  const auto x = async_loop.add(std::make_unique<Identity>("x"));
  const auto q = async_loop.add(std::make_unique<QueueStage>("q"));
  ASSERT_TRUE(async_loop.connect(out(x), in(q)));
  ASSERT_TRUE(async_loop.connect(out(q), in(x)));
  EXPECT_TRUE(async_loop.build());
}

TEST(GraphBuilder, Build_OnlyOnce) {
  GraphBuilder b;
  const auto s = b.add(source());
  const auto k = b.add(std::make_unique<BlackHoleSink>());
  ASSERT_TRUE(b.connect(out(s), in(k)));
  ASSERT_TRUE(b.build());
  auto again = b.build();
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error(), GraphError::AlreadyBuilt);
}

TEST(GraphErrorText, ToString_CoversEveryCode) {
  for (int e = static_cast<int>(GraphError::NullProcessor);
       e <= static_cast<int>(GraphError::AlreadyBuilt); ++e) {
    EXPECT_NE(to_string(static_cast<GraphError>(e)), "unknown");
  }
}

// ---------- Observers ----------

TEST(Graph, Observers_DescribeTopology) {
  GraphBuilder b;
  const auto s = b.add(source());
  const auto i = b.add(std::make_unique<Identity>("pass"));
  const auto k = b.add(std::make_unique<CollectorSink>("sink"));
  const auto l0 = b.connect(out(s), in(i), 4);
  const auto l1 = b.connect(out(i), in(k), 2);
  ASSERT_TRUE(l0 && l1);
  auto built = b.build();
  ASSERT_TRUE(built);
  auto& g = **built;

  EXPECT_EQ(g.processor_count(), 3u);
  EXPECT_EQ(g.link_count(), 2u);
  EXPECT_EQ(g.ingress(), std::vector<pulse::flow::ProcessorId>{s});
  EXPECT_EQ(g.egress(), std::vector<pulse::flow::ProcessorId>{k});
  EXPECT_EQ(g.kind(i), ProcessorKind::Sync);
  EXPECT_EQ(g.kind(k), ProcessorKind::Async);
  EXPECT_EQ(g.name(i), "pass");
  EXPECT_EQ(g.state(i), ProcessorState::Running);
  EXPECT_EQ(g.output_link(s), *l0);
  EXPECT_EQ(g.input_link(k), *l1);
  EXPECT_EQ(g.output_link(k), kNoLink);
  EXPECT_EQ(g.link(*l0).producer().node, s);
  EXPECT_EQ(g.link(*l0).consumer().node, i);

  EXPECT_NE(g.processor<CollectorSink>(k), nullptr);
  EXPECT_EQ(g.processor<CollectorSink>(i), nullptr);   // wrong type
  EXPECT_EQ(g.processor<CollectorSink>(99), nullptr);  // unknown id

  const auto st = g.stats();
  ASSERT_EQ(st.processors.size(), 3u);
  ASSERT_EQ(st.links.size(), 2u);
  EXPECT_EQ(st.links[1].capacity, 2u);
  EXPECT_EQ(st.processors[1].name, "pass");
}

/**
 * @test Graph_Shutdown_DropsInFlightWithAccounting
 * @brief Packets still queued when the graph shuts down are counted as drops.
 */
TEST(Graph, Shutdown_DropsInFlightWithAccounting) {
  GraphBuilder b;
  const auto s = b.add(VectorSource::sequence("src", 3));
  const auto k = b.add(std::make_unique<CollectorSink>("sink", std::size_t{0}));
  const auto l = b.connect(out(s), in(k), 4);
  ASSERT_TRUE(l);
  auto g = std::move(*b.build());

  pulse::flow::Scheduler sched;
  g->spawn(sched);
  sched.run_until_stalled();
  EXPECT_EQ(g->link(*l).depth(), 3u);

  g->shutdown();
  const auto st = g->stats();
  EXPECT_EQ(st.links[*l].dropped, 3u);
  EXPECT_EQ(st.processors[k].dropped, 3u);
  EXPECT_EQ(st.processors[k].state, ProcessorState::Closed);
  EXPECT_TRUE(st.links[*l].producer_closed);
  EXPECT_TRUE(st.links[*l].consumer_closed);

  g->shutdown();   // idempotent
  EXPECT_EQ(g->stats().links[*l].dropped, 3u);
}

// ---------- Teardown vs spawn ----------

/**
 * @test Graph_Teardown_BeforeSpawnRetiresInline
 * @brief A processor torn down before spawn() is closed on the spot and never
 *        gets a task; its neighbour sees Closed on the first push.
 */
TEST(Graph, Teardown_BeforeSpawnRetiresInline) {
  GraphBuilder b;
  const auto s = b.add(VectorSource::sequence("src", 3));
  const auto k = b.add(std::make_unique<BlackHoleSink>("sink"));
  const auto l = b.connect(out(s), in(k), 4);
  ASSERT_TRUE(l);
  auto g = std::move(*b.build());

  g->teardown(k);
  EXPECT_EQ(g->state(k), ProcessorState::Closed);
  EXPECT_TRUE(g->link(*l).consumer_closed());

  pulse::flow::Scheduler sched;
  g->spawn(sched);
  EXPECT_EQ(sched.live_tasks(), 1u);   // the source only
  sched.run_until_stalled();

  EXPECT_EQ(g->state(s), ProcessorState::Closed);
  EXPECT_EQ(g->processor<BlackHoleSink>(k)->consumed(), 0u);
  EXPECT_EQ(g->stats().processors[s].dropped, 3u);
  EXPECT_EQ(sched.live_tasks(), 0u);
}

/**
 * @test Graph_Teardown_RacingSpawnOnPool
 * @brief Tearing processors down from another thread while spawn() is still
 *        handing them to a running pool either retires them inline or wakes
 *        their task; every task finishes.
 */
TEST(Graph, Teardown_RacingSpawnOnPool) {
  constexpr int kChains = 16;
  pulse::config::EngineConfig cfg;
  cfg.workers = 2;
  GraphBuilder b(cfg);
  std::vector<pulse::flow::ProcessorId> ids;
  for (int i = 0; i < kChains; ++i) {
    const auto s = b.add(VectorSource::sequence("src", 8, {}, /*linger=*/true));
    const auto k = b.add(std::make_unique<BlackHoleSink>("sink"));
    ASSERT_TRUE(b.connect(out(s), in(k), 2));
    ids.push_back(s);
    ids.push_back(k);
  }
  auto g = std::move(*b.build());

  for (int round = 0; round < 2; ++round) {
    pulse::flow::Scheduler sched(cfg);
    sched.start();
    if (round == 0) {
      std::thread killer([&] { for (auto id : ids) g->teardown(id); });
      g->spawn(sched);
      killer.join();
    } else {
      g->spawn(sched);   // nothing left to spawn
    }
    ASSERT_TRUE(sched.join_for(std::chrono::seconds(10)));
    EXPECT_EQ(sched.live_tasks(), 0u);
  }

  for (auto id : ids) EXPECT_EQ(g->state(id), ProcessorState::Closed);
  std::uint64_t seen = 0;
  for (const auto& p : g->stats().processors) seen += p.dropped;
  for (int i = 0; i < kChains; ++i) {
    seen += g->processor<BlackHoleSink>(ids[2 * i + 1])->consumed();
  }
  EXPECT_EQ(seen, std::uint64_t{8} * kChains);
}
