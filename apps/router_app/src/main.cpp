/**
 * @file main.cpp
 * @brief Demo router: external feeder -> classify -> two branches -> join -> external reader.
 *
 * **Topology**
 * - ingress (ChannelSource) -> classify (tag "udp" to 0, else 1)
 * - 0: hop (Transform, decrements a TTL annotation; drops at zero)
 * - 1: lossy (Drop, 25%, fixed seed)
 * - join (round-robin) -> egress (ChannelSink)
 *
 * **Threads**
 * - Feeder thread sends into the ingress channel, then closes it.
 * - Reader thread drains the egress channel until it closes.
 * - Scheduler workers run the three async tasks; the sync stages run inline
 *   on whichever task pulls them.
 *
 * Configuration comes from PULSE_* environment variables (see config_loader.hpp).
 */

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <thread>
#include <utility>

#include "pulse/config/config_loader.hpp"
#include "pulse/flow/graph.hpp"
#include "pulse/flow/scheduler.hpp"
#include "pulse/processors/channel.hpp"
#include "pulse/processors/classify.hpp"
#include "pulse/processors/drop.hpp"
#include "pulse/processors/join.hpp"
#include "pulse/processors/sinks.hpp"
#include "pulse/processors/sources.hpp"
#include "pulse/processors/transform.hpp"
#include "pulse/version.hpp"

namespace {

constexpr std::uint64_t kPackets      = 10'000;
constexpr std::size_t   kChannelDepth = 64;
constexpr std::uint64_t kInitialTtl   = 8;
constexpr double        kLossChance   = 0.25;
constexpr std::uint64_t kLossSeed     = 42;

template <class T, class E>
T unwrap(pulse_detail::expected<T, E>&& r, const char* what) {
  if (!r) {
    std::cerr << "pulse_router: " << what << " failed: " << to_string(r.error()) << "\n";
    std::exit(EXIT_FAILURE);
  }
  return std::move(*r);
}

} // namespace

int main() {
  using namespace pulse;
  using flow::in;
  using flow::out;

  auto cfg = unwrap(config::Loader::from_env(), "config");

  auto ingress_ch = unwrap(processors::PacketChannel::create(kChannelDepth), "ingress channel");
  auto egress_ch  = unwrap(processors::PacketChannel::create(kChannelDepth), "egress channel");

  flow::GraphBuilder b(cfg);
  const auto ingress = b.add(unwrap(processors::ChannelSource::create("ingress", ingress_ch, /*ingress_port=*/1), "ingress"));
  const auto classify = b.add(unwrap(
      processors::Classify::create("classify", 2, processors::tag_equals("udp")), "classify"));
  const auto hop = b.add(unwrap(processors::Transform::create(
      "hop",
      [](mem::Packet&& p) -> std::optional<mem::Packet> {
        auto& ttl = p.meta().annotations[1];
        if (ttl == 0) ttl = kInitialTtl;
        if (--ttl == 0) return std::nullopt;
        return std::move(p);
      }), "hop"));
  const auto lossy = b.add(unwrap(processors::Drop::create("lossy", kLossChance, kLossSeed), "lossy"));
  const auto join  = b.add(unwrap(processors::Join::create("join", 2), "join"));
  const auto egress = b.add(unwrap(processors::ChannelSink::create("egress", egress_ch), "egress"));

  unwrap(b.connect(out(ingress), in(classify)), "connect ingress");
  unwrap(b.connect(out(classify, 0), in(hop)), "connect classify:0");
  unwrap(b.connect(out(classify, 1), in(lossy)), "connect classify:1");
  unwrap(b.connect(out(hop), in(join, 0)), "connect hop");
  unwrap(b.connect(out(lossy), in(join, 1)), "connect lossy");
  unwrap(b.connect(out(join), in(egress)), "connect join");
  auto graph = unwrap(b.build(), "build");

  std::cout << "pulse_router " << version_string << ": " << graph->processor_count()
            << " processors, " << graph->link_count() << " links, "
            << cfg.resolved_workers() << " workers\n";

  std::thread feeder([&] {
    for (std::uint64_t i = 0; i < kPackets; ++i) {
      if (!ingress_ch->send(mem::make_packet(i, i % 3 == 0 ? "tcp" : "udp"))) break;
    }
    ingress_ch->close();
  });

  std::uint64_t delivered = 0;
  std::thread reader([&] {
    while (egress_ch->recv()) ++delivered;
  });

  flow::Scheduler sched(cfg);
  graph->spawn(sched);
  sched.join();

  feeder.join();
  reader.join();

  const auto stats = graph->stats();
  std::cout << "sent=" << kPackets << " delivered=" << delivered << "\n";
  for (const auto& p : stats.processors) {
    std::cout << "  " << p.name << " [" << flow::to_string(p.kind) << "] "
              << flow::to_string(p.state) << " dropped=" << p.dropped << "\n";
  }
  for (const auto& l : stats.links) {
    std::cout << "  link " << l.id << ": pushed=" << l.pushed << " pulled=" << l.pulled
              << " full=" << l.full_events << " dropped=" << l.dropped << "\n";
  }
  const auto s = sched.stats();
  std::cout << "polls=" << s.polls << " yields=" << s.yields << std::endl;
  return 0;
}
