/**
 * @file link_bench.cpp
 * @brief Microbenchmark for flow::Link (1 producer thread / 1 consumer thread).
 *
 * Measures throughput of try_push/try_pull pairs for empty packets and for
 * packets carrying a 64-byte payload, at two link capacities.
 *
 * Reports: packets/sec, ns per packet, and how often the producer saw Full.
 */

#include <atomic>
#include <barrier>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "pulse/flow/link.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

struct Result {
  std::string   name;              // e.g., "empty@1024"
  std::size_t   N = 0;             // packets transferred
  double        seconds = 0.0;
  double        packets_per_s = 0.0;
  double        ns_per_packet = 0.0;
  std::uint64_t full_events = 0;
};

inline void backoff() noexcept {
  std::this_thread::yield();
}

Result run_one(std::string name, std::size_t capacity, std::size_t N, std::size_t payload) {
  auto lexp = pulse::flow::Link::create(0, capacity, "packet");
  if (!lexp) {
    std::cerr << "Failed to create Link with capacity " << capacity << "\n";
    std::exit(EXIT_FAILURE);
  }
  auto& link = **lexp;
  link.attach_producer({0, 0});
  link.attach_consumer({1, 0});

  std::barrier sync(2);
  clock::time_point t_start, t_end;

  std::thread prod([&] {
    sync.arrive_and_wait();
    for (std::size_t i = 0; i < N;) {
      pulse::mem::Packet p = pulse::mem::make_packet(i, {}, std::vector<std::uint8_t>(payload));
      while (link.try_push(std::move(p)) == pulse::flow::PushStatus::Full) backoff();
      ++i;
    }
    link.close_producer();
  });

  std::thread cons([&] {
    sync.arrive_and_wait();
    t_start = clock::now();
    pulse::mem::Packet p;
    for (;;) {
      const auto st = link.try_pull(p);
      if (st == pulse::flow::PullStatus::Closed) break;
      if (st == pulse::flow::PullStatus::Empty) backoff();
    }
    t_end = clock::now();
  });

  prod.join();
  cons.join();

  const double seconds = std::chrono::duration_cast<ns>(t_end - t_start).count() / 1e9;
  Result r;
  r.name          = std::move(name);
  r.N             = N;
  r.seconds       = seconds;
  r.packets_per_s = (seconds > 0.0) ? (static_cast<double>(N) / seconds) : 0.0;
  r.ns_per_packet = (r.packets_per_s > 0.0) ? 1e9 / r.packets_per_s : 0.0;
  r.full_events   = link.stats().full_events;
  return r;
}

inline void print(const Result& r) {
  std::cout << std::fixed << std::setprecision(2)
            << std::left << std::setw(18) << r.name
            << "  N=" << std::setw(9) << r.N
            << "  time=" << std::setw(8) << r.seconds << " s"
            << "  pkts/s=" << std::setw(12) << r.packets_per_s
            << "  ns/pkt=" << std::setw(10) << r.ns_per_packet
            << "  full=" << r.full_events
            << '\n';
}

} // namespace bench

int main() {
  constexpr std::size_t N = 1'000'000;
  const std::vector<std::size_t> caps = {16, 1024};

  std::cout << "Link 1P/1C microbenchmark (try_push/try_pull)\n";
  std::cout << "----------------------------------------------------------\n";

  for (auto cap : caps) {
    bench::print(bench::run_one("empty@" + std::to_string(cap), cap, N, 0));
    bench::print(bench::run_one("64B@" + std::to_string(cap), cap, N, 64));
  }

  std::cout << std::flush;
  return 0;
}
