/**
 * @file test_mem.cpp
 * @brief Tests for SpscQueue<T> (exact capacity, move-only payloads) and Packet.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

#include "pulse/mem/packet.hpp"
#include "pulse/mem/spsc_queue.hpp"

using pulse::mem::Packet;
using pulse::mem::SpscError;
using pulse::mem::SpscQueue;
using pulse::mem::make_packet;

// ---------- SpscQueue ----------

TEST(SpscQueue, WithCapacity_Validation) {
  auto bad0 = SpscQueue<int>::with_capacity(0);
  ASSERT_FALSE(bad0.has_value());
  EXPECT_EQ(bad0.error(), SpscError::CapacityZero);

  auto odd = SpscQueue<int>::with_capacity(100);
  ASSERT_TRUE(odd);
  EXPECT_EQ(odd->capacity(), 100u);

  auto ok = SpscQueue<int>::with_capacity(1024);
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok->capacity(), 1024u);
}

TEST(SpscQueue, SingleThread_Basics) {
  constexpr std::size_t CAP = 7;
  auto qexp = SpscQueue<int>::with_capacity(CAP);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);

  // fill exactly CAP
  for (int i = 0; i < int(CAP); ++i) EXPECT_TRUE(q.push(i));
  EXPECT_TRUE(q.full());
  EXPECT_FALSE(q.push(999));

  // pop 3
  for (int i = 0; i < 3; ++i) {
    int v{};
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, i);
  }

  // push 3 (wrap)
  for (int i = 100; i < 103; ++i) EXPECT_TRUE(q.push(i));
  EXPECT_FALSE(q.push(999));

  // drain & check order
  std::vector<int> out;
  int v{};
  while (q.pop(v)) out.push_back(v);
  std::vector<int> expected = {3,4,5,6,100,101,102};
  EXPECT_EQ(out, expected);
  EXPECT_TRUE(q.empty());
}

/**
 * @test SpscQueue_CapacityOne
 * @brief The smallest queue alternates strictly between full and empty.
 */
TEST(SpscQueue, CapacityOne) {
  auto qexp = SpscQueue<int>::with_capacity(1);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);

  for (int i = 0; i < 5; ++i) {
    EXPECT_TRUE(q.empty());
    EXPECT_TRUE(q.push(i));
    EXPECT_TRUE(q.full());
    EXPECT_FALSE(q.push(-1));
    int v{};
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, i);
  }
}

TEST(SpscQueue, FullPush_LeavesValueUntouched) {
  auto qexp = SpscQueue<std::unique_ptr<int>>::with_capacity(1);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);

  ASSERT_TRUE(q.push(std::make_unique<int>(1)));
  auto keep = std::make_unique<int>(2);
  EXPECT_FALSE(q.push(std::move(keep)));
  ASSERT_TRUE(keep);
  EXPECT_EQ(*keep, 2);
}

TEST(SpscQueue, ProducerConsumer_Concurrent) {
  constexpr std::size_t CAP = 1000, N = 50000;
  auto qexp = SpscQueue<std::uint32_t>::with_capacity(CAP);
  ASSERT_TRUE(qexp);
  auto q = std::make_shared<SpscQueue<std::uint32_t>>(std::move(*qexp));

  std::atomic<std::size_t> consumed{0};
  std::thread prod([&]{
    for (std::size_t i = 0; i < N;) {
      if (q->push(static_cast<std::uint32_t>(i))) ++i;
      else std::this_thread::yield();
    }
  });
  std::vector<std::uint32_t> out; out.reserve(N);
  std::thread cons([&]{
    std::uint32_t v{};
    while (consumed.load(std::memory_order_relaxed) < N) {
      if (q->pop(v)) { out.push_back(v); consumed.fetch_add(1, std::memory_order_relaxed); }
      else std::this_thread::yield();
    }
  });
  prod.join(); cons.join();

  ASSERT_EQ(out.size(), N);
  for (std::size_t i = 0; i < N; ++i) EXPECT_EQ(out[i], i);
  EXPECT_TRUE(q->empty());
}

/**
 * @test SpscQueue_MoveOnly_ProducerConsumer
 * @brief Packets (move-only) cross threads in order and arrive intact.
 */
TEST(SpscQueue, MoveOnly_ProducerConsumer) {
  constexpr std::size_t CAP = 256;
  constexpr std::size_t N   = 10000;

  auto qexp = SpscQueue<Packet>::with_capacity(CAP);
  ASSERT_TRUE(qexp);
  auto q = std::make_shared<SpscQueue<Packet>>(std::move(*qexp));

  std::thread prod([&]{
    for (std::size_t i = 0; i < N; ) {
      Packet p = make_packet(i, "t", {static_cast<std::uint8_t>(i & 0xff)});
      if (q->push(std::move(p))) ++i;
      else std::this_thread::yield();
    }
  });

  std::vector<std::uint64_t> seqs;
  seqs.reserve(N);
  bool payload_ok = true;
  std::thread cons([&]{
    Packet p;
    while (seqs.size() < N) {
      if (q->pop(p)) {
        payload_ok = payload_ok && p.size() == 1 &&
                     p.payload()[0] == static_cast<std::uint8_t>(p.meta().seq & 0xff);
        seqs.push_back(p.meta().seq);
      } else {
        std::this_thread::yield();
      }
    }
  });

  prod.join();
  cons.join();

  ASSERT_EQ(seqs.size(), N);
  for (std::size_t i = 0; i < N; ++i) EXPECT_EQ(seqs[i], i);
  EXPECT_TRUE(payload_ok);
  EXPECT_TRUE(q->empty());
}

// ---------- Packet ----------

TEST(Packet, MakePacket_FillsMeta) {
  const auto before = std::chrono::steady_clock::now();
  Packet p = make_packet(42, "udp", {1, 2, 3});
  EXPECT_EQ(p.meta().seq, 42u);
  EXPECT_EQ(p.meta().tag, "udp");
  EXPECT_EQ(p.size(), 3u);
  EXPECT_GE(p.meta().ingress_time, before);
  for (auto a : p.meta().annotations) EXPECT_EQ(a, 0u);
}

/**
 * @test Packet_Clone_IsDeep
 * @brief clone() copies payload and metadata; later edits do not leak across.
 */
TEST(Packet, Clone_IsDeep) {
  Packet a = make_packet(7, "x", {9, 9});
  a.meta().annotations[2] = 5;
  Packet b = a.clone();

  b.payload()[0]          = 1;
  b.meta().tag            = "y";
  b.meta().annotations[2] = 6;

  EXPECT_EQ(a.payload()[0], 9);
  EXPECT_EQ(a.meta().tag, "x");
  EXPECT_EQ(a.meta().annotations[2], 5u);
  EXPECT_EQ(b.meta().seq, 7u);
}

TEST(Packet, Move_TransfersOwnership) {
  Packet a = make_packet(1, {}, {1, 2, 3, 4});
  Packet b = std::move(a);
  EXPECT_EQ(b.size(), 4u);
  static_assert(!std::is_copy_constructible_v<Packet>);
  static_assert(std::is_nothrow_move_constructible_v<Packet>);
}
