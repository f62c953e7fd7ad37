#pragma once
/**
 * @file link.hpp
 * @brief Bounded single-producer/single-consumer edge between two ports.
 *
 * A Link owns its ring and both wake slots and exposes no handle to the
 * ring itself, so the one-producer/one-consumer rule is enforced here:
 *  - attach_producer()/attach_consumer() may each succeed once;
 *  - try_push()/try_pull() detect overlapping callers on the same end.
 * Breaking either rule is an InvariantViolation and aborts the process.
 *
 * Ordering: FIFO. Closed is reported to the consumer only after the producer
 * closed *and* every queued packet was pulled.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "pulse/compat/expected.hpp"
#include "pulse/flow/status.hpp"
#include "pulse/flow/waker.hpp"
#include "pulse/mem/packet.hpp"
#include "pulse/mem/spsc_queue.hpp"

namespace pulse::flow {

/// @brief One end of a link: the processor and its port index.
struct LinkEnd {
  ProcessorId node{kNoProcessor};
  std::size_t port{0};
};

/// @brief Point-in-time counters of a link (for operational observers).
struct LinkStats {
  LinkId        id{kNoLink};
  LinkEnd       producer{};
  LinkEnd       consumer{};
  std::size_t   capacity{0};
  std::size_t   depth{0};          ///< Approximate queued packets
  std::uint64_t pushed{0};
  std::uint64_t pulled{0};
  std::uint64_t dropped{0};        ///< Discarded because the link closed under them
  std::uint64_t full_events{0};    ///< try_push calls answered Full
  bool          producer_closed{false};
  bool          consumer_closed{false};
};

class Link final {
public:
  /**
   * @brief Factory (setup time only).
   * @param id Arena index assigned by the graph.
   * @param capacity Bounded queue capacity, >= 1.
   * @param type Element-type tag shared by both ports.
   */
  static pulse_detail::expected<std::unique_ptr<Link>, mem::SpscError>
  create(LinkId id, std::size_t capacity, std::string type);

  Link(const Link&)            = delete;
  Link& operator=(const Link&) = delete;

  // ---------------------------- Wiring -----------------------------------
  /// @brief Bind the producer end. A second bind aborts.
  void attach_producer(LinkEnd end) noexcept;
  /// @brief Bind the consumer end. A second bind aborts.
  void attach_consumer(LinkEnd end) noexcept;

  const LinkEnd& producer() const noexcept { return producer_; }
  const LinkEnd& consumer() const noexcept { return consumer_; }

  // ---------------------------- Producer side -----------------------------
  /**
   * @brief Non-blocking enqueue.
   * @param p Moved from only when Accepted.
   */
  PushStatus try_push(mem::Packet&& p) noexcept;

  /**
   * @brief Register for "space available".
   * @return false when nothing was parked because space already exists or the
   *         consumer is gone; the caller retries try_push instead of sleeping.
   */
  bool park_producer(const Waker& w);

  /// @brief Producer will never push again; wakes the consumer.
  void close_producer() noexcept;

  /// @brief Account packets the producer discarded after seeing Closed.
  void count_dropped(std::uint64_t n) noexcept;

  // ---------------------------- Consumer side -----------------------------
  /**
   * @brief Non-blocking dequeue.
   * @param out Receives the packet when Ready.
   */
  PullStatus try_pull(mem::Packet& out) noexcept;

  /**
   * @brief Register for "data available".
   * @return false when nothing was parked because data is queued or the
   *         producer closed; the caller retries try_pull instead of sleeping.
   */
  bool park_consumer(const Waker& w);

  /**
   * @brief Consumer will never pull again: drops queued packets and wakes the producer.
   * @return Number of packets dropped by the drain.
   */
  std::size_t close_consumer() noexcept;

  // ---------------------------- Observers ---------------------------------
  LinkId             id() const noexcept { return id_; }
  std::size_t        capacity() const noexcept { return ring_.capacity(); }
  std::size_t        depth() const noexcept { return ring_.approx_size(); }
  const std::string& type() const noexcept { return type_; }
  bool producer_closed() const noexcept { return producer_closed_.load(std::memory_order_acquire); }
  bool consumer_closed() const noexcept { return consumer_closed_.load(std::memory_order_acquire); }

  /// @brief Observer that receives this link's InvariantViolation (setup time only).
  void report_to(obs::Observer* observer) noexcept { observer_ = observer; }
  LinkStats stats() const noexcept;

private:
  Link(LinkId id, mem::SpscQueue<mem::Packet> ring, std::string type) noexcept;

  /// @brief RAII claim of one end; aborts if another caller is inside.
  class EndGuard;

  LinkId                      id_;
  std::string                 type_;
  LinkEnd                     producer_{};
  LinkEnd                     consumer_{};
  mem::SpscQueue<mem::Packet> ring_;
  obs::Observer*              observer_{nullptr};   ///< nullptr: the simple observer

  std::atomic<bool> producer_closed_{false};
  std::atomic<bool> consumer_closed_{false};
  std::atomic<bool> in_push_{false};
  std::atomic<bool> in_pull_{false};

  TaskPark data_park_;   ///< Consumer waits here for data
  TaskPark space_park_;  ///< Producer waits here for space

  std::atomic<std::uint64_t> pushed_{0};
  std::atomic<std::uint64_t> pulled_{0};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::uint64_t> full_events_{0};
};

} // namespace pulse::flow
