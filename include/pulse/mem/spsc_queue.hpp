/**
 * @file spsc_queue.hpp
 * @brief Bounded single-producer/single-consumer ring buffer (owning, RT-friendly).
 *
 * Design goals:
 *  - Exception-free hot path (push/pop return bool).
 *  - One-time allocation during setup via factory; no allocations after.
 *  - Minimal synchronization: acquire/release pairs for SPSC.
 *  - Indices padded to avoid false sharing in RT workloads.
 *  - Exact logical capacity: a queue built for N holds N elements (no open slot).
 *
 * Indices are free-running counters; the backing ring is rounded up to a
 * power-of-two so slot lookup stays a mask, while fullness is judged against
 * the logical capacity.
 *
 * @tparam T Element type. Must be default-constructible and nothrow-movable.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "pulse/compat/expected.hpp"  // pulse_detail::expected / unexpected

namespace pulse::mem {

/// Cache line size hint (adjust per platform if needed).
inline constexpr std::size_t kCacheLine = 64;

/**
 * @brief Error codes reported by the factory (setup time only).
 * These errors are never produced during hot path operations.
 */
enum class SpscError : std::uint8_t {
  CapacityZero = 1,          ///< Capacity must not be zero
  CapacityTooLarge,          ///< Rounded ring size would overflow size_t
  AllocationFailed           ///< Ring allocation failed
};

/// @brief Trait to constrain element types for RT-safety.
template <class T>
struct SpscTraits {
  static constexpr bool ok =
    std::is_default_constructible_v<T> &&
    (std::is_trivially_copyable_v<T> || std::is_nothrow_move_assignable_v<T>);
};

/// @brief Smallest power of two >= n (n > 0), or 0 on overflow.
constexpr std::size_t ceil_pow2(std::size_t n) noexcept {
  std::size_t p = 1;
  while (p < n) {
    if (p > (static_cast<std::size_t>(-1) >> 1)) return 0;
    p <<= 1;
  }
  return p;
}

/**
 * @brief Single-producer, single-consumer bounded ring buffer (owning).
 *
 * @tparam T Element type.
 */
template <class T>
class SpscQueue final {
  static_assert(std::atomic<std::size_t>::is_always_lock_free,
                "std::atomic<size_t> must be lock-free on this target");
  static_assert(SpscTraits<T>::ok,
                "SpscQueue<T>: T must be default-constructible and nothrow-movable");

public:
  using value_type = T;

  /// @brief Default-constructed empty shell (use with factory).
  SpscQueue() noexcept = default;

  /**
   * @brief Factory: validates input and allocates once (no exceptions).
   * @param capacity Logical capacity, >= 1. Any value is accepted.
   * @return expected<SpscQueue, SpscError> constructed queue or error.
   */
  static pulse_detail::expected<SpscQueue, SpscError>
  with_capacity(std::size_t capacity) noexcept {
    if (capacity == 0) {
      return pulse_detail::unexpected<SpscError>(SpscError::CapacityZero);
    }
    const std::size_t ring = ceil_pow2(capacity);
    if (ring == 0) {
      return pulse_detail::unexpected<SpscError>(SpscError::CapacityTooLarge);
    }

    std::unique_ptr<T[]> storage(new (std::nothrow) T[ring]());
    if (!storage) {
      return pulse_detail::unexpected<SpscError>(SpscError::AllocationFailed);
    }

    SpscQueue q;
    q.capacity_ = capacity;
    q.mask_     = ring - 1;
    q.storage_  = std::move(storage);
    return q;
  }

  SpscQueue(const SpscQueue&)            = delete; ///< Non-copyable
  SpscQueue& operator=(const SpscQueue&) = delete; ///< Non-assignable

  /// @brief Move constructor (setup only; never while producer/consumer run).
  SpscQueue(SpscQueue&& other) noexcept { move_from(std::move(other)); }

  /// @brief Move assignment (setup only; never while producer/consumer run).
  SpscQueue& operator=(SpscQueue&& other) noexcept {
    if (this != &other) move_from(std::move(other));
    return *this;
  }

  /**
   * @brief Push by rvalue reference.
   * @param v Element to move. Left untouched when the queue is full.
   * @return false if queue is full.
   */
  bool push(T&& v) noexcept {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    if (t - head_.load(std::memory_order_acquire) >= capacity_) {
      return false; // full
    }
    storage_[t & mask_] = std::move(v);
    tail_.store(t + 1, std::memory_order_release);
    return true;
  }

  /**
   * @brief Push by const reference.
   * @param v Element to copy.
   * @return false if queue is full.
   */
  template <class U = T, class = std::enable_if_t<std::is_copy_assignable_v<U>>>
  bool push(const T& v) noexcept(std::is_nothrow_copy_assignable_v<T>) {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    if (t - head_.load(std::memory_order_acquire) >= capacity_) {
      return false; // full
    }
    storage_[t & mask_] = v;
    tail_.store(t + 1, std::memory_order_release);
    return true;
  }

  /**
   * @brief Pop one element into output.
   * @param out Destination reference to receive the element.
   * @return false if queue is empty.
   */
  bool pop(T& out) noexcept {
    const std::size_t h = head_.load(std::memory_order_relaxed);
    if (h == tail_.load(std::memory_order_acquire)) {
      return false; // empty
    }
    out = std::move(storage_[h & mask_]);
    storage_[h & mask_] = T{};  // release resources held by the moved-from slot
    head_.store(h + 1, std::memory_order_release);
    return true;
  }

  /// @brief True if queue is empty (observer).
  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

  /// @brief True if queue is full (observer).
  bool full() const noexcept {
    return approx_size() >= capacity_;
  }

  /// @brief Logical capacity.
  std::size_t capacity() const noexcept { return capacity_; }

  /// @brief Approximate size (not linearizable across threads).
  std::size_t approx_size() const noexcept {
    const auto h = head_.load(std::memory_order_acquire);
    const auto t = tail_.load(std::memory_order_acquire);
    return t - h;
  }

private:
  /// @brief Helper to implement noexcept move.
  void move_from(SpscQueue&& other) noexcept {
    head_.store(other.head_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    tail_.store(other.tail_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    capacity_ = other.capacity_;
    mask_     = other.mask_;
    storage_  = std::move(other.storage_);
    other.capacity_ = 0;
    other.mask_ = 0;
  }

  // Producer/consumer indices on separate cache lines (avoid false sharing)
  alignas(kCacheLine) std::atomic<std::size_t> head_{0}; ///< Consumer counter
  alignas(kCacheLine) std::atomic<std::size_t> tail_{0}; ///< Producer counter

  // Read-mostly metadata and owning storage
  alignas(kCacheLine) std::size_t capacity_ = 0;  ///< Logical capacity
  std::size_t                     mask_     = 0;  ///< ring size - 1
  std::unique_ptr<T[]>            storage_{};     ///< Owning ring
};

} // namespace pulse::mem
