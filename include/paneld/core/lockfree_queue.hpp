#pragma once

#include <atomic>
#include <bit>
#include <concepts>
#include <cstddef>
#include <memory>
#include <new>
#include <optional>

namespace paneld {

inline constexpr std::size_t kCacheLineSize =
#ifdef __cpp_lib_hardware_interference_size
    std::hardware_destructive_interference_size;
#else
    64;
#endif

template <typename T>
concept QueueElement = std::movable<T> && std::destructible<T>;

struct MPSCNode {
  std::atomic<MPSCNode*> next{nullptr};
};

template <typename T>
concept MPSCNodeDerived = std::derived_from<T, MPSCNode>;

// Unbounded intrusive queue behind the command channel (Vyukov). Any thread
// may push; exactly one thread may pop. try_pop can miss a node whose push is
// still in flight, so the channel keeps its own pending counter.
// Nodes are owned by whoever pushed them until they are popped.
template <MPSCNodeDerived T>
class MPSCQueue {
public:
  MPSCQueue() {
    head_.store(&stub_, std::memory_order_relaxed);
    tail_.store(&stub_, std::memory_order_relaxed);
  }

  MPSCQueue(const MPSCQueue&) = delete;
  MPSCQueue& operator=(const MPSCQueue&) = delete;

  auto push(T* node) noexcept -> void {
    push_node(node);
  }

  [[nodiscard]] auto try_pop() noexcept -> T* {
    auto* tail = tail_.load(std::memory_order_relaxed);
    auto* next = tail->next.load(std::memory_order_acquire);

    if (tail == &stub_) {
      if (!next)
        return nullptr;
      tail_.store(next, std::memory_order_relaxed);
      tail = next;
      next = tail->next.load(std::memory_order_acquire);
    }

    if (next) {
      tail_.store(next, std::memory_order_relaxed);
      return static_cast<T*>(tail);
    }

    auto* head = head_.load(std::memory_order_acquire);
    if (tail != head)
      return nullptr;

    push_node(&stub_);

    next = tail->next.load(std::memory_order_acquire);
    if (next) {
      tail_.store(next, std::memory_order_relaxed);
      return static_cast<T*>(tail);
    }
    return nullptr;
  }

  // Pops every node currently reachable and hands it to fn.
  template <typename Fn>
    requires std::invocable<Fn&, T*>
  auto drain(Fn&& fn) -> std::size_t {
    std::size_t count = 0;
    while (auto* node = try_pop()) {
      fn(node);
      ++count;
    }
    return count;
  }

private:
  auto push_node(MPSCNode* node) noexcept -> void {
    node->next.store(nullptr, std::memory_order_relaxed);
    auto* prev = head_.exchange(node, std::memory_order_acq_rel);
    prev->next.store(node, std::memory_order_release);
  }

  alignas(kCacheLineSize) std::atomic<MPSCNode*> head_;
  alignas(kCacheLineSize) std::atomic<MPSCNode*> tail_;
  MPSCNode stub_;
};

// Fixed-capacity ring of sequenced slots (Vyukov). Used where a full queue
// has a cheap fallback: the logger prints synchronously, a shard spins.
template <QueueElement T>
class BoundedMPSCQueue {
public:
  explicit BoundedMPSCQueue(std::size_t capacity)
      : capacity_(std::bit_ceil(capacity)),
        mask_(capacity_ - 1),
        slots_(std::make_unique<Slot[]>(capacity_)) {
    for (std::size_t i = 0; i < capacity_; ++i)
      slots_[i].seq.store(i, std::memory_order_relaxed);
  }

  ~BoundedMPSCQueue() {
    drain([](T&&) {});
  }

  BoundedMPSCQueue(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue& operator=(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue(BoundedMPSCQueue&&) = delete;
  BoundedMPSCQueue& operator=(BoundedMPSCQueue&&) = delete;

  [[nodiscard]] auto push(T value) noexcept -> bool {
    auto pos = head_.load(std::memory_order_relaxed);
    for (;;) {
      auto& slot = slots_[pos & mask_];
      auto seq = slot.seq.load(std::memory_order_acquire);
      auto diff =
          static_cast<std::ptrdiff_t>(seq) - static_cast<std::ptrdiff_t>(pos);

      if (diff == 0) {
        if (head_.compare_exchange_weak(pos, pos + 1,
                                        std::memory_order_acq_rel,
                                        std::memory_order_relaxed)) {
          std::construct_at(slot.ptr(), std::move(value));
          slot.seq.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false;
      } else {
        pos = head_.load(std::memory_order_relaxed);
      }
    }
  }

  [[nodiscard]] auto try_pop() noexcept -> std::optional<T> {
    auto pos = tail_.load(std::memory_order_relaxed);
    auto& slot = slots_[pos & mask_];
    auto seq = slot.seq.load(std::memory_order_acquire);

    if (seq == pos + 1) {
      T value = std::move(*slot.ptr());
      std::destroy_at(slot.ptr());
      slot.seq.store(pos + capacity_, std::memory_order_release);
      tail_.store(pos + 1, std::memory_order_relaxed);
      return value;
    }
    return std::nullopt;
  }

  template <typename Fn>
    requires std::invocable<Fn&, T&&>
  auto drain(Fn&& fn) -> std::size_t {
    std::size_t count = 0;
    while (auto value = try_pop()) {
      fn(std::move(*value));
      ++count;
    }
    return count;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

private:
  struct Slot {
    std::atomic<std::size_t> seq;
    alignas(T) std::byte storage[sizeof(T)];

    auto ptr() noexcept -> T* {
      return std::launder(reinterpret_cast<T*>(storage));
    }
  };

  std::size_t capacity_;
  std::size_t mask_;
  std::unique_ptr<Slot[]> slots_;
  alignas(kCacheLineSize) std::atomic<std::size_t> head_{0};
  alignas(kCacheLineSize) std::atomic<std::size_t> tail_{0};
};

}  // namespace paneld
