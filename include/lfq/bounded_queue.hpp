#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>
#include "errors.hpp"
#include "slot.hpp"
#include "utils.hpp"

namespace lfq {

// Multi-Producer / Multi-Consumer bounded ring with stamped slots.
//
// head_ and tail_ hold `lap + index`, where one lap is the smallest power of
// two greater than the capacity. Full and empty are reported immediately;
// the only retries are over lost CAS races or a neighbour still finishing
// its slot.
template <class T>
class BoundedQueue {
    static_assert(std::is_nothrow_move_constructible_v<T>,
                  "BoundedQueue requires a nothrow move constructible element type");

public:
    explicit BoundedQueue(std::size_t capacity)
        : capacity_(checked_capacity(capacity)),
          one_lap_(next_pow2(capacity_ + 1)),
          slots_(static_cast<Slot<T>*>(::operator new[](capacity_ * sizeof(Slot<T>)))),
          head_(0), tail_(0)
    {
        for (std::size_t i = 0; i < capacity_; ++i) {
            new (&slots_[i]) Slot<T>();
            slots_[i].stamp.store(i, RELAXED);
        }
    }

    ~BoundedQueue() {
        const std::size_t head = head_.load(RELAXED);
        const std::size_t hix = head & (one_lap_ - 1);
        const std::size_t n = size();
        for (std::size_t i = 0; i < n; ++i) {
            const std::size_t index = (hix + i < capacity_) ? hix + i : hix + i - capacity_;
            slots_[index].ptr()->~T();
        }
        for (std::size_t i = 0; i < capacity_; ++i) {
            slots_[i].~Slot<T>();
        }
        ::operator delete[](slots_);
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    std::size_t capacity() const noexcept { return capacity_; }

    // -------- Single-item ops --------

    // Returns false if the queue is full; `value` is then left untouched.
    bool try_push(T&& value) noexcept { return push_impl(std::move(value)); }

    bool try_push(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>) {
        if constexpr (std::is_nothrow_copy_constructible_v<T>) {
            return push_impl(value);
        } else {
            T copy(value);
            return push_impl(std::move(copy));
        }
    }

    template <class... Args>
    bool try_emplace(Args&&... args) {
        T value(std::forward<Args>(args)...);
        return push_impl(std::move(value));
    }

    std::optional<T> try_pop() noexcept {
        Backoff backoff;
        std::size_t head = head_.load(RELAXED);
        for (;;) {
            Slot<T>& s = slots_[head & (one_lap_ - 1)];
            const std::size_t stamp = s.stamp.load(ACQUIRE);
            if (head + 1 == stamp) {
                if (head_.compare_exchange_weak(head, advance(head), SEQ_CST, RELAXED)) {
                    std::optional<T> out(std::move(*s.ptr()));
                    s.ptr()->~T();
                    s.stamp.store(head + one_lap_, RELEASE);
                    return out;
                }
                backoff.spin();
            } else if (stamp == head) {
                std::atomic_thread_fence(SEQ_CST);
                const std::size_t tail = tail_.load(RELAXED);
                if (tail == head) return std::nullopt; // empty
                backoff.spin();
                head = head_.load(RELAXED);
            } else {
                // head_ is stale, or this slot's previous occupant is still in flight.
                backoff.snooze();
                head = head_.load(RELAXED);
            }
        }
    }

    bool try_pop(T& out) {
        std::optional<T> value = try_pop();
        if (!value) return false;
        out = std::move(*value);
        return true;
    }

    // -------- Batched ops --------

    // Claims a contiguous run of free slots with one CAS and copies into it.
    // Returns how many were accepted; 0 when full or when the next slot is still busy.
    std::size_t try_push_many(const T* data, std::size_t n) noexcept {
        static_assert(std::is_nothrow_copy_constructible_v<T>,
                      "try_push_many copies elements and requires a nothrow copy constructor");
        if (n == 0) return 0;
        Backoff backoff;
        for (;;) {
            std::size_t start = tail_.load(RELAXED);
            std::size_t pos = start;
            std::size_t free = 0;
            while (free < n && free < capacity_) {
                if (slots_[pos & (one_lap_ - 1)].stamp.load(ACQUIRE) != pos) break;
                pos = advance(pos);
                ++free;
            }
            if (free == 0) return 0;

            if (tail_.compare_exchange_weak(start, pos, SEQ_CST, RELAXED)) {
                pos = start;
                for (std::size_t i = 0; i < free; ++i) {
                    Slot<T>& s = slots_[pos & (one_lap_ - 1)];
                    new (s.ptr()) T(data[i]);
                    s.stamp.store(pos + 1, RELEASE);
                    pos = advance(pos);
                }
                return free;
            }
            backoff.spin();
        }
    }

    // Claims the run of ready slots at the head with one CAS and moves them out.
    std::size_t try_pop_many(T* out, std::size_t n) noexcept {
        static_assert(std::is_nothrow_move_assignable_v<T>,
                      "try_pop_many move-assigns into `out` and requires it to be nothrow");
        if (n == 0) return 0;
        Backoff backoff;
        for (;;) {
            std::size_t start = head_.load(RELAXED);
            std::size_t pos = start;
            std::size_t ready = 0;
            while (ready < n && ready < capacity_) {
                if (slots_[pos & (one_lap_ - 1)].stamp.load(ACQUIRE) != pos + 1) break;
                pos = advance(pos);
                ++ready;
            }
            if (ready == 0) return 0;

            if (head_.compare_exchange_weak(start, pos, SEQ_CST, RELAXED)) {
                pos = start;
                for (std::size_t i = 0; i < ready; ++i) {
                    Slot<T>& s = slots_[pos & (one_lap_ - 1)];
                    T* p = s.ptr();
                    out[i] = std::move(*p);
                    p->~T();
                    s.stamp.store(pos + one_lap_, RELEASE);
                    pos = advance(pos);
                }
                return ready;
            }
            backoff.spin();
        }
    }

    // -------- Snapshots (best effort under concurrency) --------

    std::size_t size() const noexcept {
        for (;;) {
            const std::size_t tail = tail_.load(SEQ_CST);
            const std::size_t head = head_.load(SEQ_CST);
            if (tail_.load(SEQ_CST) != tail) continue;

            const std::size_t hix = head & (one_lap_ - 1);
            const std::size_t tix = tail & (one_lap_ - 1);
            if (hix < tix) return tix - hix;
            if (hix > tix) return capacity_ - hix + tix;
            return (tail == head) ? 0 : capacity_;
        }
    }

    bool empty() const noexcept {
        const std::size_t tail = tail_.load(SEQ_CST);
        const std::size_t head = head_.load(SEQ_CST);
        return tail == head;
    }

    bool full() const noexcept {
        const std::size_t tail = tail_.load(SEQ_CST);
        const std::size_t head = head_.load(SEQ_CST);
        return head + one_lap_ == tail;
    }

private:
    static std::size_t checked_capacity(std::size_t capacity) {
        constexpr std::size_t kMax = (std::numeric_limits<std::size_t>::max() >> 1) / sizeof(Slot<T>);
        if (capacity == 0 || capacity > kMax) throw InvalidCapacity(capacity);
        return capacity;
    }

    template <class U>
    bool push_impl(U&& value) noexcept {
        Backoff backoff;
        std::size_t tail = tail_.load(RELAXED);
        for (;;) {
            Slot<T>& s = slots_[tail & (one_lap_ - 1)];
            const std::size_t stamp = s.stamp.load(ACQUIRE);
            if (tail == stamp) {
                if (tail_.compare_exchange_weak(tail, advance(tail), SEQ_CST, RELAXED)) {
                    new (s.ptr()) T(std::forward<U>(value));
                    s.stamp.store(tail + 1, RELEASE);
                    return true;
                }
                backoff.spin();
            } else if (stamp + one_lap_ == tail + 1) {
                std::atomic_thread_fence(SEQ_CST);
                const std::size_t head = head_.load(RELAXED);
                if (head + one_lap_ == tail) return false; // full
                backoff.spin();
                tail = tail_.load(RELAXED);
            } else {
                // tail_ is stale, or a producer from the previous lap has not published yet.
                backoff.snooze();
                tail = tail_.load(RELAXED);
            }
        }
    }

    // Next logical position; wraps to index 0 of the next lap at the ring boundary.
    std::size_t advance(std::size_t pos) const noexcept {
        const std::size_t index = pos & (one_lap_ - 1);
        const std::size_t lap = pos & ~(one_lap_ - 1);
        return (index + 1 < capacity_) ? pos + 1 : lap + one_lap_;
    }

private:
    const std::size_t capacity_;
    const std::size_t one_lap_;
    Slot<T>* slots_;

    alignas(kCacheLine) std::atomic<std::size_t> head_;
    CachePad _pad1_;
    alignas(kCacheLine) std::atomic<std::size_t> tail_;
    CachePad _pad2_;
};

} // namespace lfq
