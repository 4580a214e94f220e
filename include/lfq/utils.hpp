#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <thread>
#include <type_traits>

#if defined(_MSC_VER)
  #include <immintrin.h>
  #define LFQ_PAUSE() _mm_pause()
#elif defined(__i386__) || defined(__x86_64__)
  #define LFQ_PAUSE() __builtin_ia32_pause()
#elif defined(__aarch64__)
  #define LFQ_PAUSE() __asm__ __volatile__("yield")
#else
  #define LFQ_PAUSE() do {} while(0)
#endif

#ifndef LFQ_CACHELINE_SIZE
  #define LFQ_CACHELINE_SIZE 64
#endif

namespace lfq {

constexpr std::size_t kCacheLine = LFQ_CACHELINE_SIZE;

// Cache line padding (64B on x86_64); override LFQ_CACHELINE_SIZE for other HW.
struct CachePad {
    alignas(kCacheLine) std::byte pad[kCacheLine];
};

// Memory order helpers for readability
constexpr auto RELAXED = std::memory_order_relaxed;
constexpr auto ACQUIRE = std::memory_order_acquire;
constexpr auto RELEASE = std::memory_order_release;
constexpr auto ACQ_REL = std::memory_order_acq_rel;
constexpr auto SEQ_CST = std::memory_order_seq_cst;

// Round up to next power-of-two. Returns 0 when the result does not fit.
constexpr std::size_t next_pow2(std::size_t x) {
    if (x <= 1) return 1;
    --x;
    x |= x >> 1;  x |= x >> 2;  x |= x >> 4;
    x |= x >> 8;  x |= x >> 16;
    if constexpr (sizeof(std::size_t) > 4) x |= x >> 32;
    return x + 1;
}

constexpr bool is_pow2(std::size_t x) { return x != 0 && (x & (x - 1)) == 0; }

// Exponential backoff for CAS retry loops.
//   spin():   lost a race, retry soon (pause hints only)
//   snooze(): waiting on another thread to finish its step (yields once spinning is exhausted)
class Backoff {
public:
    void spin() noexcept {
        const unsigned n = 1u << std::min(step_, kSpinLimit);
        for (unsigned i = 0; i < n; ++i) LFQ_PAUSE();
        if (step_ <= kSpinLimit) ++step_;
    }

    void snooze() noexcept {
        if (step_ <= kSpinLimit) {
            const unsigned n = 1u << step_;
            for (unsigned i = 0; i < n; ++i) LFQ_PAUSE();
        } else {
            std::this_thread::yield();
        }
        if (step_ <= kYieldLimit) ++step_;
    }

    bool is_completed() const noexcept { return step_ > kYieldLimit; }
    void reset() noexcept { step_ = 0; }

private:
    static constexpr unsigned kSpinLimit = 6;
    static constexpr unsigned kYieldLimit = 10;
    unsigned step_ = 0;
};

template <class Int>
struct UpdateResult {
    bool ok;        // true if the CAS installed the new value
    Int previous;   // value the update was computed from (or declined on)
};

// Read / compute / CAS loop shared by the queues.
// `next(current)` returns the desired value, or std::nullopt to stop without writing.
template <class Int, class F>
UpdateResult<Int> fetch_update(std::atomic<Int>& target, F&& next,
                               std::memory_order success = ACQ_REL,
                               std::memory_order failure = ACQUIRE) noexcept(noexcept(next(Int{}))) {
    static_assert(std::is_integral_v<Int>, "fetch_update works on integral atomics");
    Backoff backoff;
    Int current = target.load(failure);
    for (;;) {
        const std::optional<Int> desired = next(current);
        if (!desired) return {false, current};
        if (target.compare_exchange_weak(current, *desired, success, failure)) {
            return {true, current};
        }
        backoff.spin();
    }
}

} // namespace lfq
