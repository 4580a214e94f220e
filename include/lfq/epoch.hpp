#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "logging.hpp"
#include "utils.hpp"

// Epoch-based reclamation (EBR).
//
// Each thread owns a Participant. While a Guard is alive the participant is
// pinned and advertises the global epoch it observed. The global epoch only
// advances when every pinned participant has observed the current value, so
// an object retired at epoch E can no longer be referenced by anybody once
// the global epoch reaches E + 2.
//
//    global epoch   E                 E+1                E+2
//                   |<-- grace 1 ---->|<-- grace 2 ---->|
//    T0  pin @E ... reads block B ... unpin
//    T1        unlink B, retire(B) @E                     free(B)

namespace lfq::epoch {

struct Retired {
    void* ptr;
    void (*deleter)(void*);
    std::uint64_t epoch;
};

struct Participant {
    // (epoch << 1) | 1 while pinned, 0 while quiescent.
    alignas(kCacheLine) std::atomic<std::uint64_t> state{0};
    std::atomic<bool> in_use{false};
    Participant* next = nullptr;   // registry link, immutable once published

    // Owner-thread only.
    std::size_t guard_depth = 0;
    std::size_t pin_count = 0;
    std::vector<Retired> garbage;
};

class Collector {
public:
    static constexpr std::uint64_t kPinned = 1;
    static constexpr std::size_t kPinsBetweenCollect = 128;
    static constexpr std::size_t kGarbageThreshold = 64;
    static constexpr std::size_t kBacklogWarning = 1u << 16;

    static Collector& instance() {
        static Collector collector;
        return collector;
    }

    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    ~Collector() {
        // Process exit: no thread is pinned any more.
        Participant* p = participants_.load(ACQUIRE);
        while (p) {
            Participant* next = p->next;
            for (const Retired& r : p->garbage) r.deleter(r.ptr);
            delete p;
            p = next;
        }
    }

    std::uint64_t epoch() const noexcept { return epoch_.load(ACQUIRE); }

    // Participant records ever registered; records are reused, so this tracks peak thread count.
    std::size_t registered() const noexcept { return registered_.load(RELAXED); }

    // Claims a free participant record or registers a new one.
    Participant* acquire() {
        for (Participant* p = participants_.load(ACQUIRE); p; p = p->next) {
            bool expected = false;
            if (!p->in_use.load(RELAXED) &&
                p->in_use.compare_exchange_strong(expected, true, ACQUIRE, RELAXED)) {
                return p;
            }
        }

        auto* p = new Participant();
        p->in_use.store(true, RELAXED);
        Participant* head = participants_.load(RELAXED);
        do {
            p->next = head;
        } while (!participants_.compare_exchange_weak(head, p, RELEASE, RELAXED));
        registered_.fetch_add(1, RELAXED);
        LFQ_LOG_DEBUG("epoch: registered participant #{}", registered_.load(RELAXED));
        return p;
    }

    // Hands the record back; leftover garbage stays with it for the next owner.
    void release(Participant& p) noexcept {
        p.guard_depth = 0;
        p.state.store(0, RELEASE);
        p.in_use.store(false, RELEASE);
    }

    void pin(Participant& p) {
        if (p.guard_depth++ != 0) return;

        const std::uint64_t e = epoch_.load(RELAXED);
        p.state.store((e << 1) | kPinned, RELAXED);
        std::atomic_thread_fence(SEQ_CST);

        if (++p.pin_count % kPinsBetweenCollect == 0) {
            try_advance();
            collect(p);
        }
    }

    void unpin(Participant& p) noexcept {
        if (--p.guard_depth == 0) {
            p.state.store(0, RELEASE);
        }
    }

    void retire(Participant& p, void* ptr, void (*deleter)(void*)) {
        std::atomic_thread_fence(SEQ_CST);
        p.garbage.push_back(Retired{ptr, deleter, epoch_.load(SEQ_CST)});

        if (p.garbage.size() % kGarbageThreshold == 0) {
            try_advance();
            collect(p);
            if (p.garbage.size() >= kBacklogWarning) {
                LFQ_LOG_WARN("epoch: {} retired objects pending on one thread, "
                             "a long-lived guard is blocking reclamation", p.garbage.size());
            }
        }
    }

    // Advances the global epoch if every pinned participant has seen it.
    // Returns true if the epoch moved (by this call or concurrently).
    bool try_advance() noexcept {
        std::uint64_t global = epoch_.load(RELAXED);
        std::atomic_thread_fence(SEQ_CST);

        for (Participant* p = participants_.load(ACQUIRE); p; p = p->next) {
            const std::uint64_t s = p->state.load(RELAXED);
            if ((s & kPinned) != 0 && (s >> 1) != global) return false;
        }
        std::atomic_thread_fence(ACQUIRE);

        const std::uint64_t observed = global;
        if (epoch_.compare_exchange_strong(global, observed + 1, RELEASE, RELAXED)) return true;
        return global != observed;
    }

    // Frees the participant's garbage that is two epochs old. Returns the count freed.
    std::size_t collect(Participant& p) {
        const std::uint64_t global = epoch_.load(ACQUIRE);
        auto expired = [global](const Retired& r) { return global - r.epoch >= 2; };

        auto keep_end = std::partition(p.garbage.begin(), p.garbage.end(),
                                       [&](const Retired& r) { return !expired(r); });
        const std::size_t freed = static_cast<std::size_t>(p.garbage.end() - keep_end);

        // Deleters must not retire: that would grow the vector under this loop.
        for (auto it = keep_end; it != p.garbage.end(); ++it) it->deleter(it->ptr);
        p.garbage.erase(keep_end, p.garbage.end());

        if (freed != 0) LFQ_LOG_TRACE("epoch: freed {} objects at epoch {}", freed, global);
        return freed;
    }

private:
    Collector() = default;

    alignas(kCacheLine) std::atomic<std::uint64_t> epoch_{0};
    alignas(kCacheLine) std::atomic<Participant*> participants_{nullptr};
    std::atomic<std::size_t> registered_{0};
};

namespace detail {

// Set once the calling thread's LocalHandle is gone. Trivially destructible so
// it stays readable from thread_local destructors that run after the handle's.
inline bool& handle_destroyed() noexcept {
    thread_local bool destroyed = false;
    return destroyed;
}

// Thread-local owner of a participant record.
class LocalHandle {
public:
    LocalHandle() : collector_(Collector::instance()), participant_(collector_.acquire()) {}

    ~LocalHandle() {
        collector_.try_advance();
        collector_.collect(*participant_);
        collector_.release(*participant_);
        handle_destroyed() = true;
    }

    LocalHandle(const LocalHandle&) = delete;
    LocalHandle& operator=(const LocalHandle&) = delete;

    Participant& participant() noexcept { return *participant_; }

private:
    Collector& collector_;
    Participant* participant_;
};

// nullptr once the thread's handle has been destroyed; the record it owned may
// already belong to another thread.
inline Participant* local_participant() {
    if (handle_destroyed()) return nullptr;
    thread_local LocalHandle handle;
    return &handle.participant();
}

} // namespace detail

// Pins the calling thread for its lifetime. Nestable.
//
// A guard taken during thread exit, after the thread's own record was handed
// back, borrows a record from the collector for its own scope instead.
class Guard {
public:
    Guard() : collector_(Collector::instance()), participant_(detail::local_participant()) {
        if (participant_ == nullptr) {
            participant_ = collector_.acquire();
            borrowed_ = true;
        }
        collector_.pin(*participant_);
    }

    ~Guard() {
        collector_.unpin(*participant_);
        if (borrowed_) {
            collector_.try_advance();
            collector_.collect(*participant_);
            collector_.release(*participant_);
        }
    }

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

    // `ptr` must already be unreachable from shared state.
    template <class T>
    void defer_delete(T* ptr) {
        collector_.retire(*participant_, ptr, [](void* p) { delete static_cast<T*>(p); });
    }

    // True when this guard pins a borrowed record rather than the thread's own.
    bool borrowed() const noexcept { return borrowed_; }

private:
    Collector& collector_;
    Participant* participant_;
    bool borrowed_ = false;
};

// Advance-and-collect for the calling thread; returns the number of objects freed.
inline std::size_t flush() {
    Collector& c = Collector::instance();
    c.try_advance();
    Participant* p = detail::local_participant();
    return p ? c.collect(*p) : 0;
}

// Objects retired by the calling thread that are not freed yet.
inline std::size_t pending() {
    Participant* p = detail::local_participant();
    return p ? p->garbage.size() : 0;
}

} // namespace lfq::epoch
