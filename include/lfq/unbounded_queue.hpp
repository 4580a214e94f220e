#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>
#include "epoch.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace lfq {

// Multi-Producer / Multi-Consumer unbounded queue on a linked list of blocks.
//
// Producers claim cells of the tail block through its `pushed` counter and
// consumers claim published cells of the head block through `popped`. The
// thread that finds the tail block exhausted links a fresh block; the thread
// that moves head_ past a drained block retires it to the epoch collector.
//
// Invariant: tail_ is moved past a block before head_ leaves it, so a retired
// block is unreachable from head_ and tail_ alike.
template <class T, std::size_t BlockSize = 32>
class UnboundedQueue {
    static_assert(is_pow2(BlockSize) && BlockSize >= 2, "BlockSize must be a power of two >= 2");
    static_assert(std::is_nothrow_move_constructible_v<T>,
                  "UnboundedQueue requires a nothrow move constructible element type");

    static constexpr std::uint32_t kBlockCap = static_cast<std::uint32_t>(BlockSize);

    struct Cell {
        std::atomic<bool> ready{false};
        std::aligned_storage_t<sizeof(T), alignof(T)> storage;

        T* ptr() noexcept { return std::launder(reinterpret_cast<T*>(&storage)); }
    };

    struct Block {
        std::atomic<Block*> next{nullptr};
        std::uint64_t base = 0; // logical position of cells[0]
        alignas(kCacheLine) std::atomic<std::uint32_t> pushed{0};
        alignas(kCacheLine) std::atomic<std::uint32_t> popped{0};
        Cell cells[BlockSize];
    };

public:
    static constexpr std::size_t block_size = BlockSize;

    UnboundedQueue() {
        Block* first = allocate_block().release();
        head_.store(first, RELAXED);
        tail_.store(first, RELAXED);
    }

    ~UnboundedQueue() {
        std::size_t dropped = 0;
        Block* block = head_.load(RELAXED);
        while (block) {
            const std::uint32_t end = std::min(block->pushed.load(RELAXED), kBlockCap);
            for (std::uint32_t i = block->popped.load(RELAXED); i < end; ++i) {
                Cell& c = block->cells[i];
                if (c.ready.load(RELAXED)) {
                    c.ptr()->~T();
                    ++dropped;
                }
            }
            Block* next = block->next.load(RELAXED);
            delete block;
            block = next;
        }
        if (dropped != 0) LFQ_LOG_DEBUG("unbounded queue destroyed with {} pending values", dropped);
    }

    UnboundedQueue(const UnboundedQueue&) = delete;
    UnboundedQueue& operator=(const UnboundedQueue&) = delete;

    // Never reports full. Throws std::bad_alloc if a new block can not be allocated.
    void push(T&& value) { push_impl(std::move(value)); }

    void push(const T& value) {
        T copy(value);
        push_impl(std::move(copy));
    }

    template <class... Args>
    void emplace(Args&&... args) {
        T value(std::forward<Args>(args)...);
        push_impl(std::move(value));
    }

    // Empty when nothing is published at the head. A push that has claimed its
    // cell but not written it yet counts as not there.
    std::optional<T> try_pop() {
        epoch::Guard guard;
        for (;;) {
            Block* head = head_.load(ACQUIRE);
            const auto claim = fetch_update(head->popped, [head](std::uint32_t i) -> std::optional<std::uint32_t> {
                if (i >= kBlockCap || !head->cells[i].ready.load(ACQUIRE)) return std::nullopt;
                return i + 1;
            });
            if (claim.ok) {
                T* p = head->cells[claim.previous].ptr();
                std::optional<T> out(std::move(*p));
                p->~T();
                return out;
            }
            if (claim.previous < kBlockCap) return std::nullopt; // empty

            // Every cell of the head block is claimed; move on to its successor.
            Block* next = head->next.load(ACQUIRE);
            if (next == nullptr) return std::nullopt;

            Block* tail = tail_.load(ACQUIRE);
            if (tail == head) {
                tail_.compare_exchange_strong(tail, next, ACQ_REL, RELAXED);
                continue;
            }
            if (head_.compare_exchange_strong(head, next, ACQ_REL, RELAXED)) {
                guard.defer_delete(head);
            }
        }
    }

    bool try_pop(T& out) {
        std::optional<T> value = try_pop();
        if (!value) return false;
        out = std::move(*value);
        return true;
    }

    // -------- Snapshots (best effort under concurrency) --------

    // Counts cells claimed by producers, including ones still being written.
    std::size_t size() const {
        epoch::Guard guard;
        for (;;) {
            Block* tail = tail_.load(ACQUIRE);
            Block* head = head_.load(ACQUIRE);
            const std::uint64_t pushed = tail->base + std::min(tail->pushed.load(ACQUIRE), kBlockCap);
            const std::uint64_t popped = head->base + std::min(head->popped.load(ACQUIRE), kBlockCap);
            if (tail_.load(ACQUIRE) != tail) continue;
            return pushed > popped ? static_cast<std::size_t>(pushed - popped) : 0;
        }
    }

    bool empty() const { return size() == 0; }

    // Blocks allocated over the queue's lifetime, the initial one included.
    std::size_t allocated_blocks() const noexcept { return allocated_blocks_.load(RELAXED); }

private:
    std::unique_ptr<Block> allocate_block() {
        try {
            auto block = std::make_unique<Block>();
            allocated_blocks_.fetch_add(1, RELAXED);
            return block;
        } catch (const std::bad_alloc&) {
            LFQ_LOG_ERROR("unbounded queue: failed to allocate a block of {} bytes", sizeof(Block));
            throw;
        }
    }

    void push_impl(T&& value) {
        epoch::Guard guard;
        std::unique_ptr<Block> spare;
        for (;;) {
            Block* tail = tail_.load(ACQUIRE);
            const auto claim = fetch_update(tail->pushed, [](std::uint32_t i) -> std::optional<std::uint32_t> {
                if (i >= kBlockCap) return std::nullopt;
                return i + 1;
            }, RELAXED, RELAXED);
            if (claim.ok) {
                Cell& c = tail->cells[claim.previous];
                new (c.ptr()) T(std::move(value));
                c.ready.store(true, RELEASE);
                return;
            }

            // Tail block exhausted: link a successor (or find the one a rival linked).
            Block* next = tail->next.load(ACQUIRE);
            if (next == nullptr) {
                if (!spare) spare = allocate_block();
                spare->base = tail->base + BlockSize;
                if (tail->next.compare_exchange_strong(next, spare.get(), ACQ_REL, ACQUIRE)) {
                    next = spare.release();
                }
            }
            tail_.compare_exchange_strong(tail, next, ACQ_REL, RELAXED);
        }
    }

private:
    alignas(kCacheLine) std::atomic<Block*> head_{nullptr};
    CachePad _pad1_;
    alignas(kCacheLine) std::atomic<Block*> tail_{nullptr};
    CachePad _pad2_;
    std::atomic<std::size_t> allocated_blocks_{0};
};

} // namespace lfq
