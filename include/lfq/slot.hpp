#pragma once
#include <atomic>
#include <cstddef>
#include <new>
#include <type_traits>

namespace lfq {

// Invariant (stamped slot), for logical position p = lap + index:
//    - Producer expects stamp == p
//    - After write, producer sets stamp = p + 1
//    - Consumer expects stamp == p + 1
//    - After read, consumer sets stamp = p + one_lap
//
// The lap in the stamp keeps a stale position from matching a reused slot.

template <class T>
struct Slot {
    std::atomic<std::size_t> stamp{0};
    std::aligned_storage_t<sizeof(T), alignof(T)> storage;

    T*       ptr()       noexcept { return std::launder(reinterpret_cast<T*>(&storage)); }
    const T* ptr() const noexcept { return std::launder(reinterpret_cast<const T*>(&storage)); }
};

} // namespace lfq
