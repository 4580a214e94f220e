#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace lfq {

// Thrown by BoundedQueue when the requested capacity can not be honoured.
class InvalidCapacity : public std::invalid_argument {
public:
    explicit InvalidCapacity(std::size_t requested)
        : std::invalid_argument("lfq: invalid queue capacity " + std::to_string(requested)),
          requested_(requested) {}

    std::size_t requested() const noexcept { return requested_; }

private:
    std::size_t requested_;
};

} // namespace lfq
