#ifndef WAYGRID_ID_ALLOCATOR_HPP
#define WAYGRID_ID_ALLOCATOR_HPP

#include <cstdint>
#include <string>

namespace waygrid {
namespace geo {

/**
 * Monotonic counter for synthetic node ids
 * One allocator is shared by every resampling and partitioning call of a run.
 * Callers working on cells in parallel give each worker an allocator with a
 * disjoint starting value.
 */
class IdAllocator {
public:
    explicit IdAllocator(uint64_t first_value = 0) : next_value_(first_value) {}

    // "Generated Node <n>", used for resampling points
    std::string nextNodeId();

    // "Generated node # <n>", used for cell-boundary points
    std::string nextBoundaryNodeId();

    // Value the next id will carry
    uint64_t peek() const { return next_value_; }

private:
    uint64_t next_value_;
};

} // namespace geo
} // namespace waygrid

#endif // WAYGRID_ID_ALLOCATOR_HPP
