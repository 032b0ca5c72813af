#include "geo/id_allocator.hpp"

namespace waygrid {
namespace geo {

std::string IdAllocator::nextNodeId() {
    return "Generated Node " + std::to_string(next_value_++);
}

std::string IdAllocator::nextBoundaryNodeId() {
    return "Generated node # " + std::to_string(next_value_++);
}

} // namespace geo
} // namespace waygrid
