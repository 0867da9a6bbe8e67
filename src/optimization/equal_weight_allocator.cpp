// src/optimization/equal_weight_allocator.cpp

#include "alloc_ngin/optimization/equal_weight_allocator.hpp"
#include "alloc_ngin/core/logger.hpp"

namespace alloc_ngin {

EqualWeightAllocator::EqualWeightAllocator() {
    Logger::register_component("EqualWeightAllocator");
}

Result<AllocationResult> EqualWeightAllocator::allocate(const AllocationRequest& request) const {
    if (request.assets.empty()) {
        return make_error<AllocationResult>(ErrorCode::EMPTY_UNIVERSE,
                                            "Cannot allocate over an empty universe",
                                            "EqualWeightAllocator");
    }

    EqualWeightResult result;
    result.weights = PortfolioWeights(request.assets, equal_weights(request.assets.size()));
    return AllocationResult(std::move(result));
}

}  // namespace alloc_ngin
