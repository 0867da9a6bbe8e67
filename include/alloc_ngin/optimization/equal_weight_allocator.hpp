// include/alloc_ngin/optimization/equal_weight_allocator.hpp

#pragma once

#include "alloc_ngin/optimization/allocator.hpp"

namespace alloc_ngin {

/**
 * @brief Naive 1/n benchmark; ignores estimated parameters
 */
class EqualWeightAllocator : public Allocator {
public:
    EqualWeightAllocator();

    StrategyKind kind() const override {
        return StrategyKind::EQUAL_WEIGHT;
    }

    bool requires_estimation() const override {
        return false;
    }

    Result<AllocationResult> allocate(const AllocationRequest& request) const override;
};

}  // namespace alloc_ngin
