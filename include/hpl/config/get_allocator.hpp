/*
Copyright 2024 Huawei Technologies Co., Ltd.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.

@author HyperPlace contributors
*/

#pragma once

#include <boost/log/trivial.hpp>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include "hpl/allocators/annealing.hpp"
#include "hpl/allocators/brute_allocator.hpp"
#include "hpl/allocators/ordered_allocator.hpp"
#include "hpl/allocators/random_allocator.hpp"
#include "hpl/config/placement_config.hpp"
#include "hpl/refiners/boundary_reallocation.hpp"

namespace hpl {

template <typename HypergraphT>
std::unique_ptr<Allocator<HypergraphT>> GetAllocatorByName(const std::string &name, const PlacementConfig &config) {
    if (name == "random") {
        return std::make_unique<RandomAllocator<HypergraphT>>();

    } else if (name == "ordered") {
        return std::make_unique<OrderedAllocator<HypergraphT>>();

    } else if (name == "brute") {
        return std::make_unique<BruteAllocator<HypergraphT>>();

    } else if (name == "annealing") {
        auto allocator = std::make_unique<AnnealingAllocator<HypergraphT>>();
        allocator->SetIterations(config.iterations_);
        allocator->SetInitialTemperature(config.initialTemperature_);
        allocator->SetCacheLimit(config.cacheLimit_);
        return allocator;

    } else {
        throw std::invalid_argument("Parameter error: unknown initializer \"" + name + "\".\n");
    }
}

template <typename HypergraphT>
std::unique_ptr<BoundaryReallocation<HypergraphT>> GetBoundaryReallocation(const PlacementConfig &config) {
    auto refiner = std::make_unique<BoundaryReallocation<HypergraphT>>(config.numRounds_, config.stopParameter_);
    refiner->SetCacheLimit(config.cacheLimit_);
    refiner->SetAcceptZeroGainMoves(config.acceptZeroGainMoves_);
    refiner->SetReallocateAnchors(config.reallocateAnchors_);
    return refiner;
}

/**
 * @brief Full placement run: the configured initializer followed by boundary reallocation.
 *
 * @return The cost of the resulting valid distribution.
 */
template <typename HypergraphT>
typename HypergraphT::VertexCommWeightType RunPlacement(Distribution<HypergraphT> &distribution, const PlacementConfig &config) {
    std::mt19937 gen = MakeGenerator(config);

    auto allocator = GetAllocatorByName<HypergraphT>(config.initializer_, config);
    BOOST_LOG_TRIVIAL(info) << "Running initializer: " << allocator->GetAllocatorName();
    allocator->Allocate(distribution, gen);

    auto refiner = GetBoundaryReallocation<HypergraphT>(config);
    if (!refiner->Refine(distribution, gen)) {
        BOOST_LOG_TRIVIAL(debug) << "Refinement did not change the initial placement.";
    }

    return distribution.Cost();
}

}    // namespace hpl
