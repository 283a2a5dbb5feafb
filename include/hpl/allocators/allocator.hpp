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

#include <random>
#include <string>

#include "hpl/auxiliary/exceptions.hpp"
#include "hpl/model/distribution.hpp"

namespace hpl {

/**
 * @class Allocator
 * @brief Interface for algorithms computing an initial placement.
 *
 * Allocators overwrite the placement of a distribution with a valid one, i.e. a total placement in which no
 * server hosts more anchor vertices than its capacity. All randomness is drawn from the generator passed in.
 */
template <typename HypergraphT>
class Allocator {
  protected:
    /**
     * @brief Checks the preconditions shared by all allocators.
     *
     * @throws PlacementLockedError if an embedding has been committed for the distribution.
     * @throws InfeasibleNetworkError if the network has fewer slots than there are anchor vertices.
     */
    static void CheckAllocatable(const Distribution<HypergraphT> &distribution) {
        if (distribution.IsLocked()) {
            throw PlacementLockedError("Cannot allocate a distribution for which an embedding has been committed.");
        }
        if (!distribution.GetNetwork().CanImplement(distribution.GetHypergraph())) {
            throw InfeasibleNetworkError("The hypergraph cannot be placed onto this network: not enough server capacity.");
        }
    }

  public:
    Allocator() = default;

    virtual ~Allocator() = default;

    /**
     * @brief Get the name of the allocation algorithm.
     * @return The name of the algorithm as a string.
     */
    virtual std::string GetAllocatorName() const = 0;

    /**
     * @brief Computes a valid placement for the given distribution.
     * @param distribution The distribution whose placement is overwritten.
     * @param gen The random generator used for all random decisions.
     */
    virtual void Allocate(Distribution<HypergraphT> &distribution, std::mt19937 &gen) = 0;
};

}    // namespace hpl
