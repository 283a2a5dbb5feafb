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
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "hpl/allocators/allocator.hpp"

namespace hpl {

/**
 * @class BruteAllocator
 * @brief Enumerates all placements and keeps the cheapest valid one.
 *
 * The number of placements is exponential in the number of vertices, so this is only meant for very small
 * instances, e.g. to obtain reference optima in tests.
 */
template <typename HypergraphT>
class BruteAllocator : public Allocator<HypergraphT> {
    using IndexType = typename HypergraphT::VertexIdx;
    using CostType = typename HypergraphT::VertexCommWeightType;

  public:
    BruteAllocator() = default;
    virtual ~BruteAllocator() = default;

    std::string GetAllocatorName() const override { return "BruteAllocator"; }

    void Allocate(Distribution<HypergraphT> &distribution, std::mt19937 &) override {
        this->CheckAllocatable(distribution);

        const IndexType numVertices = distribution.GetHypergraph().NumVertices();
        const unsigned numServers = distribution.GetNetwork().NumServers();
        std::vector<unsigned> assignment(numVertices, 0U);
        std::optional<std::vector<unsigned>> best;
        CostType bestCost = 0;

        bool exhausted = false;
        while (!exhausted) {
            distribution.SetPlacement(Placement<HypergraphT>(assignment));
            if (distribution.IsValid()) {
                const CostType cost = distribution.Cost();
                if (!best || cost < bestCost) {
                    best = assignment;
                    bestCost = cost;
                }
                if (bestCost == 0) {
                    break;
                }
            }

            // next assignment in lexicographic order
            exhausted = true;
            for (IndexType vertex = numVertices; vertex > 0; --vertex) {
                if (++assignment[vertex - 1] < numServers) {
                    exhausted = false;
                    break;
                }
                assignment[vertex - 1] = 0;
            }
        }

        if (!best) {
            distribution.ResetPlacement();
            throw NoValidPlacementError("No valid placement could be found.");
        }

        distribution.SetPlacement(Placement<HypergraphT>(*best));
        BOOST_LOG_TRIVIAL(info) << GetAllocatorName() << " found optimal placement with cost " << bestCost << ".";
    }
};

}    // namespace hpl
