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
#include <random>
#include <string>
#include <vector>

#include "hpl/allocators/allocator.hpp"

namespace hpl {

/**
 * @class RandomAllocator
 * @brief Places anchor vertices on uniformly random servers which are not yet full, and dependent vertices on
 * uniformly random servers without restriction.
 */
template <typename HypergraphT>
class RandomAllocator : public Allocator<HypergraphT> {
    using IndexType = typename HypergraphT::VertexIdx;

  public:
    RandomAllocator() = default;
    virtual ~RandomAllocator() = default;

    std::string GetAllocatorName() const override { return "RandomAllocator"; }

    void Allocate(Distribution<HypergraphT> &distribution, std::mt19937 &gen) override {
        this->CheckAllocatable(distribution);

        const HypergraphT &hgraph = distribution.GetHypergraph();
        const Network &network = distribution.GetNetwork();

        std::vector<unsigned> occupancy(network.NumServers(), 0U);
        std::uniform_int_distribution<unsigned> anyServer(0, network.NumServers() - 1);

        for (IndexType vertex = 0; vertex < hgraph.NumVertices(); ++vertex) {
            if (!hgraph.IsAnchorVertex(vertex)) {
                distribution.SetAssignedServer(vertex, anyServer(gen));
                continue;
            }

            std::vector<unsigned> available;
            for (unsigned server = 0; server < network.NumServers(); ++server) {
                if (occupancy[server] < network.Capacity(server)) {
                    available.push_back(server);
                }
            }

            std::uniform_int_distribution<std::size_t> pick(0, available.size() - 1);
            const unsigned server = available[pick(gen)];
            distribution.SetAssignedServer(vertex, server);
            ++occupancy[server];
        }

        BOOST_LOG_TRIVIAL(info) << GetAllocatorName() << " placed " << hgraph.NumVertices() << " vertices onto "
                                << network.NumServers() << " servers.";
    }
};

}    // namespace hpl
