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

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <numeric>
#include <random>
#include <string>
#include <vector>

#include "hpl/allocators/allocator.hpp"

namespace hpl {

// servers sorted by decreasing capacity, ties broken by index
inline std::vector<unsigned> OrderByDecreasingCapacity(const Network &network) {
    std::vector<unsigned> order(network.NumServers());
    std::iota(order.begin(), order.end(), 0U);
    std::stable_sort(order.begin(), order.end(), [&network](const unsigned first, const unsigned second) {
        return network.Capacity(first) > network.Capacity(second);
    });
    return order;
}

/**
 * @class OrderedAllocator
 * @brief Fills the largest servers first with the anchor vertices, in the order of their index. Dependent
 * vertices are all placed on the largest server.
 */
template <typename HypergraphT>
class OrderedAllocator : public Allocator<HypergraphT> {
    using IndexType = typename HypergraphT::VertexIdx;

  public:
    OrderedAllocator() = default;
    virtual ~OrderedAllocator() = default;

    std::string GetAllocatorName() const override { return "OrderedAllocator"; }

    void Allocate(Distribution<HypergraphT> &distribution, std::mt19937 &) override {
        this->CheckAllocatable(distribution);

        const HypergraphT &hgraph = distribution.GetHypergraph();
        const Network &network = distribution.GetNetwork();

        const std::vector<unsigned> order = OrderByDecreasingCapacity(network);

        auto server = order.begin();
        unsigned filled = 0;
        for (IndexType vertex = 0; vertex < hgraph.NumVertices(); ++vertex) {
            if (!hgraph.IsAnchorVertex(vertex)) {
                distribution.SetAssignedServer(vertex, order.front());
                continue;
            }

            while (filled == network.Capacity(*server)) {
                ++server;
                filled = 0;
            }
            distribution.SetAssignedServer(vertex, *server);
            ++filled;
        }

        BOOST_LOG_TRIVIAL(info) << GetAllocatorName() << " placed " << hgraph.NumVertices() << " vertices onto "
                                << network.NumServers() << " servers.";
    }
};

}    // namespace hpl
