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
#include <vector>

#include "hpl/model/hypergraph.hpp"
#include "hpl/model/placement.hpp"

/**
 * @file hypergraph_utility.hpp
 * @brief Utility functions for working with placed hypergraphs.
 */

namespace hpl {

// sorted, duplicate-free list of the servers occupied by the vertices of a hyperedge
template <typename HypergraphT>
std::vector<unsigned> ComputeServerSet(const typename HypergraphT::HyperedgeType &hyperedge,
                                       const Placement<HypergraphT> &placement) {
    std::vector<unsigned> servers;
    servers.reserve(hyperedge.vertices_.size());
    for (const auto vertex : hyperedge.vertices_) {
        servers.push_back(placement.AssignedServer(vertex));
    }
    std::sort(servers.begin(), servers.end());
    servers.erase(std::unique(servers.begin(), servers.end()), servers.end());
    return servers;
}

// vertices with at least one neighbour placed on a different server
template <typename HypergraphT>
std::vector<typename HypergraphT::VertexIdx> ComputeBoundary(const HypergraphT &hgraph,
                                                             const Placement<HypergraphT> &placement) {
    using IndexType = typename HypergraphT::VertexIdx;

    std::vector<IndexType> boundary;
    for (IndexType vertex = 0; vertex < hgraph.NumVertices(); ++vertex) {
        const unsigned server = placement.AssignedServer(vertex);
        for (const IndexType neighbour : hgraph.GetNeighbours(vertex)) {
            if (placement.AssignedServer(neighbour) != server) {
                boundary.push_back(vertex);
                break;
            }
        }
    }
    return boundary;
}

}    // namespace hpl
