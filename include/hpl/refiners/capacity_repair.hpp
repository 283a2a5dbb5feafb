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

#include "hpl/auxiliary/exceptions.hpp"
#include "hpl/optimizer/gain_manager.hpp"

namespace hpl {

/**
 * @brief Moves anchor vertices out of overfull servers until every server respects its capacity.
 *
 * Anchor vertices are visited in the order of their index; each one hosted by an overfull server is moved to the
 * first server with spare capacity. No gains are evaluated. Vertices on servers within capacity keep their server.
 *
 * @return The number of vertices moved.
 * @throws InfeasibleNetworkError if the network has fewer slots than there are anchor vertices.
 */
template <typename HypergraphT>
std::size_t RepairCapacity(GainManager<HypergraphT> &gainManager) {
    using IndexType = typename HypergraphT::VertexIdx;

    const HypergraphT &hgraph = gainManager.GetDistribution().GetHypergraph();
    const Network &network = gainManager.GetDistribution().GetNetwork();

    if (!network.CanImplement(hgraph)) {
        throw InfeasibleNetworkError("The hypergraph cannot be placed onto this network: not enough server capacity.");
    }

    std::size_t moved = 0;
    for (IndexType vertex = 0; vertex < hgraph.NumVertices(); ++vertex) {
        if (!hgraph.IsAnchorVertex(vertex)) {
            continue;
        }

        const unsigned current = gainManager.CurrentServer(vertex);
        if (gainManager.GetOccupancy(current) <= network.Capacity(current)) {
            continue;
        }

        for (unsigned server = 0; server < network.NumServers(); ++server) {
            if (server != current && gainManager.IsMoveValid(vertex, server)) {
                gainManager.Move(vertex, server);
                ++moved;
                break;
            }
        }
    }

    if (moved > 0) {
        BOOST_LOG_TRIVIAL(warning) << "Capacity repair moved " << moved << " anchor vertices out of overfull servers.";
    }
    return moved;
}

}    // namespace hpl
