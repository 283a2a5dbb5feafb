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
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "hpl/model/hypergraph_utility.hpp"
#include "hpl/optimizer/gain_manager.hpp"
#include "hpl/refiners/capacity_repair.hpp"
#include "hpl/refiners/refiner.hpp"

namespace hpl {

/**
 * @class BoundaryReallocation
 * @brief Label propagation refinement of the vertices on the boundary of the placement.
 *
 * The placement is first made valid by capacity repair. Then, in each round, the boundary vertices are visited
 * in random order and moved to the server among their own and their neighbours' servers with the best gain. If
 * that server is full, the anchor vertex in it with the best gain for moving to the visited vertex's server is
 * swapped out. Ties are broken uniformly at random. Rounds stop once the proportion of moved boundary vertices
 * falls below the stop parameter, or after the maximal number of rounds.
 *
 * The refinement is greedy and does not escape local optima.
 */
template <typename HypergraphT>
class BoundaryReallocation : public Refiner<HypergraphT> {
    using IndexType = typename HypergraphT::VertexIdx;
    using CostType = typename HypergraphT::VertexCommWeightType;
    using GainManagerT = GainManager<HypergraphT>;

  private:
    unsigned numRounds_ = 1000;
    double stopParameter_ = 0.05;
    std::size_t cacheLimit_ = 5;
    bool acceptZeroGainMoves_ = true;
    bool reallocateAnchors_ = true;

    // best anchor vertex of the full server to swap to the origin, with the gain of that second move
    std::optional<std::pair<IndexType, CostType>> BestSwap(
        GainManagerT &gainManager, IndexType vertex, unsigned server, unsigned origin, std::mt19937 &gen) const;

    std::size_t RefineRound(GainManagerT &gainManager, std::mt19937 &gen, std::size_t &boundarySize) const;

  public:
    BoundaryReallocation() = default;

    BoundaryReallocation(unsigned numRounds, double stopParameter) : numRounds_(numRounds), stopParameter_(stopParameter) {}

    virtual ~BoundaryReallocation() = default;

    std::string GetRefinerName() const override { return "BoundaryReallocation"; }

    bool Refine(Distribution<HypergraphT> &distribution, std::mt19937 &gen) override;

    // setting parameters

    inline void SetNumRounds(unsigned numRounds) { numRounds_ = numRounds; }

    inline void SetStopParameter(double stopParameter) { stopParameter_ = stopParameter; }

    inline void SetCacheLimit(std::size_t cacheLimit) { cacheLimit_ = cacheLimit; }

    inline void SetAcceptZeroGainMoves(bool accept) { acceptZeroGainMoves_ = accept; }

    inline void SetReallocateAnchors(bool reallocate) { reallocateAnchors_ = reallocate; }

    inline unsigned GetNumRounds() const { return numRounds_; }

    inline double GetStopParameter() const { return stopParameter_; }
};

template <typename HypergraphT>
std::optional<std::pair<typename HypergraphT::VertexIdx, typename HypergraphT::VertexCommWeightType>>
BoundaryReallocation<HypergraphT>::BestSwap(
    GainManagerT &gainManager, IndexType vertex, unsigned server, unsigned origin, std::mt19937 &gen) const {
    const HypergraphT &hgraph = gainManager.GetDistribution().GetHypergraph();

    std::optional<std::pair<IndexType, CostType>> best;
    unsigned ties = 0;

    typename GainManagerT::ScopedMove guard(gainManager, vertex, server, false);
    for (const IndexType candidate : gainManager.GetDistribution().GetPlacement().GetVerticesIn(server)) {
        if (candidate == vertex || !hgraph.IsAnchorVertex(candidate)) {
            continue;
        }

        const CostType gain = gainManager.Gain(candidate, origin);
        if (!best || gain > best->second) {
            best = std::make_pair(candidate, gain);
            ties = 1;
        } else if (gain == best->second && std::uniform_int_distribution<unsigned>(0, ties++)(gen) == 0) {
            best = std::make_pair(candidate, gain);
        }
    }
    return best;
}

template <typename HypergraphT>
std::size_t BoundaryReallocation<HypergraphT>::RefineRound(GainManagerT &gainManager,
                                                           std::mt19937 &gen,
                                                           std::size_t &boundarySize) const {
    const HypergraphT &hgraph = gainManager.GetDistribution().GetHypergraph();

    std::vector<IndexType> boundary = ComputeBoundary(hgraph, gainManager.GetDistribution().GetPlacement());
    if (!reallocateAnchors_) {
        boundary.erase(std::remove_if(boundary.begin(),
                                      boundary.end(),
                                      [&hgraph](const IndexType vertex) { return hgraph.IsAnchorVertex(vertex); }),
                       boundary.end());
    }
    std::shuffle(boundary.begin(), boundary.end(), gen);
    boundarySize = boundary.size();

    std::size_t moves = 0;
    for (const IndexType vertex : boundary) {
        const unsigned current = gainManager.CurrentServer(vertex);

        std::set<unsigned> candidates{current};
        for (const IndexType neighbour : hgraph.GetNeighbours(vertex)) {
            candidates.insert(gainManager.CurrentServer(neighbour));
        }

        unsigned bestServer = current;
        std::optional<IndexType> bestSwap;
        CostType bestGain = 0;
        unsigned ties = 0;

        for (const unsigned server : candidates) {
            CostType gain = gainManager.Gain(vertex, server);
            std::optional<IndexType> swap;

            if (!gainManager.IsMoveValid(vertex, server)) {
                const auto partner = BestSwap(gainManager, vertex, server, current, gen);
                if (!partner) {
                    continue;
                }
                gain += partner->second;
                swap = partner->first;
            }

            if (ties == 0 || gain > bestGain) {
                bestServer = server;
                bestSwap = swap;
                bestGain = gain;
                ties = 1;
            } else if (gain == bestGain && std::uniform_int_distribution<unsigned>(0, ties++)(gen) == 0) {
                bestServer = server;
                bestSwap = swap;
            }
        }

        if (bestServer == current || (!acceptZeroGainMoves_ && bestGain <= 0)) {
            continue;
        }

        gainManager.Move(vertex, bestServer);
        if (bestSwap) {
            gainManager.Move(*bestSwap, current);
        }
        ++moves;
    }
    return moves;
}

template <typename HypergraphT>
bool BoundaryReallocation<HypergraphT>::Refine(Distribution<HypergraphT> &distribution, std::mt19937 &gen) {
    if (distribution.IsLocked()) {
        BOOST_LOG_TRIVIAL(warning) << GetRefinerName() << " called on a distribution with committed embeddings.";
        throw PlacementLockedError("Cannot refine a distribution for which an embedding has been committed.");
    }

    GainManagerT gainManager(distribution, cacheLimit_);
    bool refinementMade = RepairCapacity(gainManager) > 0;

    BOOST_LOG_TRIVIAL(info) << GetRefinerName() << " starting from cost " << gainManager.TotalCost() << ".";

    unsigned round = 0;
    double proportionMoved = 1.0;
    while (round < numRounds_ && proportionMoved > stopParameter_) {
        std::size_t boundarySize = 0;
        const std::size_t moves = RefineRound(gainManager, gen, boundarySize);

        refinementMade = refinementMade || moves > 0;
        proportionMoved = boundarySize > 0 ? static_cast<double>(moves) / static_cast<double>(boundarySize) : 0.0;
        ++round;

        BOOST_LOG_TRIVIAL(debug) << GetRefinerName() << " round " << round << ": moved " << moves << " of "
                                 << boundarySize << " boundary vertices, cost " << gainManager.TotalCost() << ".";
    }

    if (!distribution.IsValid()) {
        throw std::logic_error("Internal error: " + GetRefinerName() + " produced a placement violating server capacities.");
    }

    BOOST_LOG_TRIVIAL(info) << GetRefinerName() << " finished after " << round << " rounds with cost "
                            << gainManager.TotalCost() << ".";
    return refinementMade;
}

}    // namespace hpl
