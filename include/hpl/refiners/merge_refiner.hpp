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
#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "hpl/optimizer/gain_manager.hpp"
#include "hpl/refiners/refiner.hpp"

namespace hpl {

/**
 * @class MergeRefiner
 * @brief Merges consecutive hyperedges of each anchor vertex when this does not increase the cost.
 *
 * For every anchor vertex, its incident hyperedges are walked in order and the first two are merged if the
 * legality predicate allows it and the merge gain is non-negative. Otherwise, the one whose last dependent
 * vertex comes first is dropped from consideration. Hyperedges with a committed embedding are never merged.
 */
template <typename HypergraphT>
class MergeRefiner : public Refiner<HypergraphT> {
  public:
    using IndexType = typename HypergraphT::VertexIdx;
    using HyperedgeType = typename HypergraphT::HyperedgeType;
    using LegalityPredicate = std::function<bool(const HypergraphT &, const HyperedgeType &, const HyperedgeType &)>;

  private:
    LegalityPredicate isMergeLegal_;
    std::size_t cacheLimit_ = 5;

    static IndexType LastDependentVertex(const HypergraphT &hgraph, const HyperedgeType &hyperedge) {
        for (auto it = hyperedge.vertices_.rbegin(); it != hyperedge.vertices_.rend(); ++it) {
            if (!hgraph.IsAnchorVertex(*it)) {
                return *it;
            }
        }
        return hyperedge.vertices_.back();
    }

  public:
    MergeRefiner() : isMergeLegal_([](const HypergraphT &, const HyperedgeType &, const HyperedgeType &) { return true; }) {}

    explicit MergeRefiner(LegalityPredicate isMergeLegal) : isMergeLegal_(std::move(isMergeLegal)) {}

    virtual ~MergeRefiner() = default;

    std::string GetRefinerName() const override { return "MergeRefiner"; }

    inline void SetCacheLimit(std::size_t cacheLimit) { cacheLimit_ = cacheLimit; }

    bool Refine(Distribution<HypergraphT> &distribution, std::mt19937 &) override {
        GainManager<HypergraphT> gainManager(distribution, cacheLimit_);
        const HypergraphT &hgraph = distribution.GetHypergraph();

        std::size_t numMerges = 0;
        for (const IndexType anchor : hgraph.GetAnchorVertices()) {
            std::vector<HyperedgeType> hyperedges = hgraph.GetIncidentHyperedges(anchor);

            while (hyperedges.size() >= 2) {
                const HyperedgeType &first = hyperedges[0];
                const HyperedgeType &second = hyperedges[1];

                const bool mergeable = first != second && first.weight_ == second.weight_
                                       && !distribution.IsEmbedded(first) && !distribution.IsEmbedded(second)
                                       && isMergeLegal_(hgraph, first, second);

                if (mergeable && gainManager.MergeHyperedgeGain({first, second}) >= 0) {
                    HyperedgeType merged = gainManager.MergeHyperedges({first, second});
                    BOOST_LOG_TRIVIAL(debug) << GetRefinerName() << " merged two hyperedges of anchor vertex " << anchor
                                             << " into one with " << merged.vertices_.size() << " vertices.";
                    hyperedges.erase(hyperedges.begin(), hyperedges.begin() + 2);
                    hyperedges.insert(hyperedges.begin(), std::move(merged));
                    ++numMerges;
                } else if (LastDependentVertex(hgraph, first) < LastDependentVertex(hgraph, second)) {
                    hyperedges.erase(hyperedges.begin());
                } else {
                    hyperedges.erase(hyperedges.begin() + 1);
                }
            }
        }

        BOOST_LOG_TRIVIAL(info) << GetRefinerName() << " performed " << numMerges << " merges, cost "
                                << gainManager.TotalCost() << ".";
        return numMerges > 0;
    }
};

}    // namespace hpl
