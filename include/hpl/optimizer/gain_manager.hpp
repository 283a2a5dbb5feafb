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
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "hpl/auxiliary/exceptions.hpp"
#include "hpl/auxiliary/hash_util.hpp"
#include "hpl/model/distribution.hpp"
#include "hpl/model/hypergraph_utility.hpp"
#include "hpl/model/steiner_tree.hpp"

namespace hpl {

/**
 * @class GainManager
 * @brief Keeps the placement of a distribution together with the costs derived from it.
 *
 * The gain manager is the only component that relocates vertices during an optimisation run. It maintains
 *  - the number of anchor vertices hosted by every server,
 *  - the cost of every hyperedge under the current placement,
 *  - a memo of Steiner tree sizes, keyed by sets of servers of size at most the maximal key size.
 *
 * The distribution is borrowed for the lifetime of the gain manager. While attached, the distribution refuses
 * placement changes from anywhere else. Positive gains mean a decrease of the cost.
 */
template <typename HypergraphT>
class GainManager {
  public:
    using IndexType = typename HypergraphT::VertexIdx;
    using CostType = typename HypergraphT::VertexCommWeightType;
    using HyperedgeType = typename HypergraphT::HyperedgeType;
    using DistributionT = Distribution<HypergraphT>;

    /**
     * @class ScopedMove
     * @brief Moves a vertex for the lifetime of the object and moves it back on destruction.
     *
     * If costs are not recalculated, the cached cost of the hyperedges incident to the vertex is stale while
     * the move is active; only placement based queries such as Gain() may be used until it is restored.
     * Structural edits are not allowed while a scoped move is active. Moving back restores the costs saved on
     * construction and does not allocate.
     */
    class ScopedMove {
      private:
        GainManager &gainManager_;
        IndexType vertex_;
        unsigned origin_;
        std::vector<CostType> savedCosts_;

      public:
        ScopedMove(GainManager &gainManager, IndexType vertex, unsigned server, bool recalculateCost = true)
            : gainManager_(gainManager), vertex_(vertex), origin_(gainManager.CurrentServer(vertex)) {
            if (recalculateCost) {
                savedCosts_ = gainManager_.IncidentCosts(vertex_);
            }
            gainManager_.Move(vertex_, server, recalculateCost);
        }

        ScopedMove(const ScopedMove &) = delete;
        ScopedMove &operator=(const ScopedMove &) = delete;

        ~ScopedMove() { gainManager_.RestoreMove(vertex_, origin_, savedCosts_); }
    };

  private:
    DistributionT &distribution_;

    std::vector<unsigned> occupancy_;
    std::unordered_map<HyperedgeType, CostType> hyperedgeCostMap_;
    std::unordered_map<std::vector<unsigned>, unsigned, server_set_hash> steinerCache_;

    std::size_t maxKeySize_;
    std::size_t numSteinerComputations_ = 0;

    void Relocate(IndexType vertex, unsigned server) noexcept {
        const unsigned current = CurrentServer(vertex);
        if (distribution_.GetHypergraph().IsAnchorVertex(vertex)) {
            --occupancy_[current];
            ++occupancy_[server];
        }
        distribution_.MutablePlacement().SetAssignedServer(vertex, server);
    }

    void ApplyMove(IndexType vertex, unsigned server, bool recalculateCost) {
        Relocate(vertex, server);

        if (recalculateCost) {
            for (const HyperedgeType &hyperedge : distribution_.GetHypergraph().GetIncidentHyperedges(vertex)) {
                UpdateCost(hyperedge);
            }
        }
    }

    std::vector<CostType> IncidentCosts(IndexType vertex) const {
        std::vector<CostType> costs;
        for (const HyperedgeType &hyperedge : distribution_.GetHypergraph().GetIncidentHyperedges(vertex)) {
            costs.push_back(hyperedgeCostMap_.at(hyperedge));
        }
        return costs;
    }

    // savedCosts is either empty or holds the costs of the incident hyperedges before the move
    void RestoreMove(IndexType vertex, unsigned origin, const std::vector<CostType> &savedCosts) noexcept {
        Relocate(vertex, origin);

        const auto &incident = distribution_.GetHypergraph().GetIncidentHyperedges(vertex);
        for (std::size_t i = 0; i < savedCosts.size() && i < incident.size(); ++i) {
            const auto it = hyperedgeCostMap_.find(incident[i]);
            if (it != hyperedgeCostMap_.end()) {
                it->second = savedCosts[i];
            }
        }
    }

    void CheckNotEmbedded(const HyperedgeType &hyperedge) const {
        if (distribution_.IsEmbedded(hyperedge)) {
            throw PlacementLockedError("Hyperedges with a committed embedding cannot be merged or split.");
        }
    }

    CostType ComputeHyperedgeCost(const HyperedgeType &hyperedge) {
        return hyperedge.weight_
               * static_cast<CostType>(SteinerCost(ComputeServerSet<HypergraphT>(hyperedge, distribution_.GetPlacement())));
    }

    CostType CachedCost(const HyperedgeType &hyperedge) {
        const auto it = hyperedgeCostMap_.find(hyperedge);
        return it != hyperedgeCostMap_.end() ? it->second : ComputeHyperedgeCost(hyperedge);
    }

    void RefreshCosts(const std::vector<HyperedgeType> &removed, const std::vector<HyperedgeType> &added) {
        for (const HyperedgeType &hyperedge : removed) {
            if (!distribution_.GetHypergraph().HasHyperedge(hyperedge)) {
                hyperedgeCostMap_.erase(hyperedge);
            }
        }
        for (const HyperedgeType &hyperedge : added) {
            UpdateCost(hyperedge);
        }
    }

  public:
    explicit GainManager(DistributionT &distribution, std::size_t maxKeySize = 5)
        : distribution_(distribution), maxKeySize_(maxKeySize) {
        if (!distribution_.IsPlacement()) {
            throw InvalidPlacementError("Invalid Argument while initialising gain manager: placement is not total or refers to unknown servers.");
        }

        occupancy_ = distribution_.ComputeOccupancy();
        for (const HyperedgeType &hyperedge : distribution_.GetHypergraph().Hyperedges()) {
            UpdateCost(hyperedge);
        }
        ++distribution_.numAttachedManagers_;
    }

    GainManager(const GainManager &) = delete;
    GainManager &operator=(const GainManager &) = delete;

    virtual ~GainManager() { --distribution_.numAttachedManagers_; }

    // getters

    inline const DistributionT &GetDistribution() const { return distribution_; }

    inline unsigned CurrentServer(IndexType vertex) const { return distribution_.GetPlacement().AssignedServer(vertex); }

    inline unsigned GetOccupancy(unsigned server) const { return occupancy_[server]; }

    inline const std::vector<unsigned> &GetOccupancy() const { return occupancy_; }

    inline const std::unordered_map<HyperedgeType, CostType> &GetHyperedgeCostMap() const { return hyperedgeCostMap_; }

    inline std::size_t GetMaxKeySize() const { return maxKeySize_; }

    inline void SetMaxKeySize(std::size_t maxKeySize) { maxKeySize_ = maxKeySize; }

    inline std::size_t GetNumSteinerComputations() const { return numSteinerComputations_; }

    inline std::size_t GetSteinerCacheSize() const { return steinerCache_.size(); }

    inline bool IsFull(unsigned server) const { return occupancy_[server] >= distribution_.GetNetwork().Capacity(server); }

    /**
     * @brief Number of edges of a Steiner tree connecting the servers.
     *
     * Sets of at most GetMaxKeySize() servers are memoised; larger sets are recomputed on every call.
     *
     * @param servers Sorted and duplicate-free set of servers.
     */
    unsigned SteinerCost(const std::vector<unsigned> &servers) {
        if (servers.size() > maxKeySize_) {
            ++numSteinerComputations_;
            return hpl::SteinerCost(distribution_.GetNetwork(), servers);
        }

        const auto it = steinerCache_.find(servers);
        if (it != steinerCache_.end()) {
            return it->second;
        }

        ++numSteinerComputations_;
        const unsigned cost = hpl::SteinerCost(distribution_.GetNetwork(), servers);
        steinerCache_.emplace(servers, cost);
        return cost;
    }

    void UpdateCost(const HyperedgeType &hyperedge) { hyperedgeCostMap_[hyperedge] = ComputeHyperedgeCost(hyperedge); }

    /**
     * @brief Gain of moving a vertex to another server, evaluated on the current placement.
     *
     * A hyperedge only changes its cost if the vertex is the last of its pins on the old server or the first
     * one on the new server. The cached hyperedge costs are not read, so the gain is correct while a
     * speculative move without cost recalculation is active.
     */
    CostType Gain(IndexType vertex, unsigned newServer) {
        const unsigned current = CurrentServer(vertex);
        if (newServer == current) {
            return 0;
        }

        const auto &placement = distribution_.GetPlacement();
        CostType gain = 0;
        for (const HyperedgeType &hyperedge : distribution_.GetHypergraph().GetIncidentHyperedges(vertex)) {
            const std::vector<unsigned> servers = ComputeServerSet<HypergraphT>(hyperedge, placement);

            unsigned pinsInCurrent = 0;
            for (const IndexType pin : hyperedge.vertices_) {
                if (placement.AssignedServer(pin) == current) {
                    ++pinsInCurrent;
                }
            }

            const bool leaves = pinsInCurrent == 1;
            const bool arrives = !std::binary_search(servers.begin(), servers.end(), newServer);
            if (!leaves && !arrives) {
                continue;
            }

            std::vector<unsigned> newServers = servers;
            if (leaves) {
                newServers.erase(std::lower_bound(newServers.begin(), newServers.end(), current));
            }
            if (arrives) {
                newServers.insert(std::lower_bound(newServers.begin(), newServers.end(), newServer), newServer);
            }

            gain += hyperedge.weight_
                    * (static_cast<CostType>(SteinerCost(servers)) - static_cast<CostType>(SteinerCost(newServers)));
        }
        return gain;
    }

    /**
     * @brief Gain of moving a vertex, obtained by performing the move, reading the updated costs and undoing it.
     *
     * Must not be called while a speculative move without cost recalculation is active.
     */
    CostType GainByMove(IndexType vertex, unsigned newServer) {
        if (newServer == CurrentServer(vertex)) {
            return 0;
        }

        const auto &incident = distribution_.GetHypergraph().GetIncidentHyperedges(vertex);
        CostType before = 0;
        for (const HyperedgeType &hyperedge : incident) {
            before += hyperedgeCostMap_.at(hyperedge);
        }

        CostType after = 0;
        {
            ScopedMove guard(*this, vertex, newServer);
            for (const HyperedgeType &hyperedge : incident) {
                after += hyperedgeCostMap_.at(hyperedge);
            }
        }
        return before - after;
    }

    template <typename FuncT>
    auto WithSpeculativeMove(IndexType vertex, unsigned server, FuncT &&func, bool recalculateCost = true) {
        ScopedMove guard(*this, vertex, server, recalculateCost);
        return func();
    }

    /**
     * @brief Relocates a vertex. Capacities are not checked, see IsMoveValid().
     *
     * @throws PlacementLockedError if an embedding has been committed for the distribution.
     */
    void Move(IndexType vertex, unsigned server, bool recalculateCost = true) {
        if (distribution_.IsLocked()) {
            throw PlacementLockedError("Vertices cannot be moved once an embedding has been committed.");
        }
        if (server >= distribution_.GetNetwork().NumServers()) {
            throw InvalidPlacementError("Invalid Argument while moving vertex: unknown server.");
        }
        ApplyMove(vertex, server, recalculateCost);
    }

    // moving into the current server is always valid
    bool IsMoveValid(IndexType vertex, unsigned server) const {
        if (!distribution_.GetHypergraph().IsAnchorVertex(vertex) || server == CurrentServer(vertex)) {
            return true;
        }
        return occupancy_[server] < distribution_.GetNetwork().Capacity(server);
    }

    // structural edits

    CostType MergeHyperedgeGain(const std::vector<HyperedgeType> &toMerge) {
        if (toMerge.empty()) {
            throw std::invalid_argument("Invalid Argument while computing merge gain: no hyperedges given.");
        }

        CostType before = 0;
        std::vector<IndexType> vertices;
        for (const HyperedgeType &hyperedge : toMerge) {
            if (hyperedge.weight_ != toMerge.front().weight_) {
                throw std::invalid_argument("Invalid Argument while computing merge gain: weights of hyperedges to merge differ.");
            }
            before += CachedCost(hyperedge);
            vertices.insert(vertices.end(), hyperedge.vertices_.begin(), hyperedge.vertices_.end());
        }
        std::sort(vertices.begin(), vertices.end());
        vertices.erase(std::unique(vertices.begin(), vertices.end()), vertices.end());

        return before - ComputeHyperedgeCost(HyperedgeType(std::move(vertices), toMerge.front().weight_));
    }

    CostType SplitHyperedgeGain(const HyperedgeType &oldHyperedge, const std::vector<HyperedgeType> &newHyperedges) {
        CostType after = 0;
        for (const HyperedgeType &hyperedge : newHyperedges) {
            after += CachedCost(hyperedge);
        }
        return CachedCost(oldHyperedge) - after;
    }

    /**
     * @brief Replaces the hyperedges by their union and updates the cost map.
     *
     * @throws PlacementLockedError if an embedding has been committed for one of the hyperedges.
     */
    HyperedgeType MergeHyperedges(const std::vector<HyperedgeType> &toMerge) {
        for (const HyperedgeType &hyperedge : toMerge) {
            CheckNotEmbedded(hyperedge);
        }
        HyperedgeType merged = distribution_.MutableHypergraph().MergeHyperedges(toMerge);
        RefreshCosts(toMerge, {merged});
        return merged;
    }

    void SplitHyperedge(const HyperedgeType &oldHyperedge, const std::vector<HyperedgeType> &newHyperedges) {
        CheckNotEmbedded(oldHyperedge);
        distribution_.MutableHypergraph().SplitHyperedge(oldHyperedge, newHyperedges);
        RefreshCosts({oldHyperedge}, newHyperedges);
    }

    // totals and consistency

    CostType TotalCost() const {
        CostType total = 0;
        for (const HyperedgeType &hyperedge : distribution_.GetHypergraph().Hyperedges()) {
            total += hyperedgeCostMap_.at(hyperedge);
        }
        return total;
    }

    bool CacheMatchesDistribution() const {
        if (occupancy_ != distribution_.ComputeOccupancy()) {
            return false;
        }

        for (const HyperedgeType &hyperedge : distribution_.GetHypergraph().Hyperedges()) {
            const auto it = hyperedgeCostMap_.find(hyperedge);
            if (it == hyperedgeCostMap_.end() || it->second != distribution_.HyperedgeCost(hyperedge)) {
                return false;
            }
        }
        for (const auto &[hyperedge, cost] : hyperedgeCostMap_) {
            if (!distribution_.GetHypergraph().HasHyperedge(hyperedge)) {
                return false;
            }
        }
        return true;
    }
};

}    // namespace hpl
