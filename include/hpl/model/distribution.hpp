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

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "hpl/auxiliary/exceptions.hpp"
#include "hpl/model/hypergraph_utility.hpp"
#include "hpl/model/network.hpp"
#include "hpl/model/placement.hpp"
#include "hpl/model/steiner_tree.hpp"

namespace hpl {

template <typename HypergraphT>
class GainManager;

/**
 * @class Distribution
 * @brief Bundles a hypergraph, the network it is placed onto and the placement itself.
 *
 * A distribution is valid if the placement is total, only refers to servers of the network and no server
 * hosts more anchor vertices than its capacity. Once an embedding has been committed for one of the
 * hyperedges, the placement is locked and optimisers refuse to relocate vertices.
 *
 * While a GainManager is attached, the placement and the hypergraph can only be changed through it.
 */
template <typename HypergraphT>
class Distribution {
  public:
    using IndexType = typename HypergraphT::VertexIdx;
    using CommwType = typename HypergraphT::VertexCommWeightType;
    using HyperedgeType = typename HypergraphT::HyperedgeType;

  private:
    HypergraphT hgraph_;
    Network network_;
    Placement<HypergraphT> placement_;

    std::unordered_set<HyperedgeType> embeddings_;

    std::size_t numAttachedManagers_ = 0;

    friend class GainManager<HypergraphT>;

    inline HypergraphT &MutableHypergraph() { return hgraph_; }

    inline Placement<HypergraphT> &MutablePlacement() { return placement_; }

    void CheckUnmanaged(const char *operation) const {
        if (numAttachedManagers_ > 0) {
            throw PlacementLockedError(std::string("Invalid operation while ") + operation
                                       + ": distribution is attached to a gain manager.");
        }
    }

    void CheckPlacementWritable(const char *operation) const {
        CheckUnmanaged(operation);
        if (IsLocked()) {
            throw PlacementLockedError(std::string("Invalid operation while ") + operation
                                       + ": an embedding has been committed.");
        }
    }

  public:
    Distribution() = delete;

    Distribution(HypergraphT hgraph, Network network)
        : hgraph_(std::move(hgraph)), network_(std::move(network)), placement_(hgraph_.NumVertices()) {}

    Distribution(HypergraphT hgraph, Network network, Placement<HypergraphT> placement)
        : hgraph_(std::move(hgraph)), network_(std::move(network)), placement_(std::move(placement)) {
        if (placement_.NumVertices() != hgraph_.NumVertices()) {
            throw InvalidPlacementError("Invalid Argument while constructing distribution: placement size does not match number of vertices.");
        }
    }

    // copies and moves never carry over attached gain managers
    Distribution(const Distribution<HypergraphT> &other)
        : hgraph_(other.hgraph_), network_(other.network_), placement_(other.placement_), embeddings_(other.embeddings_) {}

    Distribution(Distribution<HypergraphT> &&other)
        : hgraph_(std::move(other.hgraph_)),
          network_(std::move(other.network_)),
          placement_(std::move(other.placement_)),
          embeddings_(std::move(other.embeddings_)) {}

    Distribution &operator=(const Distribution<HypergraphT> &other) {
        if (this != &other) {
            CheckUnmanaged("assigning distribution");
            hgraph_ = other.hgraph_;
            network_ = other.network_;
            placement_ = other.placement_;
            embeddings_ = other.embeddings_;
        }
        return *this;
    }

    Distribution &operator=(Distribution<HypergraphT> &&other) {
        if (this != &other) {
            CheckUnmanaged("assigning distribution");
            hgraph_ = std::move(other.hgraph_);
            network_ = std::move(other.network_);
            placement_ = std::move(other.placement_);
            embeddings_ = std::move(other.embeddings_);
        }
        return *this;
    }

    virtual ~Distribution() = default;

    inline const HypergraphT &GetHypergraph() const { return hgraph_; }

    inline const Network &GetNetwork() const { return network_; }

    inline const Placement<HypergraphT> &GetPlacement() const { return placement_; }

    inline bool HasGainManager() const { return numAttachedManagers_ > 0; }

    /**
     * @brief Replaces the whole placement.
     *
     * @throws PlacementLockedError if a gain manager is attached or an embedding has been committed.
     */
    void SetPlacement(Placement<HypergraphT> placement) {
        CheckPlacementWritable("setting placement");
        if (placement.NumVertices() != hgraph_.NumVertices()) {
            throw InvalidPlacementError("Invalid Argument while setting placement: placement size does not match number of vertices.");
        }
        placement_ = std::move(placement);
    }

    void SetAssignedServer(IndexType vertex, unsigned server) {
        CheckPlacementWritable("assigning server");
        placement_.SetAssignedServer(vertex, server);
    }

    void ResetPlacement() {
        CheckPlacementWritable("resetting placement");
        placement_.Reset();
    }

    // whether the placement is total and only uses servers of the network
    bool IsPlacement() const {
        if (placement_.NumVertices() != hgraph_.NumVertices()) {
            return false;
        }
        for (const unsigned server : placement_.AssignedServers()) {
            if (server >= network_.NumServers()) {
                return false;
            }
        }
        return true;
    }

    std::vector<unsigned> ComputeOccupancy() const {
        if (!IsPlacement()) {
            throw InvalidPlacementError("Invalid Argument while computing occupancy: placement is not total or refers to unknown servers.");
        }
        std::vector<unsigned> occupancy(network_.NumServers(), 0U);
        for (IndexType vertex = 0; vertex < hgraph_.NumVertices(); ++vertex) {
            if (hgraph_.IsAnchorVertex(vertex)) {
                ++occupancy[placement_.AssignedServer(vertex)];
            }
        }
        return occupancy;
    }

    bool IsValid() const {
        if (!IsPlacement()) {
            return false;
        }
        const std::vector<unsigned> occupancy = ComputeOccupancy();
        for (unsigned server = 0; server < network_.NumServers(); ++server) {
            if (occupancy[server] > network_.Capacity(server)) {
                return false;
            }
        }
        return true;
    }

    CommwType HyperedgeCost(const HyperedgeType &hyperedge) const {
        return hyperedge.weight_
               * static_cast<CommwType>(SteinerCost(network_, ComputeServerSet<HypergraphT>(hyperedge, placement_)));
    }

    /**
     * @brief Total communication cost: the sum over all hyperedges of weight times Steiner tree size.
     *
     * @throws InvalidPlacementError if the distribution is not valid.
     */
    CommwType Cost() const {
        if (!IsValid()) {
            throw InvalidPlacementError("Invalid Argument while computing cost: distribution is not valid.");
        }
        CommwType total = 0;
        for (const HyperedgeType &hyperedge : hgraph_.Hyperedges()) {
            total += HyperedgeCost(hyperedge);
        }
        return total;
    }

    // embedding commitments

    void CommitEmbedding(const HyperedgeType &hyperedge) {
        if (!hgraph_.HasHyperedge(hyperedge)) {
            throw std::invalid_argument("Invalid Argument while committing embedding: hyperedge is not in the hypergraph.");
        }
        embeddings_.insert(hyperedge);
    }

    inline bool IsEmbedded(const HyperedgeType &hyperedge) const { return embeddings_.count(hyperedge) > 0; }

    inline bool IsLocked() const { return !embeddings_.empty(); }
};

}    // namespace hpl
