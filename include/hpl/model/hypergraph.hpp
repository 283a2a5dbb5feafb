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
#include <limits>
#include <map>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include "hpl/auxiliary/hash_util.hpp"

namespace hpl {

/**
 * @brief A weighted hyperedge. The vertices are kept sorted and free of duplicates, so that two hyperedges
 * with the same vertex set and weight compare (and hash) equal regardless of where they are stored.
 */
template <typename IndexType = std::size_t, typename CommwType = int>
struct Hyperedge {
    std::vector<IndexType> vertices_;
    CommwType weight_ = 1;

    Hyperedge() = default;

    Hyperedge(std::vector<IndexType> vertices, CommwType weight = 1) : vertices_(std::move(vertices)), weight_(weight) {}

    inline bool Contains(IndexType vertex) const { return std::binary_search(vertices_.begin(), vertices_.end(), vertex); }

    bool operator==(const Hyperedge &other) const { return weight_ == other.weight_ && vertices_ == other.vertices_; }

    bool operator!=(const Hyperedge &other) const { return !(*this == other); }
};

}    // namespace hpl

namespace std {

template <typename IndexType, typename CommwType>
struct hash<hpl::Hyperedge<IndexType, CommwType>> {
    std::size_t operator()(const hpl::Hyperedge<IndexType, CommwType> &hyperedge) const noexcept {
        std::size_t seed = std::hash<CommwType>{}(hyperedge.weight_);
        for (const IndexType &vertex : hyperedge.vertices_) {
            hpl::hash_combine(seed, vertex);
        }
        return seed;
    }
};

}    // namespace std

namespace hpl {

/**
 * @class Hypergraph
 * @brief Hypergraph whose vertices are either anchor vertices or dependent vertices.
 *
 * Vertices are indexed from 0 to NumVertices()-1. Only anchor vertices consume server capacity when the
 * hypergraph is placed onto a network. Every hyperedge contains exactly one anchor vertex.
 *
 * Hyperedges are stored by value and identified by their content, so that merging and splitting can replace
 * them without invalidating references held by the caller. The list of hyperedges as well as the list of
 * hyperedges incident to each vertex are ordered; merges and splits preserve that order.
 */
template <typename IndexType = std::size_t, typename CommwType = int>
class Hypergraph {
    using ThisT = Hypergraph<IndexType, CommwType>;

  public:
    using VertexIdx = IndexType;
    using VertexCommWeightType = CommwType;
    using HyperedgeType = Hyperedge<IndexType, CommwType>;

    Hypergraph() = default;

    Hypergraph(IndexType numVertices)
        : isAnchor_(numVertices, false), incidentHyperedges_(numVertices), neighbourMultiplicity_(numVertices) {}

    Hypergraph(const ThisT &other) = default;
    Hypergraph(ThisT &&other) = default;
    Hypergraph &operator=(const ThisT &other) = default;
    Hypergraph &operator=(ThisT &&other) = default;

    virtual ~Hypergraph() = default;

    inline IndexType NumVertices() const { return static_cast<IndexType>(isAnchor_.size()); }

    inline std::size_t NumHyperedges() const { return hyperedges_.size(); }

    inline std::size_t NumPins() const { return numPins_; }

    inline bool IsAnchorVertex(IndexType vertex) const { return isAnchor_[vertex]; }

    IndexType NumAnchorVertices() const {
        return static_cast<IndexType>(std::count(isAnchor_.begin(), isAnchor_.end(), true));
    }

    std::vector<IndexType> GetAnchorVertices() const;

    inline const std::vector<HyperedgeType> &Hyperedges() const { return hyperedges_; }

    inline const std::vector<HyperedgeType> &GetIncidentHyperedges(IndexType vertex) const {
        return incidentHyperedges_[vertex];
    }

    std::vector<IndexType> GetNeighbours(IndexType vertex) const;

    inline bool HasHyperedge(const HyperedgeType &hyperedge) const { return hyperedgeMultiplicity_.count(hyperedge) > 0; }

    IndexType GetAnchorVertex(const HyperedgeType &hyperedge) const;

    IndexType AddVertex(bool anchor = false);
    void SetAnchorVertex(IndexType vertex, bool anchor);

    void AddHyperedge(const std::vector<IndexType> &vertices, CommwType weight = 1);
    void RemoveHyperedge(const HyperedgeType &hyperedge);

    // structural edits, each either fully applied or not applied at all
    HyperedgeType MergeHyperedges(const std::vector<HyperedgeType> &toMerge);
    void SplitHyperedge(const HyperedgeType &oldHyperedge, const std::vector<HyperedgeType> &newHyperedges);

    void Clear();

  private:
    std::vector<bool> isAnchor_;
    std::vector<HyperedgeType> hyperedges_;
    std::vector<std::vector<HyperedgeType>> incidentHyperedges_;

    // number of hyperedges containing both vertices, per pair of vertices
    std::vector<std::map<IndexType, unsigned>> neighbourMultiplicity_;
    std::unordered_map<HyperedgeType, unsigned> hyperedgeMultiplicity_;
    std::size_t numPins_ = 0;

    void ValidateHyperedge(const std::vector<IndexType> &vertices) const;
    void RegisterHyperedge(const HyperedgeType &hyperedge);
    void UnregisterHyperedge(const HyperedgeType &hyperedge);
    void ReplaceHyperedges(const std::vector<HyperedgeType> &oldHyperedges, const std::vector<HyperedgeType> &newHyperedges);

    template <typename ContainerT>
    static std::size_t FirstPosition(const ContainerT &container, const HyperedgeType &hyperedge) {
        return static_cast<std::size_t>(std::find(container.begin(), container.end(), hyperedge) - container.begin());
    }
};

using HypergraphDefT = Hypergraph<std::size_t, int>;

template <typename IndexType, typename CommwType>
std::vector<IndexType> Hypergraph<IndexType, CommwType>::GetAnchorVertices() const {
    std::vector<IndexType> anchors;
    for (IndexType vertex = 0; vertex < NumVertices(); ++vertex) {
        if (isAnchor_[vertex]) {
            anchors.push_back(vertex);
        }
    }
    return anchors;
}

template <typename IndexType, typename CommwType>
std::vector<IndexType> Hypergraph<IndexType, CommwType>::GetNeighbours(IndexType vertex) const {
    std::vector<IndexType> neighbours;
    neighbours.reserve(neighbourMultiplicity_[vertex].size());
    for (const auto &[neighbour, multiplicity] : neighbourMultiplicity_[vertex]) {
        neighbours.push_back(neighbour);
    }
    return neighbours;
}

template <typename IndexType, typename CommwType>
IndexType Hypergraph<IndexType, CommwType>::GetAnchorVertex(const HyperedgeType &hyperedge) const {
    for (const IndexType vertex : hyperedge.vertices_) {
        if (isAnchor_[vertex]) {
            return vertex;
        }
    }
    throw std::invalid_argument("Invalid Argument while looking up anchor vertex: hyperedge has no anchor vertex.");
}

template <typename IndexType, typename CommwType>
IndexType Hypergraph<IndexType, CommwType>::AddVertex(bool anchor) {
    isAnchor_.push_back(anchor);
    incidentHyperedges_.emplace_back();
    neighbourMultiplicity_.emplace_back();
    return NumVertices() - 1;
}

template <typename IndexType, typename CommwType>
void Hypergraph<IndexType, CommwType>::SetAnchorVertex(IndexType vertex, bool anchor) {
    if (vertex >= NumVertices()) {
        throw std::invalid_argument("Invalid Argument while setting vertex role: vertex index out of range.");
    } else if (!incidentHyperedges_[vertex].empty()) {
        throw std::invalid_argument("Invalid Argument while setting vertex role: vertex already belongs to a hyperedge.");
    } else {
        isAnchor_[vertex] = anchor;
    }
}

template <typename IndexType, typename CommwType>
void Hypergraph<IndexType, CommwType>::ValidateHyperedge(const std::vector<IndexType> &vertices) const {
    if (vertices.empty()) {
        throw std::invalid_argument("Invalid Argument while adding hyperedge: hyperedges must contain at least one vertex.");
    }

    unsigned nrAnchors = 0;
    for (std::size_t idx = 0; idx < vertices.size(); ++idx) {
        if (vertices[idx] >= NumVertices()) {
            throw std::invalid_argument("Invalid Argument while adding hyperedge: vertex index out of range.");
        }
        if (idx > 0 && vertices[idx - 1] >= vertices[idx]) {
            throw std::invalid_argument("Invalid Argument while adding hyperedge: vertices must be strictly increasing.");
        }
        if (isAnchor_[vertices[idx]]) {
            ++nrAnchors;
        }
    }

    if (nrAnchors != 1) {
        throw std::invalid_argument("Invalid Argument while adding hyperedge: hyperedge must contain exactly one anchor vertex.");
    }
}

template <typename IndexType, typename CommwType>
void Hypergraph<IndexType, CommwType>::RegisterHyperedge(const HyperedgeType &hyperedge) {
    for (const IndexType vertex : hyperedge.vertices_) {
        for (const IndexType other : hyperedge.vertices_) {
            if (vertex != other) {
                ++neighbourMultiplicity_[vertex][other];
            }
        }
    }
    ++hyperedgeMultiplicity_[hyperedge];
    numPins_ += hyperedge.vertices_.size();
}

template <typename IndexType, typename CommwType>
void Hypergraph<IndexType, CommwType>::UnregisterHyperedge(const HyperedgeType &hyperedge) {
    for (const IndexType vertex : hyperedge.vertices_) {
        for (const IndexType other : hyperedge.vertices_) {
            if (vertex == other) {
                continue;
            }
            auto it = neighbourMultiplicity_[vertex].find(other);
            if (--(it->second) == 0) {
                neighbourMultiplicity_[vertex].erase(it);
            }
        }
    }
    auto it = hyperedgeMultiplicity_.find(hyperedge);
    if (--(it->second) == 0) {
        hyperedgeMultiplicity_.erase(it);
    }
    numPins_ -= hyperedge.vertices_.size();
}

template <typename IndexType, typename CommwType>
void Hypergraph<IndexType, CommwType>::AddHyperedge(const std::vector<IndexType> &vertices, CommwType weight) {
    ValidateHyperedge(vertices);

    HyperedgeType hyperedge(vertices, weight);
    for (const IndexType vertex : vertices) {
        incidentHyperedges_[vertex].push_back(hyperedge);
    }
    RegisterHyperedge(hyperedge);
    hyperedges_.push_back(std::move(hyperedge));
}

template <typename IndexType, typename CommwType>
void Hypergraph<IndexType, CommwType>::RemoveHyperedge(const HyperedgeType &hyperedge) {
    if (!HasHyperedge(hyperedge)) {
        throw std::invalid_argument("Invalid Argument while removing hyperedge: hyperedge is not in this hypergraph.");
    }

    hyperedges_.erase(hyperedges_.begin() + static_cast<std::ptrdiff_t>(FirstPosition(hyperedges_, hyperedge)));
    for (const IndexType vertex : hyperedge.vertices_) {
        auto &incident = incidentHyperedges_[vertex];
        incident.erase(incident.begin() + static_cast<std::ptrdiff_t>(FirstPosition(incident, hyperedge)));
    }
    UnregisterHyperedge(hyperedge);
}

// New hyperedges take the lowest position held by the replaced ones, both in the global list and in the
// incident list of every vertex.
template <typename IndexType, typename CommwType>
void Hypergraph<IndexType, CommwType>::ReplaceHyperedges(const std::vector<HyperedgeType> &oldHyperedges,
                                                         const std::vector<HyperedgeType> &newHyperedges) {
    std::vector<std::size_t> oldPositions;
    for (const HyperedgeType &hyperedge : oldHyperedges) {
        oldPositions.push_back(FirstPosition(hyperedges_, hyperedge));
    }
    const std::size_t insertAt = *std::min_element(oldPositions.begin(), oldPositions.end());

    std::vector<HyperedgeType> updated;
    updated.reserve(hyperedges_.size() + newHyperedges.size());
    for (std::size_t idx = 0; idx < hyperedges_.size(); ++idx) {
        if (idx == insertAt) {
            updated.insert(updated.end(), newHyperedges.begin(), newHyperedges.end());
        }
        if (std::find(oldPositions.begin(), oldPositions.end(), idx) == oldPositions.end()) {
            updated.push_back(hyperedges_[idx]);
        }
    }
    hyperedges_ = std::move(updated);

    std::vector<IndexType> touched;
    for (const HyperedgeType &hyperedge : oldHyperedges) {
        touched.insert(touched.end(), hyperedge.vertices_.begin(), hyperedge.vertices_.end());
    }
    std::sort(touched.begin(), touched.end());
    touched.erase(std::unique(touched.begin(), touched.end()), touched.end());

    for (const IndexType vertex : touched) {
        const auto &incident = incidentHyperedges_[vertex];

        std::vector<std::size_t> positions;
        for (const HyperedgeType &hyperedge : oldHyperedges) {
            if (hyperedge.Contains(vertex)) {
                positions.push_back(FirstPosition(incident, hyperedge));
            }
        }
        const std::size_t vertexInsertAt = *std::min_element(positions.begin(), positions.end());

        std::vector<HyperedgeType> updatedIncident;
        updatedIncident.reserve(incident.size() + newHyperedges.size());
        for (std::size_t idx = 0; idx < incident.size(); ++idx) {
            if (idx == vertexInsertAt) {
                for (const HyperedgeType &hyperedge : newHyperedges) {
                    if (hyperedge.Contains(vertex)) {
                        updatedIncident.push_back(hyperedge);
                    }
                }
            }
            if (std::find(positions.begin(), positions.end(), idx) == positions.end()) {
                updatedIncident.push_back(incident[idx]);
            }
        }
        incidentHyperedges_[vertex] = std::move(updatedIncident);
    }

    for (const HyperedgeType &hyperedge : newHyperedges) {
        RegisterHyperedge(hyperedge);
    }
    for (const HyperedgeType &hyperedge : oldHyperedges) {
        UnregisterHyperedge(hyperedge);
    }
}

template <typename IndexType, typename CommwType>
typename Hypergraph<IndexType, CommwType>::HyperedgeType Hypergraph<IndexType, CommwType>::MergeHyperedges(
    const std::vector<HyperedgeType> &toMerge) {
    if (toMerge.empty()) {
        throw std::invalid_argument("Invalid Argument while merging hyperedges: no hyperedges given.");
    }

    for (std::size_t idx = 0; idx < toMerge.size(); ++idx) {
        if (!HasHyperedge(toMerge[idx])) {
            throw std::invalid_argument("Invalid Argument while merging hyperedges: hyperedge is not in this hypergraph.");
        }
        if (toMerge[idx].weight_ != toMerge.front().weight_) {
            throw std::invalid_argument("Invalid Argument while merging hyperedges: weights of hyperedges to merge differ.");
        }
        if (std::find(toMerge.begin(), toMerge.begin() + static_cast<std::ptrdiff_t>(idx), toMerge[idx])
            != toMerge.begin() + static_cast<std::ptrdiff_t>(idx)) {
            throw std::invalid_argument("Invalid Argument while merging hyperedges: hyperedges to merge must be unique.");
        }
    }

    std::vector<IndexType> vertices;
    for (const HyperedgeType &hyperedge : toMerge) {
        vertices.insert(vertices.end(), hyperedge.vertices_.begin(), hyperedge.vertices_.end());
    }
    std::sort(vertices.begin(), vertices.end());
    vertices.erase(std::unique(vertices.begin(), vertices.end()), vertices.end());

    ValidateHyperedge(vertices);

    HyperedgeType merged(std::move(vertices), toMerge.front().weight_);
    ReplaceHyperedges(toMerge, {merged});
    return merged;
}

template <typename IndexType, typename CommwType>
void Hypergraph<IndexType, CommwType>::SplitHyperedge(const HyperedgeType &oldHyperedge,
                                                      const std::vector<HyperedgeType> &newHyperedges) {
    if (!HasHyperedge(oldHyperedge)) {
        throw std::invalid_argument("Invalid Argument while splitting hyperedge: hyperedge is not in this hypergraph.");
    }
    if (newHyperedges.empty()) {
        throw std::invalid_argument("Invalid Argument while splitting hyperedge: no hyperedges given.");
    }

    std::vector<IndexType> covered;
    for (const HyperedgeType &hyperedge : newHyperedges) {
        ValidateHyperedge(hyperedge.vertices_);
        covered.insert(covered.end(), hyperedge.vertices_.begin(), hyperedge.vertices_.end());
    }
    std::sort(covered.begin(), covered.end());
    covered.erase(std::unique(covered.begin(), covered.end()), covered.end());

    if (covered != oldHyperedge.vertices_) {
        throw std::invalid_argument("Invalid Argument while splitting hyperedge: new hyperedges do not match the vertices of the old one.");
    }

    ReplaceHyperedges({oldHyperedge}, newHyperedges);
}

template <typename IndexType, typename CommwType>
void Hypergraph<IndexType, CommwType>::Clear() {
    isAnchor_.clear();
    hyperedges_.clear();
    incidentHyperedges_.clear();
    neighbourMultiplicity_.clear();
    hyperedgeMultiplicity_.clear();
    numPins_ = 0;
}

}    // namespace hpl
