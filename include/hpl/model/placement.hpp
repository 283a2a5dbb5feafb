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

#include <limits>
#include <stdexcept>
#include <vector>

namespace hpl {

// Represents a placement where each vertex of a hypergraph is assigned to a specific server

template <typename HypergraphT>
class Placement {
  private:
    using IndexType = typename HypergraphT::VertexIdx;

    std::vector<unsigned> vertexToServerAssignment_;

  public:
    static constexpr unsigned kUnassigned = std::numeric_limits<unsigned>::max();

    Placement() = default;

    explicit Placement(IndexType numVertices) : vertexToServerAssignment_(numVertices, kUnassigned) {}

    explicit Placement(const std::vector<unsigned> &serverAssignment) : vertexToServerAssignment_(serverAssignment) {}

    Placement(const Placement<HypergraphT> &placement) = default;
    Placement(Placement<HypergraphT> &&placement) = default;

    Placement &operator=(const Placement<HypergraphT> &placement) = default;
    Placement &operator=(Placement<HypergraphT> &&placement) = default;

    virtual ~Placement() = default;

    // getters and setters

    inline IndexType NumVertices() const { return static_cast<IndexType>(vertexToServerAssignment_.size()); }

    inline unsigned AssignedServer(IndexType vertex) const { return vertexToServerAssignment_[vertex]; }

    inline bool IsAssigned(IndexType vertex) const { return vertexToServerAssignment_[vertex] != kUnassigned; }

    inline const std::vector<unsigned> &AssignedServers() const { return vertexToServerAssignment_; }

    inline void SetAssignedServer(IndexType vertex, unsigned server) { vertexToServerAssignment_.at(vertex) = server; }

    void SetAssignedServers(const std::vector<unsigned> &vec) {
        if (vec.size() == vertexToServerAssignment_.size()) {
            vertexToServerAssignment_ = vec;
        } else {
            throw std::invalid_argument("Invalid Argument while assigning servers: size does not match number of vertices.");
        }
    }

    // extends the placement by one unassigned vertex
    void AddVertex() { vertexToServerAssignment_.push_back(kUnassigned); }

    void Reset() { vertexToServerAssignment_.assign(vertexToServerAssignment_.size(), kUnassigned); }

    bool IsTotal() const {
        for (const unsigned server : vertexToServerAssignment_) {
            if (server == kUnassigned) {
                return false;
            }
        }
        return true;
    }

    std::vector<IndexType> GetVerticesIn(unsigned server) const {
        std::vector<IndexType> content;
        for (IndexType vertex = 0; vertex < NumVertices(); ++vertex) {
            if (vertexToServerAssignment_[vertex] == server) {
                content.push_back(vertex);
            }
        }
        return content;
    }

    bool operator==(const Placement &other) const { return vertexToServerAssignment_ == other.vertexToServerAssignment_; }

    bool operator!=(const Placement &other) const { return !(*this == other); }
};

}    // namespace hpl
