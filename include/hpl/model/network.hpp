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
#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/breadth_first_search.hpp>
#include <boost/graph/connected_components.hpp>
#include <boost/range/iterator_range.hpp>
#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>

namespace hpl {

/**
 * @class Network
 * @brief A connected, undirected network of servers, each able to host a fixed number of anchor vertices.
 *
 * Servers are indexed from 0 to NumServers()-1. The connectivity graph is stored as a Boost adjacency list;
 * hop distances and BFS predecessor trees between all pairs of servers are computed once at construction,
 * since networks are small compared to the hypergraphs placed onto them and are never modified afterwards.
 */
class Network {
  public:
    using GraphT = boost::adjacency_list<boost::vecS, boost::vecS, boost::undirectedS>;
    using CouplingT = std::pair<unsigned, unsigned>;

  private:
    GraphT graph_;
    std::vector<unsigned> capacities_;
    std::vector<CouplingT> couplings_;

    std::vector<std::vector<unsigned>> distances_;
    std::vector<std::vector<std::size_t>> predecessors_;

    void ComputeShortestPaths() {
        const unsigned numServers = NumServers();
        distances_.assign(numServers, std::vector<unsigned>(numServers, 0U));
        predecessors_.assign(numServers, std::vector<std::size_t>(numServers, 0U));

        for (unsigned source = 0; source < numServers; ++source) {
            std::iota(predecessors_[source].begin(), predecessors_[source].end(), 0U);
            boost::breadth_first_search(
                graph_,
                boost::vertex(source, graph_),
                boost::visitor(boost::make_bfs_visitor(
                    std::make_pair(boost::record_distances(distances_[source].data(), boost::on_tree_edge()),
                                   boost::record_predecessors(predecessors_[source].data(), boost::on_tree_edge())))));
        }
    }

  public:
    Network(const std::vector<CouplingT> &couplings, const std::vector<unsigned> &capacities)
        : graph_(capacities.size()), capacities_(capacities) {
        if (capacities.empty()) {
            throw std::invalid_argument("Invalid Argument while constructing network: network must contain at least one server.");
        }

        for (const auto &[first, second] : couplings) {
            if (first >= NumServers() || second >= NumServers()) {
                throw std::invalid_argument("Invalid Argument while constructing network: coupling refers to unknown server.");
            }
            if (first == second) {
                throw std::invalid_argument("Invalid Argument while constructing network: self loops are not allowed.");
            }
            if (HasCoupling(first, second)) {
                continue;
            }
            boost::add_edge(first, second, graph_);
            couplings_.emplace_back(std::min(first, second), std::max(first, second));
        }

        std::vector<std::size_t> component(NumServers());
        if (boost::connected_components(graph_, component.data()) != 1) {
            throw std::invalid_argument("Invalid Argument while constructing network: server graph must be connected.");
        }

        ComputeShortestPaths();
    }

    Network(const Network &other) = default;
    Network(Network &&other) = default;
    Network &operator=(const Network &other) = default;
    Network &operator=(Network &&other) = default;
    virtual ~Network() = default;

    inline unsigned NumServers() const { return static_cast<unsigned>(capacities_.size()); }

    inline unsigned Capacity(unsigned server) const { return capacities_[server]; }

    inline const std::vector<unsigned> &Capacities() const { return capacities_; }

    inline unsigned TotalCapacity() const { return std::accumulate(capacities_.begin(), capacities_.end(), 0U); }

    inline const std::vector<CouplingT> &Couplings() const { return couplings_; }

    inline const GraphT &GetGraph() const { return graph_; }

    inline bool HasCoupling(unsigned first, unsigned second) const { return boost::edge(first, second, graph_).second; }

    inline unsigned Distance(unsigned from, unsigned to) const { return distances_[from][to]; }

    std::vector<unsigned> GetNeighbours(unsigned server) const {
        std::vector<unsigned> neighbours;
        for (const auto &vertex : boost::make_iterator_range(boost::adjacent_vertices(server, graph_))) {
            neighbours.push_back(static_cast<unsigned>(vertex));
        }
        std::sort(neighbours.begin(), neighbours.end());
        return neighbours;
    }

    /**
     * @brief Returns a shortest path from one server to another, both endpoints included.
     */
    std::vector<unsigned> ShortestPath(unsigned from, unsigned to) const {
        std::vector<unsigned> path{to};
        unsigned current = to;
        while (current != from) {
            current = static_cast<unsigned>(predecessors_[from][current]);
            path.push_back(current);
        }
        std::reverse(path.begin(), path.end());
        return path;
    }

    // whether there are enough server slots for all anchor vertices of the hypergraph
    template <typename HypergraphT>
    bool CanImplement(const HypergraphT &hgraph) const {
        return static_cast<std::size_t>(TotalCapacity()) >= static_cast<std::size_t>(hgraph.NumAnchorVertices());
    }
};

inline Network AllToAllNetwork(unsigned numServers, unsigned capacityPerServer) {
    std::vector<Network::CouplingT> couplings;
    for (unsigned first = 0; first < numServers; ++first) {
        for (unsigned second = first + 1; second < numServers; ++second) {
            couplings.emplace_back(first, second);
        }
    }
    return Network(couplings, std::vector<unsigned>(numServers, capacityPerServer));
}

}    // namespace hpl
