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
#include <boost/graph/kruskal_min_spanning_tree.hpp>
#include <iterator>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

#include "hpl/model/network.hpp"

/**
 * @file steiner_tree.hpp
 * @brief Approximate Steiner trees in the server network.
 *
 * Uses the metric closure heuristic of Kou, Markowsky and Berman: a minimum spanning tree over the
 * terminals' metric closure is expanded into shortest paths, a minimum spanning tree of the resulting
 * subgraph is taken and non-terminal leaves are pruned. On tree-shaped networks the result is exact.
 */

namespace hpl {

namespace steiner_detail {

using WeightedGraphT = boost::adjacency_list<boost::vecS,
                                             boost::vecS,
                                             boost::undirectedS,
                                             boost::no_property,
                                             boost::property<boost::edge_weight_t, unsigned>>;

inline std::vector<std::pair<std::size_t, std::size_t>> MinimumSpanningTree(const WeightedGraphT &graph) {
    std::vector<boost::graph_traits<WeightedGraphT>::edge_descriptor> treeEdges;
    boost::kruskal_minimum_spanning_tree(graph, std::back_inserter(treeEdges));

    std::vector<std::pair<std::size_t, std::size_t>> result;
    result.reserve(treeEdges.size());
    for (const auto &edge : treeEdges) {
        result.emplace_back(boost::source(edge, graph), boost::target(edge, graph));
    }
    return result;
}

}    // namespace steiner_detail

/**
 * @brief Computes an approximate Steiner tree connecting the given servers.
 *
 * @param network The server network.
 * @param terminals The servers to connect. Duplicates are ignored.
 * @return The edges of the tree, each given as a (smaller, larger) pair of servers.
 */
inline std::vector<Network::CouplingT> SteinerTree(const Network &network, std::vector<unsigned> terminals) {
    std::sort(terminals.begin(), terminals.end());
    terminals.erase(std::unique(terminals.begin(), terminals.end()), terminals.end());

    if (terminals.empty()) {
        throw std::invalid_argument("Invalid Argument while computing Steiner tree: terminal set is empty.");
    }
    for (const unsigned server : terminals) {
        if (server >= network.NumServers()) {
            throw std::invalid_argument("Invalid Argument while computing Steiner tree: unknown server.");
        }
    }
    if (terminals.size() == 1) {
        return {};
    }

    // metric closure over the terminals
    steiner_detail::WeightedGraphT closure(terminals.size());
    for (std::size_t first = 0; first < terminals.size(); ++first) {
        for (std::size_t second = first + 1; second < terminals.size(); ++second) {
            boost::add_edge(first, second, network.Distance(terminals[first], terminals[second]), closure);
        }
    }

    // expand closure tree edges into shortest paths of the network
    std::set<Network::CouplingT> pathEdges;
    for (const auto &[first, second] : steiner_detail::MinimumSpanningTree(closure)) {
        const std::vector<unsigned> path = network.ShortestPath(terminals[first], terminals[second]);
        for (std::size_t idx = 0; idx + 1 < path.size(); ++idx) {
            pathEdges.emplace(std::min(path[idx], path[idx + 1]), std::max(path[idx], path[idx + 1]));
        }
    }

    std::map<unsigned, std::size_t> localIndex;
    std::vector<unsigned> servers;
    for (const auto &[first, second] : pathEdges) {
        for (const unsigned server : {first, second}) {
            if (localIndex.emplace(server, servers.size()).second) {
                servers.push_back(server);
            }
        }
    }

    steiner_detail::WeightedGraphT subgraph(servers.size());
    for (const auto &[first, second] : pathEdges) {
        boost::add_edge(localIndex[first], localIndex[second], 1U, subgraph);
    }

    std::set<Network::CouplingT> tree;
    for (const auto &[first, second] : steiner_detail::MinimumSpanningTree(subgraph)) {
        tree.emplace(std::min(servers[first], servers[second]), std::max(servers[first], servers[second]));
    }

    // prune leaves which are not terminals
    bool pruned = true;
    while (pruned) {
        pruned = false;
        std::map<unsigned, unsigned> degree;
        for (const auto &[first, second] : tree) {
            ++degree[first];
            ++degree[second];
        }
        for (auto it = tree.begin(); it != tree.end();) {
            const bool firstIsLeaf = degree[it->first] == 1
                                     && !std::binary_search(terminals.begin(), terminals.end(), it->first);
            const bool secondIsLeaf = degree[it->second] == 1
                                      && !std::binary_search(terminals.begin(), terminals.end(), it->second);
            if (firstIsLeaf || secondIsLeaf) {
                it = tree.erase(it);
                pruned = true;
            } else {
                ++it;
            }
        }
    }

    return std::vector<Network::CouplingT>(tree.begin(), tree.end());
}

// number of edges of the Steiner tree connecting the given servers
inline unsigned SteinerCost(const Network &network, const std::vector<unsigned> &terminals) {
    return static_cast<unsigned>(SteinerTree(network, terminals).size());
}

}    // namespace hpl
