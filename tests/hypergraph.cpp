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

#define BOOST_TEST_MODULE HYPERGRAPH
#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <vector>

#include "hpl/model/hypergraph.hpp"
#include "hpl/model/hypergraph_utility.hpp"
#include "hpl/model/placement.hpp"

using namespace hpl;

using HypergraphImpl = HypergraphDefT;
using HyperedgeT = HypergraphImpl::HyperedgeType;

namespace {

// anchors 0 and 1, dependent vertices 2 to 5
HypergraphImpl MakeHypergraph() {
    HypergraphImpl hgraph(6);
    hgraph.SetAnchorVertex(0, true);
    hgraph.SetAnchorVertex(1, true);
    hgraph.AddHyperedge({0, 2, 3});
    hgraph.AddHyperedge({0, 4});
    hgraph.AddHyperedge({1, 4, 5});
    hgraph.AddHyperedge({0, 5}, 2);
    return hgraph;
}

}    // namespace

BOOST_AUTO_TEST_CASE(HypergraphConstruction) {
    HypergraphImpl hgraph = MakeHypergraph();

    BOOST_CHECK_EQUAL(hgraph.NumVertices(), 6);
    BOOST_CHECK_EQUAL(hgraph.NumHyperedges(), 4);
    BOOST_CHECK_EQUAL(hgraph.NumPins(), 10);
    BOOST_CHECK_EQUAL(hgraph.NumAnchorVertices(), 2);
    BOOST_CHECK(hgraph.GetAnchorVertices() == std::vector<std::size_t>({0, 1}));

    BOOST_CHECK(hgraph.GetNeighbours(0) == std::vector<std::size_t>({2, 3, 4, 5}));
    BOOST_CHECK(hgraph.GetNeighbours(4) == std::vector<std::size_t>({0, 1, 5}));
    BOOST_CHECK(hgraph.GetNeighbours(3) == std::vector<std::size_t>({0, 2}));

    BOOST_CHECK_EQUAL(hgraph.GetIncidentHyperedges(0).size(), 3);
    BOOST_CHECK(hgraph.GetIncidentHyperedges(5)[1] == HyperedgeT({0, 5}, 2));
    BOOST_CHECK(hgraph.HasHyperedge(HyperedgeT({0, 5}, 2)));
    BOOST_CHECK(!hgraph.HasHyperedge(HyperedgeT({0, 5}, 1)));

    BOOST_CHECK_EQUAL(hgraph.GetAnchorVertex(HyperedgeT({1, 4, 5})), 1);

    const std::size_t added = hgraph.AddVertex(true);
    BOOST_CHECK_EQUAL(added, 6);
    BOOST_CHECK(hgraph.IsAnchorVertex(added));
    BOOST_CHECK_THROW(hgraph.SetAnchorVertex(0, false), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(HypergraphRejectsMalformedHyperedges) {
    HypergraphImpl hgraph = MakeHypergraph();

    BOOST_CHECK_THROW(hgraph.AddHyperedge({}), std::invalid_argument);
    BOOST_CHECK_THROW(hgraph.AddHyperedge({2, 3}), std::invalid_argument);
    BOOST_CHECK_THROW(hgraph.AddHyperedge({0, 1}), std::invalid_argument);
    BOOST_CHECK_THROW(hgraph.AddHyperedge({0, 3, 2}), std::invalid_argument);
    BOOST_CHECK_THROW(hgraph.AddHyperedge({0, 2, 2}), std::invalid_argument);
    BOOST_CHECK_THROW(hgraph.AddHyperedge({0, 7}), std::invalid_argument);

    BOOST_CHECK_EQUAL(hgraph.NumHyperedges(), 4);
    BOOST_CHECK_EQUAL(hgraph.NumPins(), 10);
}

BOOST_AUTO_TEST_CASE(HypergraphMergeAndSplit) {
    HypergraphImpl hgraph = MakeHypergraph();
    const std::vector<HyperedgeT> original = hgraph.Hyperedges();
    const std::vector<HyperedgeT> incidentOfZero = hgraph.GetIncidentHyperedges(0);
    const std::vector<HyperedgeT> incidentOfFour = hgraph.GetIncidentHyperedges(4);

    const HyperedgeT first({0, 2, 3}, 1);
    const HyperedgeT second({0, 4}, 1);

    const HyperedgeT merged = hgraph.MergeHyperedges({first, second});
    BOOST_CHECK(merged == HyperedgeT({0, 2, 3, 4}, 1));
    BOOST_CHECK_EQUAL(hgraph.NumHyperedges(), 3);
    BOOST_CHECK_EQUAL(hgraph.NumPins(), 9);
    BOOST_CHECK(hgraph.Hyperedges()[0] == merged);
    BOOST_CHECK(!hgraph.HasHyperedge(first));
    BOOST_CHECK(!hgraph.HasHyperedge(second));

    BOOST_CHECK(hgraph.GetIncidentHyperedges(0) == std::vector<HyperedgeT>({merged, HyperedgeT({0, 5}, 2)}));
    BOOST_CHECK(hgraph.GetIncidentHyperedges(4) == std::vector<HyperedgeT>({merged, HyperedgeT({1, 4, 5}, 1)}));
    BOOST_CHECK(hgraph.GetIncidentHyperedges(2) == std::vector<HyperedgeT>({merged}));
    BOOST_CHECK(hgraph.GetNeighbours(4) == std::vector<std::size_t>({0, 1, 2, 3, 5}));

    // split restores the original hyperedges, in their original order
    hgraph.SplitHyperedge(merged, {first, second});
    BOOST_CHECK(hgraph.Hyperedges() == original);
    BOOST_CHECK(hgraph.GetIncidentHyperedges(0) == incidentOfZero);
    BOOST_CHECK(hgraph.GetIncidentHyperedges(4) == incidentOfFour);
    BOOST_CHECK_EQUAL(hgraph.NumPins(), 10);
    BOOST_CHECK(hgraph.GetNeighbours(4) == std::vector<std::size_t>({0, 1, 5}));
    BOOST_CHECK(hgraph.GetNeighbours(2) == std::vector<std::size_t>({0, 3}));
}

BOOST_AUTO_TEST_CASE(HypergraphEditsAreAtomic) {
    HypergraphImpl hgraph = MakeHypergraph();
    const std::vector<HyperedgeT> original = hgraph.Hyperedges();

    // different weights
    BOOST_CHECK_THROW(hgraph.MergeHyperedges({HyperedgeT({0, 4}, 1), HyperedgeT({0, 5}, 2)}), std::invalid_argument);
    // not in the hypergraph
    BOOST_CHECK_THROW(hgraph.MergeHyperedges({HyperedgeT({0, 4}, 1), HyperedgeT({0, 3}, 1)}), std::invalid_argument);
    // not unique
    BOOST_CHECK_THROW(hgraph.MergeHyperedges({HyperedgeT({0, 4}, 1), HyperedgeT({0, 4}, 1)}), std::invalid_argument);
    // two anchors after merging
    BOOST_CHECK_THROW(hgraph.MergeHyperedges({HyperedgeT({0, 4}, 1), HyperedgeT({1, 4, 5}, 1)}), std::invalid_argument);

    // does not cover vertex 5
    BOOST_CHECK_THROW(hgraph.SplitHyperedge(HyperedgeT({1, 4, 5}), {HyperedgeT({1, 4})}), std::invalid_argument);
    // second part has no anchor
    BOOST_CHECK_THROW(hgraph.SplitHyperedge(HyperedgeT({1, 4, 5}), {HyperedgeT({1, 4}), HyperedgeT({5})}),
                      std::invalid_argument);
    // covers an additional vertex
    BOOST_CHECK_THROW(hgraph.SplitHyperedge(HyperedgeT({1, 4, 5}), {HyperedgeT({1, 4, 5}), HyperedgeT({1, 3})}),
                      std::invalid_argument);

    BOOST_CHECK(hgraph.Hyperedges() == original);
    BOOST_CHECK_EQUAL(hgraph.NumPins(), 10);
}

BOOST_AUTO_TEST_CASE(HypergraphRemoveAndDuplicates) {
    HypergraphImpl hgraph = MakeHypergraph();

    hgraph.AddHyperedge({0, 4});
    BOOST_CHECK_EQUAL(hgraph.NumHyperedges(), 5);
    BOOST_CHECK_EQUAL(hgraph.GetIncidentHyperedges(4).size(), 3);

    hgraph.RemoveHyperedge(HyperedgeT({0, 4}));
    BOOST_CHECK(hgraph.HasHyperedge(HyperedgeT({0, 4})));
    BOOST_CHECK(hgraph.GetNeighbours(0) == std::vector<std::size_t>({2, 3, 4, 5}));

    hgraph.RemoveHyperedge(HyperedgeT({0, 4}));
    BOOST_CHECK(!hgraph.HasHyperedge(HyperedgeT({0, 4})));
    BOOST_CHECK(hgraph.GetNeighbours(0) == std::vector<std::size_t>({2, 3, 5}));
    BOOST_CHECK_EQUAL(hgraph.NumPins(), 8);

    BOOST_CHECK_THROW(hgraph.RemoveHyperedge(HyperedgeT({0, 4})), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(BoundaryComputation) {
    HypergraphImpl hgraph(6);
    hgraph.SetAnchorVertex(0, true);
    hgraph.SetAnchorVertex(1, true);
    hgraph.AddHyperedge({0, 2, 3});
    hgraph.AddHyperedge({1, 4, 5});

    Placement<HypergraphImpl> placement({0, 1, 0, 0, 1, 1});
    BOOST_CHECK(placement.IsTotal());
    BOOST_CHECK(ComputeBoundary(hgraph, placement).empty());

    placement.SetAssignedServer(3, 1);
    BOOST_CHECK(ComputeBoundary(hgraph, placement) == std::vector<std::size_t>({0, 2, 3}));
    BOOST_CHECK(placement.GetVerticesIn(1) == std::vector<std::size_t>({1, 3, 4, 5}));

    BOOST_CHECK(ComputeServerSet<HypergraphImpl>(HyperedgeT({0, 2, 3}), placement) == std::vector<unsigned>({0, 1}));

    Placement<HypergraphImpl> partial(static_cast<std::size_t>(3));
    BOOST_CHECK(!partial.IsTotal());
    partial.SetAssignedServers({0, 0, 0});
    BOOST_CHECK(partial.IsTotal());
    BOOST_CHECK_THROW(partial.SetAssignedServers({0, 0}), std::invalid_argument);
}
