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

#define BOOST_TEST_MODULE BOUNDARY_REALLOCATION
#include <boost/test/unit_test.hpp>
#include <random>
#include <vector>

#include "hpl/model/distribution.hpp"
#include "hpl/optimizer/gain_manager.hpp"
#include "hpl/refiners/boundary_reallocation.hpp"
#include "hpl/refiners/capacity_repair.hpp"

using namespace hpl;

using HypergraphImpl = HypergraphDefT;
using HyperedgeT = HypergraphImpl::HyperedgeType;

namespace {

HypergraphImpl MakeHypergraph() {
    HypergraphImpl hgraph(10);
    for (std::size_t vertex = 0; vertex < 4; ++vertex) {
        hgraph.SetAnchorVertex(vertex, true);
    }
    hgraph.AddHyperedge({0, 4, 5});
    hgraph.AddHyperedge({1, 4, 6});
    hgraph.AddHyperedge({2, 5, 6, 7});
    hgraph.AddHyperedge({3, 7, 8});
    hgraph.AddHyperedge({0, 8, 9}, 2);
    hgraph.AddHyperedge({2, 9});
    hgraph.AddHyperedge({1, 6, 7});
    return hgraph;
}

Network MakeNetwork() { return Network({{0, 1}, {0, 2}, {0, 3}, {3, 4}}, {1, 2, 2, 1, 2}); }

// total placement which may violate capacities
Distribution<HypergraphImpl> MakeRandomDistribution(unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<unsigned> serverDist(0, 4);

    std::vector<unsigned> servers(10);
    for (unsigned &server : servers) {
        server = serverDist(gen);
    }
    return Distribution<HypergraphImpl>(MakeHypergraph(), MakeNetwork(), Placement<HypergraphImpl>(servers));
}

// two servers of capacity two, all anchors initially on the first one
Distribution<HypergraphImpl> MakeOverfullDistribution() {
    HypergraphImpl hgraph(6);
    for (std::size_t vertex = 0; vertex < 3; ++vertex) {
        hgraph.SetAnchorVertex(vertex, true);
    }
    hgraph.AddHyperedge({0, 3, 4});
    hgraph.AddHyperedge({1, 4});
    hgraph.AddHyperedge({2, 5});

    return Distribution<HypergraphImpl>(
        hgraph, Network({{0, 1}}, {2, 2}), Placement<HypergraphImpl>(std::vector<unsigned>({0, 0, 0, 0, 1, 0})));
}

}    // namespace

BOOST_AUTO_TEST_CASE(CapacityRepair) {
    Distribution<HypergraphImpl> distribution = MakeOverfullDistribution();
    BOOST_CHECK(distribution.IsPlacement());
    BOOST_CHECK(!distribution.IsValid());

    GainManager<HypergraphImpl> gainManager(distribution);
    BOOST_CHECK_EQUAL(RepairCapacity(gainManager), 1);

    BOOST_CHECK(distribution.IsValid());
    BOOST_CHECK(distribution.GetPlacement().AssignedServers() == std::vector<unsigned>({1, 0, 0, 0, 1, 0}));
    BOOST_CHECK(gainManager.GetOccupancy() == std::vector<unsigned>({2, 1}));
    BOOST_CHECK(gainManager.CacheMatchesDistribution());

    // nothing left to repair
    BOOST_CHECK_EQUAL(RepairCapacity(gainManager), 0);
}

BOOST_AUTO_TEST_CASE(InfeasibleNetwork) {
    HypergraphImpl hgraph(4);
    for (std::size_t vertex = 0; vertex < 3; ++vertex) {
        hgraph.SetAnchorVertex(vertex, true);
    }
    hgraph.AddHyperedge({0, 3});

    Distribution<HypergraphImpl> distribution(
        hgraph, Network({{0, 1}}, {1, 1}), Placement<HypergraphImpl>(std::vector<unsigned>({0, 0, 1, 1})));

    {
        GainManager<HypergraphImpl> gainManager(distribution);
        BOOST_CHECK_THROW(RepairCapacity(gainManager), InfeasibleNetworkError);
    }

    std::mt19937 gen(1);
    BoundaryReallocation<HypergraphImpl> refiner;
    BOOST_CHECK_THROW(refiner.Refine(distribution, gen), InfeasibleNetworkError);
}

BOOST_AUTO_TEST_CASE(RespectsCapacitiesAndNeverIncreasesCost) {
    const std::vector<unsigned> rounds = {0, 1, 5, 50};
    const std::vector<double> stopParameters = {0.0, 0.05, 0.5, 1.0};

    for (unsigned seed = 0; seed < 5; ++seed) {
        // cost after the capacity repair performed at the start of the refinement
        Distribution<HypergraphImpl> repaired = MakeRandomDistribution(seed);
        {
            GainManager<HypergraphImpl> gainManager(repaired);
            RepairCapacity(gainManager);
        }
        BOOST_CHECK(repaired.IsValid());
        const int repairedCost = repaired.Cost();

        for (const unsigned numRounds : rounds) {
            for (const double stopParameter : stopParameters) {
                Distribution<HypergraphImpl> distribution = MakeRandomDistribution(seed);

                std::mt19937 gen(seed + 100U);
                BoundaryReallocation<HypergraphImpl> refiner(numRounds, stopParameter);
                refiner.Refine(distribution, gen);

                BOOST_CHECK(distribution.IsValid());
                BOOST_CHECK_LE(distribution.Cost(), repairedCost);
                if (numRounds == 0) {
                    BOOST_CHECK(distribution.GetPlacement() == repaired.GetPlacement());
                }
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(KeepsAnchorsWhenRequested) {
    Distribution<HypergraphImpl> distribution(
        MakeHypergraph(), MakeNetwork(), Placement<HypergraphImpl>(std::vector<unsigned>({1, 1, 2, 4, 1, 2, 0, 4, 3, 2})));
    const Placement<HypergraphImpl> initial = distribution.GetPlacement();

    std::mt19937 gen(7);
    BoundaryReallocation<HypergraphImpl> refiner;
    refiner.SetReallocateAnchors(false);
    refiner.Refine(distribution, gen);

    for (std::size_t vertex = 0; vertex < 4; ++vertex) {
        BOOST_CHECK_EQUAL(distribution.GetPlacement().AssignedServer(vertex), initial.AssignedServer(vertex));
    }
    BOOST_CHECK_LE(distribution.Cost(), 16);
}

BOOST_AUTO_TEST_CASE(DeterministicForFixedSeed) {
    Distribution<HypergraphImpl> first = MakeRandomDistribution(3);
    Distribution<HypergraphImpl> second = MakeRandomDistribution(3);

    std::mt19937 firstGen(11);
    std::mt19937 secondGen(11);
    BoundaryReallocation<HypergraphImpl> refiner;
    refiner.Refine(first, firstGen);
    refiner.Refine(second, secondGen);

    BOOST_CHECK(first.GetPlacement() == second.GetPlacement());
    BOOST_CHECK_EQUAL(first.Cost(), second.Cost());
}

BOOST_AUTO_TEST_CASE(LockedDistribution) {
    Distribution<HypergraphImpl> distribution = MakeRandomDistribution(0);
    distribution.CommitEmbedding(HyperedgeT({2, 9}));

    std::mt19937 gen(0);
    BoundaryReallocation<HypergraphImpl> refiner;
    BOOST_CHECK_THROW(refiner.Refine(distribution, gen), PlacementLockedError);
}

BOOST_AUTO_TEST_CASE(ImprovesSimplePlacements) {
    std::mt19937 gen(5);
    BoundaryReallocation<HypergraphImpl> refiner;

    HypergraphImpl pair(2);
    pair.SetAnchorVertex(0, true);
    pair.AddHyperedge({0, 1});
    Distribution<HypergraphImpl> split(pair, Network({{0, 1}}, {2, 2}), Placement<HypergraphImpl>(std::vector<unsigned>({0, 1})));
    BOOST_CHECK_EQUAL(split.Cost(), 1);
    BOOST_CHECK(refiner.Refine(split, gen));
    BOOST_CHECK_EQUAL(split.Cost(), 0);

    // nothing on the boundary
    BOOST_CHECK(!refiner.Refine(split, gen));

    // both anchors are stuck on their server unless they are swapped
    HypergraphImpl crossed(4);
    crossed.SetAnchorVertex(0, true);
    crossed.SetAnchorVertex(1, true);
    crossed.AddHyperedge({0, 2});
    crossed.AddHyperedge({1, 3});
    Distribution<HypergraphImpl> swapped(
        crossed, Network({{0, 1}}, {1, 1}), Placement<HypergraphImpl>(std::vector<unsigned>({0, 1, 1, 0})));
    BOOST_CHECK_EQUAL(swapped.Cost(), 2);
    BOOST_CHECK(refiner.Refine(swapped, gen));
    BOOST_CHECK_EQUAL(swapped.Cost(), 0);
    BOOST_CHECK(swapped.IsValid());
}

BOOST_AUTO_TEST_CASE(ZeroGainMoves) {
    HypergraphImpl hgraph(3);
    hgraph.SetAnchorVertex(0, true);
    hgraph.SetAnchorVertex(1, true);
    hgraph.AddHyperedge({0, 2});
    hgraph.AddHyperedge({1, 2});

    // every move, including swapping both anchors, leaves the cost at one
    const Distribution<HypergraphImpl> initial(
        hgraph, Network({{0, 1}}, {1, 1}), Placement<HypergraphImpl>(std::vector<unsigned>({0, 1, 0})));
    BOOST_CHECK_EQUAL(initial.Cost(), 1);

    std::mt19937 gen(9);
    BoundaryReallocation<HypergraphImpl> refiner(10, 0.0);

    Distribution<HypergraphImpl> strict = initial;
    refiner.SetAcceptZeroGainMoves(false);
    BOOST_CHECK(!refiner.Refine(strict, gen));
    BOOST_CHECK(strict.GetPlacement() == initial.GetPlacement());

    Distribution<HypergraphImpl> relaxed = initial;
    refiner.SetAcceptZeroGainMoves(true);
    refiner.Refine(relaxed, gen);
    BOOST_CHECK(relaxed.IsValid());
    BOOST_CHECK_EQUAL(relaxed.Cost(), 1);
}
