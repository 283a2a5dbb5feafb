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

#define BOOST_TEST_MODULE ALLOCATORS
#include <boost/test/unit_test.hpp>
#include <random>
#include <string>
#include <vector>

#include "hpl/allocators/brute_allocator.hpp"
#include "hpl/allocators/ordered_allocator.hpp"
#include "hpl/allocators/partitioning_allocator.hpp"
#include "hpl/allocators/random_allocator.hpp"
#include "hpl/model/distribution.hpp"

using namespace hpl;

using HypergraphImpl = HypergraphDefT;
using HyperedgeT = HypergraphImpl::HyperedgeType;

namespace {

// anchors 0 to 4, dependent vertices 5 and 6
HypergraphImpl MakeHypergraph() {
    HypergraphImpl hgraph(7);
    for (std::size_t vertex = 0; vertex < 5; ++vertex) {
        hgraph.SetAnchorVertex(vertex, true);
    }
    hgraph.AddHyperedge({0, 5});
    hgraph.AddHyperedge({3, 5, 6});
    hgraph.AddHyperedge({4, 6});
    return hgraph;
}

Network MakeNetwork() { return Network({{0, 1}, {1, 2}}, {1, 3, 2}); }

// puts every vertex on the first server
class FirstServerPartitioner : public InitialPartitioner<HypergraphImpl> {
  public:
    std::string GetPartitionerName() const override { return "FirstServer"; }

    Placement<HypergraphImpl> Partition(const HypergraphImpl &hgraph, const std::vector<unsigned> &, std::mt19937 &) override {
        return Placement<HypergraphImpl>(std::vector<unsigned>(hgraph.NumVertices(), 0U));
    }
};

class TruncatingPartitioner : public InitialPartitioner<HypergraphImpl> {
  public:
    std::string GetPartitionerName() const override { return "Truncating"; }

    Placement<HypergraphImpl> Partition(const HypergraphImpl &hgraph, const std::vector<unsigned> &, std::mt19937 &) override {
        return Placement<HypergraphImpl>(std::vector<unsigned>(hgraph.NumVertices() - 1, 0U));
    }
};

}    // namespace

BOOST_AUTO_TEST_CASE(OrderByCapacity) {
    BOOST_CHECK(OrderByDecreasingCapacity(MakeNetwork()) == std::vector<unsigned>({1, 2, 0}));
    BOOST_CHECK(OrderByDecreasingCapacity(Network({{0, 1}, {1, 2}}, {2, 1, 2})) == std::vector<unsigned>({0, 2, 1}));
}

BOOST_AUTO_TEST_CASE(OrderedAllocation) {
    Distribution<HypergraphImpl> distribution(MakeHypergraph(), MakeNetwork());
    BOOST_CHECK(!distribution.IsPlacement());

    std::mt19937 gen(0);
    OrderedAllocator<HypergraphImpl> allocator;
    allocator.Allocate(distribution, gen);

    BOOST_CHECK(distribution.GetPlacement().AssignedServers() == std::vector<unsigned>({1, 1, 1, 2, 2, 1, 1}));
    BOOST_CHECK(distribution.IsValid());
    // {0, 5} is local, {3, 5, 6} and {4, 6} span servers 1 and 2
    BOOST_CHECK_EQUAL(distribution.Cost(), 2);
}

BOOST_AUTO_TEST_CASE(RandomAllocation) {
    RandomAllocator<HypergraphImpl> allocator;
    BOOST_CHECK_EQUAL(allocator.GetAllocatorName(), "RandomAllocator");

    for (unsigned seed = 0; seed < 20; ++seed) {
        Distribution<HypergraphImpl> distribution(MakeHypergraph(), MakeNetwork());
        std::mt19937 gen(seed);
        allocator.Allocate(distribution, gen);

        BOOST_CHECK(distribution.GetPlacement().IsTotal());
        BOOST_CHECK(distribution.IsValid());
    }

    Distribution<HypergraphImpl> first(MakeHypergraph(), MakeNetwork());
    Distribution<HypergraphImpl> second(MakeHypergraph(), MakeNetwork());
    std::mt19937 firstGen(21);
    std::mt19937 secondGen(21);
    allocator.Allocate(first, firstGen);
    allocator.Allocate(second, secondGen);
    BOOST_CHECK(first.GetPlacement() == second.GetPlacement());
}

BOOST_AUTO_TEST_CASE(AllocatorsRejectInfeasibleAndLocked) {
    std::mt19937 gen(0);
    RandomAllocator<HypergraphImpl> randomAllocator;
    OrderedAllocator<HypergraphImpl> orderedAllocator;
    BruteAllocator<HypergraphImpl> bruteAllocator;

    Distribution<HypergraphImpl> infeasible(MakeHypergraph(), Network({{0, 1}}, {2, 2}));
    BOOST_CHECK_THROW(randomAllocator.Allocate(infeasible, gen), InfeasibleNetworkError);
    BOOST_CHECK_THROW(orderedAllocator.Allocate(infeasible, gen), InfeasibleNetworkError);
    BOOST_CHECK_THROW(bruteAllocator.Allocate(infeasible, gen), InfeasibleNetworkError);

    Distribution<HypergraphImpl> locked(MakeHypergraph(), MakeNetwork());
    orderedAllocator.Allocate(locked, gen);
    locked.CommitEmbedding(HyperedgeT({4, 6}));
    BOOST_CHECK_THROW(randomAllocator.Allocate(locked, gen), PlacementLockedError);
    BOOST_CHECK_THROW(orderedAllocator.Allocate(locked, gen), PlacementLockedError);
}

BOOST_AUTO_TEST_CASE(BruteForceOptimum) {
    HypergraphImpl hgraph(4);
    for (std::size_t vertex = 0; vertex < 3; ++vertex) {
        hgraph.SetAnchorVertex(vertex, true);
    }
    hgraph.AddHyperedge({0, 3});
    hgraph.AddHyperedge({1, 3});

    // every server holds exactly one anchor vertex, so at least one hyperedge is cut
    Distribution<HypergraphImpl> distribution(hgraph, Network({{0, 1}, {1, 2}}, {1, 1, 1}));

    std::mt19937 gen(0);
    BruteAllocator<HypergraphImpl> allocator;
    allocator.Allocate(distribution, gen);

    BOOST_CHECK(distribution.IsValid());
    BOOST_CHECK_EQUAL(distribution.Cost(), 1);

    // cost zero is found immediately
    HypergraphImpl single(2);
    single.SetAnchorVertex(0, true);
    single.AddHyperedge({0, 1});
    Distribution<HypergraphImpl> trivial(single, Network({{0, 1}}, {1, 1}));
    allocator.Allocate(trivial, gen);
    BOOST_CHECK(trivial.GetPlacement().AssignedServers() == std::vector<unsigned>({0, 0}));
}

BOOST_AUTO_TEST_CASE(PartitioningWithRepair) {
    FirstServerPartitioner partitioner;
    std::mt19937 gen(2);

    PartitioningAllocator<HypergraphImpl> allocator(partitioner);
    BOOST_CHECK_EQUAL(allocator.GetAllocatorName(), "PartitioningAllocator(FirstServer)");

    // anchors are moved out of the first server, of capacity one, in index order
    Distribution<HypergraphImpl> distribution(MakeHypergraph(), MakeNetwork());
    allocator.Allocate(distribution, gen);
    BOOST_CHECK(distribution.GetPlacement().AssignedServers() == std::vector<unsigned>({1, 1, 1, 2, 0, 0, 0}));
    BOOST_CHECK(distribution.IsValid());
    const int repairedCost = distribution.Cost();

    PartitioningAllocator<HypergraphImpl> refiningAllocator(partitioner, true);
    Distribution<HypergraphImpl> refined(MakeHypergraph(), MakeNetwork());
    refiningAllocator.Allocate(refined, gen);
    BOOST_CHECK(refined.IsValid());
    BOOST_CHECK_LE(refined.Cost(), repairedCost);

    TruncatingPartitioner truncating;
    PartitioningAllocator<HypergraphImpl> brokenAllocator(truncating);
    Distribution<HypergraphImpl> broken(MakeHypergraph(), MakeNetwork());
    BOOST_CHECK_THROW(brokenAllocator.Allocate(broken, gen), InvalidPlacementError);
}
