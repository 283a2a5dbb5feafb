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
#include <random>
#include <string>
#include <vector>

#include "hpl/allocators/allocator.hpp"
#include "hpl/optimizer/gain_manager.hpp"
#include "hpl/refiners/boundary_reallocation.hpp"
#include "hpl/refiners/capacity_repair.hpp"

namespace hpl {

/**
 * @class InitialPartitioner
 * @brief Interface of an external hypergraph partitioner producing a first cut placement.
 *
 * The placement returned may violate server capacities; it is repaired afterwards. It must however be total
 * and only refer to the given servers.
 */
template <typename HypergraphT>
class InitialPartitioner {
  public:
    InitialPartitioner() = default;

    virtual ~InitialPartitioner() = default;

    virtual std::string GetPartitionerName() const = 0;

    virtual Placement<HypergraphT> Partition(const HypergraphT &hgraph,
                                             const std::vector<unsigned> &capacities,
                                             std::mt19937 &gen) = 0;
};

/**
 * @class PartitioningAllocator
 * @brief Places the hypergraph according to an initial partitioner, followed by capacity repair and, optionally,
 * boundary reallocation to take the network topology into account.
 */
template <typename HypergraphT>
class PartitioningAllocator : public Allocator<HypergraphT> {
  private:
    InitialPartitioner<HypergraphT> &partitioner_;
    bool refine_ = false;
    std::size_t cacheLimit_ = 5;

  public:
    explicit PartitioningAllocator(InitialPartitioner<HypergraphT> &partitioner, bool refine = false)
        : partitioner_(partitioner), refine_(refine) {}

    virtual ~PartitioningAllocator() = default;

    std::string GetAllocatorName() const override {
        return "PartitioningAllocator(" + partitioner_.GetPartitionerName() + ")";
    }

    inline void SetRefine(bool refine) { refine_ = refine; }

    inline void SetCacheLimit(std::size_t cacheLimit) { cacheLimit_ = cacheLimit; }

    void Allocate(Distribution<HypergraphT> &distribution, std::mt19937 &gen) override {
        this->CheckAllocatable(distribution);

        Placement<HypergraphT> placement
            = partitioner_.Partition(distribution.GetHypergraph(), distribution.GetNetwork().Capacities(), gen);
        distribution.SetPlacement(std::move(placement));

        {
            GainManager<HypergraphT> gainManager(distribution, cacheLimit_);
            RepairCapacity(gainManager);
        }

        if (refine_) {
            BoundaryReallocation<HypergraphT> refiner;
            refiner.SetCacheLimit(cacheLimit_);
            if (!refiner.Refine(distribution, gen)) {
                BOOST_LOG_TRIVIAL(debug) << GetAllocatorName() << ": refinement left the partition unchanged.";
            }
        }

        BOOST_LOG_TRIVIAL(info) << GetAllocatorName() << " placed " << distribution.GetHypergraph().NumVertices()
                                << " vertices with cost " << distribution.Cost() << ".";
    }
};

}    // namespace hpl
