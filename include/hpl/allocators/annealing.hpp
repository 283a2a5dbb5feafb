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
#include <cmath>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "hpl/allocators/allocator.hpp"
#include "hpl/allocators/random_allocator.hpp"
#include "hpl/optimizer/gain_manager.hpp"

namespace hpl {

/**
 * @brief Acceptance value of a move during simulated annealing, with temperature initialTemperature / (iteration + 1).
 *
 * Non-negative gains give a value of at least 1, negative gains a probability in [0, 1). Overflow saturates to
 * positive infinity.
 *
 * @throws std::invalid_argument if the initial temperature is not positive.
 */
inline double AcceptanceCriterion(double gain, std::size_t iteration, double initialTemperature = 1.0) {
    if (!(initialTemperature > 0.0)) {
        throw std::invalid_argument("Invalid Argument while evaluating acceptance criterion: initial temperature must be positive.");
    }
    const double temperature = initialTemperature / static_cast<double>(iteration + 1);
    return std::exp(gain / temperature);
}

/**
 * @class AnnealingAllocator
 * @brief Simulated annealing over single vertex moves, starting from the placement of an initial allocator.
 *
 * In every iteration a random vertex and a random other server are drawn. If the vertex is an anchor vertex and
 * the server is full, a random anchor vertex of that server is swapped back in exchange. The move is applied
 * if the acceptance criterion exceeds a uniform draw from [0, 1).
 */
template <typename HypergraphT>
class AnnealingAllocator : public Allocator<HypergraphT> {
    using IndexType = typename HypergraphT::VertexIdx;
    using CostType = typename HypergraphT::VertexCommWeightType;

  private:
    std::unique_ptr<Allocator<HypergraphT>> initialAllocator_;

    std::size_t iterations_ = 10000;
    double initialTemperature_ = 3.0;
    std::size_t cacheLimit_ = 5;

  public:
    AnnealingAllocator() : initialAllocator_(std::make_unique<RandomAllocator<HypergraphT>>()) {}

    explicit AnnealingAllocator(std::unique_ptr<Allocator<HypergraphT>> initialAllocator)
        : initialAllocator_(std::move(initialAllocator)) {}

    virtual ~AnnealingAllocator() = default;

    std::string GetAllocatorName() const override {
        return "AnnealingAllocator(" + initialAllocator_->GetAllocatorName() + ")";
    }

    inline void SetIterations(std::size_t iterations) { iterations_ = iterations; }

    void SetInitialTemperature(double initialTemperature) {
        if (!(initialTemperature > 0.0)) {
            throw std::invalid_argument("Invalid Argument while setting initial temperature: temperature must be positive.");
        }
        initialTemperature_ = initialTemperature;
    }

    inline void SetCacheLimit(std::size_t cacheLimit) { cacheLimit_ = cacheLimit; }

    inline std::size_t GetIterations() const { return iterations_; }

    inline double GetInitialTemperature() const { return initialTemperature_; }

    void Allocate(Distribution<HypergraphT> &distribution, std::mt19937 &gen) override {
        initialAllocator_->Allocate(distribution, gen);
        Anneal(distribution, gen);
    }

    /**
     * @brief Runs the annealing search on a valid distribution.
     *
     * @return The number of accepted moves.
     * @throws PlacementLockedError if an embedding has been committed for the distribution.
     * @throws InvalidPlacementError if the distribution is not valid.
     */
    std::size_t Anneal(Distribution<HypergraphT> &distribution, std::mt19937 &gen);
};

template <typename HypergraphT>
std::size_t AnnealingAllocator<HypergraphT>::Anneal(Distribution<HypergraphT> &distribution, std::mt19937 &gen) {
    if (distribution.IsLocked()) {
        BOOST_LOG_TRIVIAL(warning) << "Annealing called on a distribution with committed embeddings.";
        throw PlacementLockedError("Cannot anneal a distribution for which an embedding has been committed.");
    }
    if (!distribution.IsValid()) {
        throw InvalidPlacementError("Invalid Argument while annealing: initial distribution is not valid.");
    }

    GainManager<HypergraphT> gainManager(distribution, cacheLimit_);
    const HypergraphT &hgraph = distribution.GetHypergraph();
    const Network &network = distribution.GetNetwork();

    BOOST_LOG_TRIVIAL(info) << "Annealing for " << iterations_ << " iterations, starting from cost "
                            << gainManager.TotalCost() << ".";

    if (hgraph.NumVertices() == 0 || network.NumServers() < 2) {
        return 0;
    }

    std::uniform_int_distribution<IndexType> vertexDistribution(0, hgraph.NumVertices() - 1);
    std::uniform_int_distribution<unsigned> serverDistribution(0, network.NumServers() - 2);
    std::uniform_real_distribution<double> unitDistribution(0.0, 1.0);

    std::size_t accepted = 0;
    for (std::size_t iteration = 0; iteration < iterations_; ++iteration) {
        const IndexType vertex = vertexDistribution(gen);
        const unsigned home = gainManager.CurrentServer(vertex);

        // uniform among all servers but the home server
        unsigned destination = serverDistribution(gen);
        if (destination >= home) {
            ++destination;
        }

        std::optional<IndexType> swap;
        if (hgraph.IsAnchorVertex(vertex) && gainManager.IsFull(destination)) {
            std::vector<IndexType> anchorsInDestination;
            for (const IndexType candidate : distribution.GetPlacement().GetVerticesIn(destination)) {
                if (hgraph.IsAnchorVertex(candidate)) {
                    anchorsInDestination.push_back(candidate);
                }
            }
            if (anchorsInDestination.empty()) {
                continue;
            }
            std::uniform_int_distribution<std::size_t> pick(0, anchorsInDestination.size() - 1);
            swap = anchorsInDestination[pick(gen)];
        }

        CostType gain = gainManager.Gain(vertex, destination);
        if (swap) {
            typename GainManager<HypergraphT>::ScopedMove guard(gainManager, vertex, destination, false);
            gain += gainManager.Gain(*swap, home);
        }

        const double acceptance = AcceptanceCriterion(static_cast<double>(gain), iteration, initialTemperature_);
        if (acceptance > unitDistribution(gen)) {
            gainManager.Move(vertex, destination);
            if (swap) {
                gainManager.Move(*swap, home);
            }
            ++accepted;
        }
    }

    if (!distribution.IsValid()) {
        throw std::logic_error("Internal error: annealing produced a placement violating server capacities.");
    }

    BOOST_LOG_TRIVIAL(debug) << "Annealing accepted " << accepted << " of " << iterations_ << " proposed moves.";
    BOOST_LOG_TRIVIAL(info) << "Annealing finished with cost " << gainManager.TotalCost() << ".";
    return accepted;
}

}    // namespace hpl
