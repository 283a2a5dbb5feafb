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

#include <random>
#include <string>

#include "hpl/model/distribution.hpp"

namespace hpl {

/**
 * @class Refiner
 * @brief Abstract base class for algorithms improving an existing distribution.
 */
template <typename HypergraphT>
class Refiner {
  public:
    Refiner() = default;

    virtual ~Refiner() = default;

    /**
     * @brief Get the name of the refinement algorithm.
     * @return The name of the algorithm as a string.
     */
    virtual std::string GetRefinerName() const = 0;

    /**
     * @brief Refines the given distribution in place.
     * @param distribution The distribution to be refined.
     * @param gen The random generator used for all random decisions.
     * @return Whether the distribution has been changed.
     */
    virtual bool Refine(Distribution<HypergraphT> &distribution, std::mt19937 &gen) = 0;
};

}    // namespace hpl
