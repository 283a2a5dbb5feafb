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

#include "hpl/refiners/refiner.hpp"

namespace hpl {

/**
 * @class RepeatRefiner
 * @brief Runs a refiner again and again until it reports no change, or the repetition limit is reached.
 */
template <typename HypergraphT>
class RepeatRefiner : public Refiner<HypergraphT> {
  private:
    Refiner<HypergraphT> &refiner_;
    unsigned maxRepetitions_;

  public:
    explicit RepeatRefiner(Refiner<HypergraphT> &refiner, unsigned maxRepetitions = 100)
        : refiner_(refiner), maxRepetitions_(maxRepetitions) {}

    virtual ~RepeatRefiner() = default;

    std::string GetRefinerName() const override { return "Repeat(" + refiner_.GetRefinerName() + ")"; }

    bool Refine(Distribution<HypergraphT> &distribution, std::mt19937 &gen) override {
        bool refinementMade = false;
        unsigned repetitions = 0;
        while (repetitions < maxRepetitions_ && refiner_.Refine(distribution, gen)) {
            refinementMade = true;
            ++repetitions;
        }

        if (repetitions == maxRepetitions_) {
            BOOST_LOG_TRIVIAL(debug) << GetRefinerName() << " stopped after reaching " << maxRepetitions_ << " repetitions.";
        }
        return refinementMade;
    }
};

}    // namespace hpl
