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
#include <vector>

#include "hpl/refiners/refiner.hpp"

namespace hpl {

// Runs a list of refiners one after the other

template <typename HypergraphT>
class SequenceRefiner : public Refiner<HypergraphT> {
  private:
    std::vector<Refiner<HypergraphT> *> refiners_;

  public:
    SequenceRefiner() = default;

    virtual ~SequenceRefiner() = default;

    void AddRefiner(Refiner<HypergraphT> &refiner) { refiners_.push_back(&refiner); }

    inline std::size_t NumRefiners() const { return refiners_.size(); }

    std::string GetRefinerName() const override {
        std::string name = "Sequence(";
        for (std::size_t idx = 0; idx < refiners_.size(); ++idx) {
            name += (idx > 0 ? "," : "") + refiners_[idx]->GetRefinerName();
        }
        return name + ")";
    }

    bool Refine(Distribution<HypergraphT> &distribution, std::mt19937 &gen) override {
        bool refinementMade = false;
        for (Refiner<HypergraphT> *refiner : refiners_) {
            refinementMade = refiner->Refine(distribution, gen) || refinementMade;
        }
        return refinementMade;
    }
};

}    // namespace hpl
