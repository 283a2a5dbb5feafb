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
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>

namespace hpl {

namespace pt = boost::property_tree;

inline const std::set<std::string> GetAvailableAllocatorNames() { return {"random", "ordered", "brute", "annealing"}; }

// parameters of a placement run, with their default values
struct PlacementConfig {
    std::optional<unsigned> seed_;

    std::size_t iterations_ = 10000;
    double initialTemperature_ = 3.0;

    unsigned numRounds_ = 1000;
    double stopParameter_ = 0.05;
    bool acceptZeroGainMoves_ = true;
    bool reallocateAnchors_ = true;

    std::size_t cacheLimit_ = 5;
    std::string initializer_ = "random";
};

// overwrites value when key is present, throws pt::ptree_bad_data if the entry does not convert
template<typename T>
void ReadParameter(const pt::ptree &params, const std::string &key, T &value) {
    if (const auto child = params.get_child_optional(key)) {
        value = child->get_value<T>();
    }
}

/**
 * @brief Reads placement parameters from a property tree. Missing entries keep their default value.
 *
 * Recognised keys: seed, iterations, initialTemperature, numRounds, stopParameter, acceptZeroGainMoves,
 * reallocateAnchors, cacheLimit and initializer.
 */
inline PlacementConfig ReadPlacementConfig(const pt::ptree &params) {
    PlacementConfig config;

    if (const auto seed = params.get_child_optional("seed")) {
        config.seed_ = seed->get_value<unsigned>();
    }
    ReadParameter(params, "iterations", config.iterations_);
    ReadParameter(params, "initialTemperature", config.initialTemperature_);
    ReadParameter(params, "numRounds", config.numRounds_);
    ReadParameter(params, "stopParameter", config.stopParameter_);
    ReadParameter(params, "acceptZeroGainMoves", config.acceptZeroGainMoves_);
    ReadParameter(params, "reallocateAnchors", config.reallocateAnchors_);
    ReadParameter(params, "cacheLimit", config.cacheLimit_);
    ReadParameter(params, "initializer", config.initializer_);

    if (config.stopParameter_ < 0.0 || config.stopParameter_ > 1.0) {
        throw std::invalid_argument("Parameter error: stopParameter must lie in [0, 1].\n");
    }
    if (config.initialTemperature_ <= 0.0) {
        throw std::invalid_argument("Parameter error: initialTemperature must be positive.\n");
    }
    if (GetAvailableAllocatorNames().count(config.initializer_) == 0) {
        throw std::invalid_argument("Parameter error: unknown initializer \"" + config.initializer_ + "\".\n");
    }
    return config;
}

// reads the "placementParameters" object of a json file
inline PlacementConfig ReadPlacementConfigFile(const std::string &filename) {
    if (filename.size() < 5 || filename.substr(filename.size() - 5) != ".json") {
        throw std::invalid_argument("Parameter error: config file ending is not \".json\".\n");
    }

    pt::ptree loadPtreeRoot;
    pt::read_json(filename, loadPtreeRoot);

    const PlacementConfig config = ReadPlacementConfig(loadPtreeRoot.get_child("placementParameters"));
    BOOST_LOG_TRIVIAL(debug) << "Read placement parameters from " << filename << ".";
    return config;
}

inline std::mt19937 MakeGenerator(const PlacementConfig &config) {
    if (config.seed_) {
        return std::mt19937(*config.seed_);
    }
    std::random_device rd;
    return std::mt19937(rd());
}

}    // namespace hpl
