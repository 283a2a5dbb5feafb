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

#include <stdexcept>
#include <string>

namespace hpl {

/**
 * @brief Raised when the network cannot host all anchor vertices, i.e. its total capacity is too small.
 */
class InfeasibleNetworkError : public std::runtime_error {
  public:
    explicit InfeasibleNetworkError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief Raised when a placement is not total or references servers unknown to the network.
 */
class InvalidPlacementError : public std::invalid_argument {
  public:
    explicit InvalidPlacementError(const std::string &what) : std::invalid_argument(what) {}
};

/**
 * @brief Raised by exhaustive searches that could not find any capacity-respecting placement.
 */
class NoValidPlacementError : public std::runtime_error {
  public:
    explicit NoValidPlacementError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief Raised when vertices would be relocated after an embedding has been committed, or the placement is
 * written around an attached gain manager.
 */
class PlacementLockedError : public std::logic_error {
  public:
    explicit PlacementLockedError(const std::string &what) : std::logic_error(what) {}
};

}    // namespace hpl
