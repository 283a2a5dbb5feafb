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

#include <functional>
#include <vector>

namespace hpl {

template <class T>
void hash_combine(std::size_t &seed, const T &v) {
    std::hash<T> hasher;
    seed ^= hasher(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

// hashes a sorted, duplicate-free set of servers, used as key of the Steiner tree memo
struct server_set_hash {
    std::size_t operator()(const std::vector<unsigned> &servers) const {
        std::size_t seed = servers.size();
        for (const unsigned server : servers) {
            hash_combine(seed, server);
        }
        return seed;
    }
};

}    // namespace hpl
