/*
* SPDX-FileCopyrightText: Copyright (c) 2022 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
* SPDX-License-Identifier: Apache-2.0
*
* Licensed under the Apache License, Version 2.0 (the "License");
* you may not use this file except in compliance with the License.
* You may obtain a copy of the License at
*
* http://www.apache.org/licenses/LICENSE-2.0
*
* Unless required by applicable law or agreed to in writing, software
* distributed under the License is distributed on an "AS IS" BASIS,
* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
* See the License for the specific language governing permissions and
* limitations under the License.
*/
#pragma once

#include "namespace.hpp"
#include <array>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>

#include <vector>
#include <map>
#include <set>
#include <utility>
#include <tuple>
#include <variant>

PROJECT_NAMESPACE_START

using Int  = std::int32_t;
using Long = std::int64_t; // area in dbu^2
using Real = double;
using Byte = char;

constexpr Int  MAX_INT    = std::numeric_limits<Int>::max() / 3;
constexpr Real GRID_TOL   = 1e-6; // tolerance (in grid steps) when testing a real value for grid alignment

// Type aliases
                                                          using String    = std::string;
template <typename T, typename U>                         using Pair      = std::pair<T, U>;
template <typename... Args>                               using Tuple     = std::tuple<Args...>;
template <typename T, size_t N>                           using Array     = std::array<T, N>;
template <typename T, class Alloc = std::allocator<T>>    using Vector    = std::vector<T, Alloc>;
template <typename T>                                     using Set       = std::set<T>;
template <typename T, typename U>                         using Map       = std::map<T, U>;
template <typename... Args>                               using Variant   = std::variant<Args...>;
PROJECT_NAMESPACE_END
