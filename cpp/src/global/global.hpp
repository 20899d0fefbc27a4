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

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>

#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>
#include <parallel_hashmap/phmap.h>

#include "type.hpp"

PROJECT_NAMESPACE_START

template <typename T>             using FlatHashSet = phmap::flat_hash_set<T>;
template <typename T, typename U> using FlatHashMap = phmap::flat_hash_map<T, U>;

PROJECT_NAMESPACE_END
