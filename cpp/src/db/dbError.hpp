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

#include <stdexcept>
#include "dbBasic.hpp"

PROJECT_NAMESPACE_START

// malformed technology profile or input file
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const String& msg)
    : std::runtime_error("[ConfigError] " + msg)
  {}
};

// the requested shape cannot be derived from its parameters
class GeometryError : public std::runtime_error {
public:
  GeometryError(const ViolationE tag, const String& field, const String& msg)
    : std::runtime_error(fmt::format("[GeometryError] {} ({}): {}",
                                     util::enumUtil::val2Str(ViolationEStr, tag), field, msg)),
      _tag(tag), _field(field)
  {}

  ViolationE    tag()   const { return _tag; }
  const String& field() const { return _field; }

private:
  ViolationE _tag;
  String     _field;
};

// internal invariant broken while emitting primitives
class RenderError : public std::runtime_error {
public:
  explicit RenderError(const String& msg)
    : std::runtime_error("[RenderError] " + msg)
  {}
};

PROJECT_NAMESPACE_END
