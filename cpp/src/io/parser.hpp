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

#include <yaml-cpp/yaml.h>

#include "db/dbTech.hpp"
#include "db/dbShape.hpp"
#include "db/dbError.hpp"
#include "mosaic/arrayPattern.hpp"

PROJECT_NAMESPACE_START

// YAML loaders. Everything malformed is reported as ConfigError naming the
// offending field.
class Parser {
public:
  Parser(TechProfile& tech) : _tech(tech) {}

  void parseTech(const String& fileName);
  void parseTech(const YAML::Node& node);

  void parseShape(const String& fileName, ShapeParams& params);
  void parseShape(const YAML::Node& node, ShapeParams& params);

  // lengths are converted with the parsed technology
  void parseArray(const String& fileName, ArrayPattern& pattern);
  void parseArray(const YAML::Node& node, ArrayPattern& pattern);

  // "H_shieldless" -> (frame_bar, false); plain keys leave bIncludeShield alone
  static ShapeE parseShapeKey(const String& key, bool& bIncludeShield);

private:
  TechProfile& _tech;

  YAML::Node  loadFile(const String& fileName);

  const YAML::Node  require(const YAML::Node& node, const String& field, const String& where);
  Real              realField(const YAML::Node& node, const String& field, const String& where);
  Int               lengthField(const YAML::Node& node, const String& field, const String& where);
  Vector<String>    stringList(const YAML::Node& node, const String& field, const String& where);
  Point<Int>        pairField(const YAML::Node& node, const String& field, const String& where);

  // helper
  Int  toDBUnit(const Real val, const String& field);
  Long toDBUnit2d(const Real val);
};

PROJECT_NAMESPACE_END
