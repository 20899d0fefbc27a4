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

#include "parser.hpp"
#include "util/util.hpp"

PROJECT_NAMESPACE_START

YAML::Node Parser::loadFile(const String& fileName)
{
  if (!util::fs::existFile(fileName)) {
    throw ConfigError(fmt::format("cannot open {}", fileName));
  }
  try {
    return YAML::LoadFile(fileName);
  }
  catch (const YAML::Exception& e) {
    throw ConfigError(fmt::format("{}: {}", util::fs::getFileName(fileName), e.what()));
  }
}

/////////////////////////////////////////
//           Technology
/////////////////////////////////////////
void Parser::parseTech(const String& fileName)
{
  spdlog::stopwatch sw;
  parseTech(loadFile(fileName));
  spdlog::info("{:<30} Elapsed: {:.3f} s", "Parse technology", sw);
}

void Parser::parseTech(const YAML::Node& node)
{
  const String where = "tech";
  if (!node or !node.IsMap()) {
    throw ConfigError("technology profile must be a map");
  }
  try {
    if (node["name"]) {
      _tech._name = node["name"].as<String>();
    }
    if (node["grid"]) {
      _tech._grid = node["grid"].as<Real>();
    }
    if (_tech._grid <= 0) {
      throw ConfigError("tech: grid must be positive");
    }
    if (node["precision"]) {
      _tech._precision = node["precision"].as<Int>();
    }

    _tech._minSpacing     = lengthField(node, "min_spacing", where);
    _tech._minWidth       = lengthField(node, "min_width", where);
    _tech._viaPitch       = lengthField(node, "via_pitch", where);
    _tech._viaMargin      = lengthField(node, "via_margin", where);
    _tech._widthQuantBase = lengthField(node, "width_quant_base", where);
    _tech._widthQuantStep = lengthField(node, "width_quant_step", where);
    if (node["min_area"]) {
      _tech._minArea = toDBUnit2d(node["min_area"].as<Real>());
    }

    const String style = require(node, "layer_naming_style", where).as<String>();
    _tech._namingStyle = util::enumUtil::str2Val(LayerNamingEStr, style);

    _tech._vLayers.clear();
    _tech._mLayerName2Idx.clear();
    for (const String& l : stringList(node, "allowed_layers", where)) {
      _tech._mLayerName2Idx.emplace(l, _tech._vLayers.size());
      _tech._vLayers.push_back(l);
    }

    _tech._sLowParasiticExcluded.clear();
    if (node["low_parasitic_excluded_layers"]) {
      for (const String& l : stringList(node, "low_parasitic_excluded_layers", where)) {
        _tech._sLowParasiticExcluded.insert(l);
      }
    }

    _tech._mNamedSpacingMin.clear();
    const YAML::Node& named = node["named_spacing_min"];
    if (named) {
      if (!named.IsMap()) {
        throw ConfigError("tech: named_spacing_min must be a map");
      }
      for (YAML::const_iterator it = named.begin(); it != named.end(); ++it) {
        const String name = it->first.as<String>();
        _tech._mNamedSpacingMin[name] = toDBUnit(it->second.as<Real>(), "named_spacing_min." + name);
      }
    }
  }
  catch (const YAML::Exception& e) {
    throw ConfigError(fmt::format("tech: {}", e.what()));
  }

  String reason;
  if (!_tech.isWellFormed(&reason)) {
    throw ConfigError(fmt::format("tech {}: {}", _tech._name, reason));
  }
  spdlog::info("[Parser] Technology {} grid {} layers {}", _tech._name, _tech._grid, _tech.numLayers());
}

/////////////////////////////////////////
//           Shape
/////////////////////////////////////////
ShapeE Parser::parseShapeKey(const String& key, bool& bIncludeShield)
{
  static const String shieldless = "_shieldless";
  static const String shield     = "_shield";
  String base = key;
  auto endsWith = [&base](const String& suffix) {
    return base.size() > suffix.size() and base.compare(base.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  if (endsWith(shieldless)) {
    base.resize(base.size() - shieldless.size());
    bIncludeShield = false;
  }
  else if (endsWith(shield)) {
    base.resize(base.size() - shield.size());
    bIncludeShield = true;
  }
  return shape::str2Shape(base);
}

void Parser::parseShape(const String& fileName, ShapeParams& params)
{
  parseShape(loadFile(fileName), params);
  spdlog::info("[Parser] Shape {} from {}", util::enumUtil::val2Str(ShapeEStr, params.shape),
               util::fs::getFileName(fileName));
}

void Parser::parseShape(const YAML::Node& node, ShapeParams& params)
{
  const String where = "shape";
  if (!node or !node.IsMap()) {
    throw ConfigError("shape parameters must be a map");
  }
  try {
    const String key = require(node, "shape", where).as<String>();
    params.shape = parseShapeKey(key, params.bIncludeShield);
    if (params.shape == ShapeE::undef) {
      throw ConfigError(fmt::format("shape: unknown shape '{}'", key));
    }
    if (node["include_shield"]) {
      params.bIncludeShield = node["include_shield"].as<bool>();
    }

    params.fingerCount   = require(node, "finger_count", where).as<Int>();
    params.activeHeight  = realField(node, "active_height", where);
    params.fingerWidth   = realField(node, "finger_width", where);
    params.fingerSpacing = realField(node, "finger_spacing", where);
    params.barWidth      = realField(node, "bar_width", where);
    params.frameWidth    = realField(node, "frame_width", where);
    params.spacing       = realField(node, "spacing", where);
    params.tipSpacing    = realField(node, "tip_spacing", where);
    if (params.shape != ShapeE::alt_finger) {
      params.middleBarWidth = realField(node, "middle_bar_width", where);
    }
    params.vLayers = stringList(node, "layers", where);

    if (node["height_ceiling"]) {
      params.heightCeiling = node["height_ceiling"].as<Real>();
    }
    if (node["low_parasitic"]) {
      params.bLowParasitic = node["low_parasitic"].as<bool>();
    }
    if (node["label_size"]) {
      params.labelSize = node["label_size"].as<Real>();
    }
    if (node["pos_label"]) {
      params.posLabel = node["pos_label"].as<String>();
    }
    if (node["neg_label"]) {
      params.negLabel = node["neg_label"].as<String>();
    }
  }
  catch (const YAML::Exception& e) {
    throw ConfigError(fmt::format("shape: {}", e.what()));
  }
}

/////////////////////////////////////////
//           Array
/////////////////////////////////////////
void Parser::parseArray(const String& fileName, ArrayPattern& pattern)
{
  parseArray(loadFile(fileName), pattern);
  spdlog::info("[Parser] Array {}x{} from {}", pattern.numRows(), pattern.numCols(),
               util::fs::getFileName(fileName));
}

void Parser::parseArray(const YAML::Node& node, ArrayPattern& pattern)
{
  const String where = "array";
  if (!node or !node.IsMap()) {
    throw ConfigError("array pattern must be a map");
  }
  try {
    const YAML::Node& data = require(node, "array_data", where);
    if (!data.IsSequence()) {
      throw ConfigError("array: array_data must be a list of rows");
    }
    Vector<Vector<String>> vvData;
    for (const YAML::Node& row : data) {
      if (!row.IsSequence()) {
        throw ConfigError(fmt::format("array: array_data row {} is not a list", vvData.size()));
      }
      vvData.emplace_back();
      for (const YAML::Node& cell : row) {
        vvData.back().push_back(cell.IsNull() ? "" : cell.as<String>());
      }
    }
    if (node["unit_cell"]) {
      pattern._unitCell = node["unit_cell"].as<String>();
    }
    if (node["dummy_cell"]) {
      pattern._dummyCell = node["dummy_cell"].as<String>();
    }
    if (node["origin"]) {
      pattern._origin = pairField(node, "origin", where);
    }
    pattern.init(vvData, pairField(node, "pitch", where));
  }
  catch (const YAML::Exception& e) {
    throw ConfigError(fmt::format("array: {}", e.what()));
  }
}

/////////////////////////////////////////
//           Helpers
/////////////////////////////////////////
const YAML::Node Parser::require(const YAML::Node& node, const String& field, const String& where)
{
  const YAML::Node& n = node[field];
  if (!n or n.IsNull()) {
    throw ConfigError(fmt::format("{}: missing field '{}'", where, field));
  }
  return n;
}

Real Parser::realField(const YAML::Node& node, const String& field, const String& where)
{
  return require(node, field, where).as<Real>();
}

Int Parser::lengthField(const YAML::Node& node, const String& field, const String& where)
{
  return toDBUnit(realField(node, field, where), where + "." + field);
}

Vector<String> Parser::stringList(const YAML::Node& node, const String& field, const String& where)
{
  const YAML::Node& n = require(node, field, where);
  if (!n.IsSequence()) {
    throw ConfigError(fmt::format("{}: {} must be a list", where, field));
  }
  return n.as<Vector<String>>();
}

// [x, y] or a single value for both
Point<Int> Parser::pairField(const YAML::Node& node, const String& field, const String& where)
{
  const YAML::Node& n = require(node, field, where);
  if (n.IsScalar()) {
    const Int v = toDBUnit(n.as<Real>(), where + "." + field);
    return Point<Int>(v, v);
  }
  if (!n.IsSequence() or n.size() != 2) {
    throw ConfigError(fmt::format("{}: {} must be [x, y]", where, field));
  }
  return Point<Int>(toDBUnit(n[0].as<Real>(), where + "." + field),
                    toDBUnit(n[1].as<Real>(), where + "." + field));
}

// lengths of a profile have to be grid multiples
Int Parser::toDBUnit(const Real val, const String& field)
{
  const Real q = val / _tech._grid;
  if (std::fabs(q - std::round(q)) > GRID_TOL) {
    throw ConfigError(fmt::format("{}: {} is not a multiple of grid {}", field, val, _tech._grid));
  }
  return std::lround(q);
}

Long Parser::toDBUnit2d(const Real val)
{
  return _tech.toDBUnit2d(val);
}

PROJECT_NAMESPACE_END
