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

#include "global/global.hpp"
#include "util/util.hpp"

PROJECT_NAMESPACE_START

////////////////////////////////  
//          Tech              //  
////////////////////////////////
enum class LayerNamingE : Byte {
  undef = 0,
  short_name, // M1, M2, ...
  long_name   // METAL1, METAL2, ...
};
constexpr Array<const util::enumUtil::StrValPair<LayerNamingE>, 3> LayerNamingEStr{
    {{LayerNamingE::undef, "undef"},
     {LayerNamingE::short_name, "short"},
     {LayerNamingE::long_name, "long"}}};

////////////////////////////////  
//          Shape             //  
////////////////////////////////
enum class ShapeE : Byte {
  undef = 0,
  frame_bar,  // frame + fingers + middle bar ("H")
  alt_finger, // alternating-height fingers, no middle bar ("I")
  sandwich    // solid outer plates, notched core in between
};
constexpr Array<const util::enumUtil::StrValPair<ShapeE>, 4> ShapeEStr{
    {{ShapeE::undef, "undef"},
     {ShapeE::frame_bar, "frame_bar"},
     {ShapeE::alt_finger, "alt_finger"},
     {ShapeE::sandwich, "sandwich"}}};
// short keys used by the capacitor experiments
constexpr Array<const util::enumUtil::StrValPair<ShapeE>, 4> ShapeEStr2{
    {{ShapeE::undef, "undef"},
     {ShapeE::frame_bar, "H"},
     {ShapeE::alt_finger, "I"},
     {ShapeE::sandwich, "sandwich"}}};

enum class PlateE : Byte {
  undef = 0,
  pos,    // top plate
  neg,    // bottom plate
  shield
};

////////////////////////////////  
//          Primitive         //  
////////////////////////////////
enum class PrimTypeE : Byte {
  undef = 0,
  path,
  via,
  label,
  rect
};
constexpr Array<const util::enumUtil::StrValPair<PrimTypeE>, 5> PrimTypeEStr{
    {{PrimTypeE::undef, "undef"},
     {PrimTypeE::path, "path"},
     {PrimTypeE::via, "via"},
     {PrimTypeE::label, "label"},
     {PrimTypeE::rect, "rect"}}};

enum class PathExtendE : Byte {
  undef = 0,
  truncate, // path ends at its end points
  extend    // path extends half width beyond its end points
};
constexpr Array<const util::enumUtil::StrValPair<PathExtendE>, 3> PathExtendEStr{
    {{PathExtendE::undef, "undef"},
     {PathExtendE::truncate, "truncateExtend"},
     {PathExtendE::extend, "extendExtend"}}};

enum class Orient2dE : Byte {
  n = 0,  // R0
  w,  // R90
  s,  // R180
  e,  // R270
  undef
};
constexpr Array<const util::enumUtil::StrValPair<Orient2dE>, 5> Orient2dEStr2{
    {{Orient2dE::undef, "undef"},
     {Orient2dE::n, "R0"},
     {Orient2dE::w, "R90"},
     {Orient2dE::s, "R180"},
     {Orient2dE::e, "R270"}}};

////////////////////////////////  
//          Violation         //  
////////////////////////////////
enum class ViolationE : Byte {
  undef = 0,
  spacing_too_small,
  width_too_small,
  quantization_mismatch,
  layer_not_allowed,
  layers_not_adjacent,
  parity_violation,
  height_exceeds_ceiling,
  area_too_small,
  structural // geometry cannot be derived at all
};
constexpr Array<const util::enumUtil::StrValPair<ViolationE>, 10> ViolationEStr{
    {{ViolationE::undef, "undef"},
     {ViolationE::spacing_too_small, "spacing-too-small"},
     {ViolationE::width_too_small, "width-too-small"},
     {ViolationE::quantization_mismatch, "quantization-mismatch"},
     {ViolationE::layer_not_allowed, "layer-not-allowed"},
     {ViolationE::layers_not_adjacent, "layers-not-adjacent"},
     {ViolationE::parity_violation, "parity-violation"},
     {ViolationE::height_exceeds_ceiling, "height-exceeds-ceiling"},
     {ViolationE::area_too_small, "area-too-small"},
     {ViolationE::structural, "structural"}}};

/////////////////////////////////////////
//           Funcs
/////////////////////////////////////////
namespace shape {
  // finger parity rule of a shape: 1 odd, 0 even
  extern Int  parity(const ShapeE s);
  extern Int  minFingers(const ShapeE s);
  extern bool isValidFingerCount(const ShapeE s, const Int n);
  extern ShapeE str2Shape(const String& s); // accepts both "frame_bar" and "H"
}

PROJECT_NAMESPACE_END
