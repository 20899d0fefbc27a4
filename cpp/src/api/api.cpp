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

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include "io/parser.hpp"
#include "io/writer.hpp"
#include "shape/shapeMgr.hpp"
#include "drc/drcMgr.hpp"
#include "render/renderMgr.hpp"
#include "mosaic/mosaicMgr.hpp"

namespace py = pybind11;

namespace PROJECT_NAMESPACE::api {

////////////////////////////////  
//          Basics            //  
////////////////////////////////
void initShapeEnum(py::module& m)
{
  py::enum_<ShapeE>(m, "shape_e")
    .value("undef", ShapeE::undef)
    .value("frame_bar", ShapeE::frame_bar)
    .value("alt_finger", ShapeE::alt_finger)
    .value("sandwich", ShapeE::sandwich);
}

void initPlateEnum(py::module& m)
{
  py::enum_<PlateE>(m, "plate_e")
    .value("undef", PlateE::undef)
    .value("pos", PlateE::pos)
    .value("neg", PlateE::neg)
    .value("shield", PlateE::shield);
}

void initPrimTypeEnum(py::module& m)
{
  py::enum_<PrimTypeE>(m, "prim_type_e")
    .value("undef", PrimTypeE::undef)
    .value("path", PrimTypeE::path)
    .value("via", PrimTypeE::via)
    .value("label", PrimTypeE::label)
    .value("rect", PrimTypeE::rect);
}

void initViolationEnum(py::module& m)
{
  py::enum_<ViolationE>(m, "violation_e")
    .value("undef", ViolationE::undef)
    .value("spacing_too_small", ViolationE::spacing_too_small)
    .value("width_too_small", ViolationE::width_too_small)
    .value("quantization_mismatch", ViolationE::quantization_mismatch)
    .value("layer_not_allowed", ViolationE::layer_not_allowed)
    .value("layers_not_adjacent", ViolationE::layers_not_adjacent)
    .value("parity_violation", ViolationE::parity_violation)
    .value("height_exceeds_ceiling", ViolationE::height_exceeds_ceiling)
    .value("area_too_small", ViolationE::area_too_small)
    .value("structural", ViolationE::structural);
}

void initErrors(py::module& m)
{
  py::register_exception<ConfigError>(m, "ConfigError");
  py::register_exception<GeometryError>(m, "GeometryError");
  py::register_exception<RenderError>(m, "RenderError");
}

//////////////////////////////////
//          Geo Api             //
//////////////////////////////////
void initGeoAPI(py::module& m)
{
  py::class_<Point<Int>>(m, "point_int")
    .def(py::init<Int, Int>())
    .def("x", &Point<Int>::x)
    .def("y", &Point<Int>::y)
    .def(py::self == py::self)
    .def("__repr__", [](const Point<Int>& p) { return fmt::format("({}, {})", p.x(), p.y()); });

  py::class_<Point<Real>>(m, "point_float")
    .def(py::init<Real, Real>())
    .def("x", &Point<Real>::x)
    .def("y", &Point<Real>::y)
    .def("__repr__", [](const Point<Real>& p) { return fmt::format("({}, {})", p.x(), p.y()); });
}

//////////////////////////////////
//          DB Api              //
//////////////////////////////////
void initTechAPI(py::module& m)
{
  py::class_<TechProfile>(m, "tech_profile")
    .def(py::init<>())
    .def("name", &TechProfile::name, py::return_value_policy::reference_internal)
    .def("grid", &TechProfile::grid)
    .def("precision", &TechProfile::precision)
    .def("min_spacing", &TechProfile::minSpacing)
    .def("min_width", &TechProfile::minWidth)
    .def("min_area", &TechProfile::minArea)
    .def("via_pitch", &TechProfile::viaPitch)
    .def("via_margin", &TechProfile::viaMargin)
    .def("width_quant_base", &TechProfile::widthQuantBase)
    .def("width_quant_step", &TechProfile::widthQuantStep)
    .def("layers", &TechProfile::vLayers, py::return_value_policy::reference_internal)
    .def("layer_idx", &TechProfile::layerIdx)
    .def("has_layer", &TechProfile::hasLayer)
    .def("is_low_parasitic_excluded", &TechProfile::isLowParasiticExcluded)
    .def("is_adjacent", &TechProfile::isAdjacent)
    .def("via_name", &TechProfile::viaName)
    .def("to_db_unit", &TechProfile::toDBUnit)
    .def("to_um", &TechProfile::toUm)
    .def("quantize_width", &TechProfile::quantizeWidth)
    .def("num_via_cuts", &TechProfile::numViaCuts);
}

void initShapeAPI(py::module& m)
{
  py::class_<ShapeParams>(m, "shape_params")
    .def(py::init<>())
    .def_readwrite("shape", &ShapeParams::shape)
    .def_readwrite("finger_count", &ShapeParams::fingerCount)
    .def_readwrite("active_height", &ShapeParams::activeHeight)
    .def_readwrite("finger_width", &ShapeParams::fingerWidth)
    .def_readwrite("finger_spacing", &ShapeParams::fingerSpacing)
    .def_readwrite("bar_width", &ShapeParams::barWidth)
    .def_readwrite("middle_bar_width", &ShapeParams::middleBarWidth)
    .def_readwrite("frame_width", &ShapeParams::frameWidth)
    .def_readwrite("spacing", &ShapeParams::spacing)
    .def_readwrite("tip_spacing", &ShapeParams::tipSpacing)
    .def_readwrite("layers", &ShapeParams::vLayers)
    .def_readwrite("height_ceiling", &ShapeParams::heightCeiling)
    .def_readwrite("low_parasitic", &ShapeParams::bLowParasitic)
    .def_readwrite("include_shield", &ShapeParams::bIncludeShield)
    .def_readwrite("label_size", &ShapeParams::labelSize)
    .def_readwrite("pos_label", &ShapeParams::posLabel)
    .def_readwrite("neg_label", &ShapeParams::negLabel);

  py::class_<ViaRow>(m, "via_row")
    .def_readonly("name", &ViaRow::name)
    .def_readonly("upper", &ViaRow::upper)
    .def_readonly("lower", &ViaRow::lower)
    .def_readonly("via_name", &ViaRow::viaName)
    .def_readonly("center", &ViaRow::center)
    .def_readonly("num_rows", &ViaRow::numRows)
    .def_readonly("num_cols", &ViaRow::numCols);

  py::class_<Geometry>(m, "geometry")
    .def("shape", &Geometry::shape)
    .def("half_width", &Geometry::halfWidth)
    .def("half_height", &Geometry::halfHeight)
    .def("active_half_width", &Geometry::activeHalfWidth)
    .def("active_half_height", &Geometry::activeHalfHeight)
    .def("total_height", &Geometry::totalHeight)
    .def("num_layers", &Geometry::numLayers)
    .def("via_rows", &Geometry::vViaRows, py::return_value_policy::reference_internal)
    .def("pos_pin", &Geometry::posPin, py::return_value_policy::reference_internal)
    .def("neg_pin", &Geometry::negPin, py::return_value_policy::reference_internal);
}

void initDrcAPI(py::module& m)
{
  py::class_<Violation>(m, "violation")
    .def_readonly("kind", &Violation::kind)
    .def_readonly("field", &Violation::field)
    .def_readonly("msg", &Violation::msg);

  py::class_<ValidationOutcome>(m, "validation_outcome")
    .def("accepted", &ValidationOutcome::accepted)
    .def("violations", &ValidationOutcome::vViolations, py::return_value_policy::reference_internal)
    .def("has", &ValidationOutcome::has);
}

void initPrimAPI(py::module& m)
{
  py::class_<Prim>(m, "prim")
    .def("type", &Prim::type)
    .def("layer", &Prim::layer, py::return_value_policy::reference_internal)
    .def("is_shield", &Prim::isShield)
    .def("values", &Prim::values);
}

void initMosaicAPI(py::module& m)
{
  py::class_<ArrayGrid>(m, "array_grid")
    .def(py::init<Int, Int, const Point<Int>&>())
    .def("num_rows", &ArrayGrid::numRows)
    .def("num_cols", &ArrayGrid::numCols)
    .def("is_occupied", &ArrayGrid::isOccupied)
    .def("set_occupied", &ArrayGrid::setOccupied, py::arg("r"), py::arg("c"), py::arg("b") = true)
    .def("set_pitch", &ArrayGrid::setPitch);

  py::class_<MosaicRegion>(m, "mosaic_region")
    .def_readonly("row_start", &MosaicRegion::rowStart)
    .def_readonly("row_end", &MosaicRegion::rowEnd)
    .def_readonly("col_start", &MosaicRegion::colStart)
    .def_readonly("col_end", &MosaicRegion::colEnd)
    .def_readonly("pitch", &MosaicRegion::pitch);
}

//////////////////////////////////
//          Flow Api            //
//////////////////////////////////
void initFlowAPI(py::module& m)
{
  m.def("parse_tech", [](const String& fileName) {
    TechProfile tech;
    Parser par(tech);
    par.parseTech(fileName);
    return tech;
  });
  m.def("parse_shape", [](const String& fileName) {
    TechProfile tech;
    Parser par(tech);
    ShapeParams params;
    par.parseShape(fileName, params);
    return params;
  });
  m.def("compute_geometry", [](const ShapeParams& params, const TechProfile& tech) {
    return ShapeMgr(tech).computeGeometry(params);
  });
  m.def("validate", [](const Geometry& geo, const ShapeParams& params, const TechProfile& tech) {
    return DrcMgr(tech).validate(geo, params);
  });
  m.def("render", [](const Geometry& geo, const ShapeParams& params, const bool bIncludeShield) {
    return RenderMgr().render(geo, params, bIncludeShield);
  }, py::arg("geo"), py::arg("params"), py::arg("include_shield") = true);
  m.def("prims_to_yaml", [](const Vector<Prim>& vPrims, const TechProfile& tech) {
    const NumFormat nf(tech.grid(), tech.precision());
    return Writer(nf).prims2Str(vPrims);
  });
  m.def("merge", [](const ArrayGrid& grid) {
    return MosaicMgr().merge(grid);
  });
}

} // namespace PROJECT_NAMESPACE::api

PYBIND11_MODULE(momgen, m)
{
  spdlog::set_pattern("[%^%l%$] %v");
  PROJECT_NAMESPACE::api::initShapeEnum(m);
  PROJECT_NAMESPACE::api::initPlateEnum(m);
  PROJECT_NAMESPACE::api::initPrimTypeEnum(m);
  PROJECT_NAMESPACE::api::initViolationEnum(m);
  PROJECT_NAMESPACE::api::initErrors(m);
  PROJECT_NAMESPACE::api::initGeoAPI(m);
  PROJECT_NAMESPACE::api::initTechAPI(m);
  PROJECT_NAMESPACE::api::initShapeAPI(m);
  PROJECT_NAMESPACE::api::initDrcAPI(m);
  PROJECT_NAMESPACE::api::initPrimAPI(m);
  PROJECT_NAMESPACE::api::initMosaicAPI(m);
  PROJECT_NAMESPACE::api::initFlowAPI(m);
}
