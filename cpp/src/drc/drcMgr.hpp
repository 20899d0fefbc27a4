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

#include "db/dbTech.hpp"
#include "db/dbShape.hpp"

PROJECT_NAMESPACE_START

struct Violation {
  ViolationE kind;
  String     field;
  String     msg;
};

class ValidationOutcome {
public:
  bool                      accepted()                   const { return _vViolations.empty(); }
  Int                       numViolations()              const { return _vViolations.size(); }
  const Violation&          violation(const Int i)       const { return _vViolations.at(i); }
  const Vector<Violation>&  vViolations()                const { return _vViolations; }
  bool                      has(const ViolationE kind)   const;
  Int                       count(const ViolationE kind) const;

  void                      add(const ViolationE kind, const String& field, const String& msg) { _vViolations.push_back({kind, field, msg}); }

private:
  Vector<Violation> _vViolations;
};

// Rule checker for derived geometries. Every rule is evaluated, so one pass
// reports all violations.
class DrcMgr {
public:
  DrcMgr(const TechProfile& tech)
    : _tech(tech)
  {}
  ~DrcMgr() {}

  ValidationOutcome validate(const Geometry& geo, const ShapeParams& params) const;

  ////////////////////////////////////////
  //         Rule checking              //
  ////////////////////////////////////////
  void checkSpacing(const Geometry& geo, ValidationOutcome& out) const;
  void checkWidth(const Geometry& geo, ValidationOutcome& out) const;
  void checkQuantization(const Geometry& geo, ValidationOutcome& out) const;
  void checkLayers(const ShapeParams& params, ValidationOutcome& out) const;
  void checkViaAdjacency(const Geometry& geo, ValidationOutcome& out) const;
  void checkFingerCount(const ShapeParams& params, ValidationOutcome& out) const;
  void checkHeight(const Geometry& geo, const ShapeParams& params, ValidationOutcome& out) const;
  void checkMinArea(const Geometry& geo, ValidationOutcome& out) const;

  // effective minimum of a named spacing
  Int  spacingMin(const ShapeE shape, const String& name) const;

private:
  const TechProfile& _tech;
};

PROJECT_NAMESPACE_END
