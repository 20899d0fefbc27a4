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

#include "dbBasic.hpp"

PROJECT_NAMESPACE_START

namespace shape {

Int parity(const ShapeE s)
{
  switch (s) {
    case ShapeE::frame_bar:  return 1;
    case ShapeE::alt_finger: return 0;
    case ShapeE::sandwich:   return 1;
    default: assert(false);
  }
  return -1;
}

Int minFingers(const ShapeE s)
{
  switch (s) {
    case ShapeE::frame_bar:  return 3;
    case ShapeE::alt_finger: return 2;
    case ShapeE::sandwich:   return 3;
    default: assert(false);
  }
  return MAX_INT;
}

bool isValidFingerCount(const ShapeE s, const Int n)
{
  if (s == ShapeE::undef) {
    return false;
  }
  return n >= minFingers(s) and n % 2 == parity(s);
}

ShapeE str2Shape(const String& s)
{
  ShapeE e = util::enumUtil::str2Val(ShapeEStr, s);
  if (e == ShapeE::undef) {
    e = util::enumUtil::str2Val(ShapeEStr2, s);
  }
  return e;
}

}

PROJECT_NAMESPACE_END
