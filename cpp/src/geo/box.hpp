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

#include <cassert>
#include "point.hpp"

PROJECT_NAMESPACE_START

template<typename T>
class Box {
public:
  Box(T l = 0, T b = 0, T r = 0, T t = 0)
    : _bl(l, b), _tr(r, t) {
    assert(l <= r && b <= t);
  }
  Box(const Point<T>& p0, const Point<T>& p1) {
    assert(p0.x() <= p1.x() && p0.y() <= p1.y());
    _bl = p0;
    _tr = p1;
  }
  ~Box() {}

  // Basic setting functions
  void  setXL(T l)                      { _bl.setX(l); }
  void  setXH(T r)                      { _tr.setX(r); }
  void  setYL(T b)                      { _bl.setY(b); }
  void  setYH(T t)                      { _tr.setY(t); }
  void  set(T l, T b, T r, T t)         { setXL(l); setYL(b); setXH(r); setYH(t); }
  // Basic access functions
  T          xl()               const { return _bl.x(); }
  T          yl()               const { return _bl.y(); }
  T          xh()               const { return _tr.x(); }
  T          yh()               const { return _tr.y(); }
  T          width()            const { return xh() - xl(); }
  T          height()           const { return yh() - yl(); }
  Long       area()             const { return static_cast<Long>(width()) * static_cast<Long>(height()); }

  // Points
  const Point<T>&   bl()         const { return _bl; }
  const Point<T>&   tr()         const { return _tr; }

  // operator
  bool operator < (const Box<T>& box) const {
    return std::tie(_bl, _tr) < std::tie(box._bl, box._tr);
  }

  bool operator == (const Box<T>& box) const {
    return std::tie(_bl, _tr) == std::tie(box._bl, box._tr);
  }

  bool operator != (const Box<T>& box) const {
    return !(*this == box);
  }

  friend std::ostream& operator << (std::ostream& os, const Box& r) {
    os << '(' << r._bl.x() << ' ' << r._bl.y() << ' ' << r._tr.x() << ' ' << r._tr.y() << ')';
    return os;
  }

private:
  Point<T> _bl; // bottom left
  Point<T> _tr; // top right
};

PROJECT_NAMESPACE_END

// boost polygon
namespace boost { namespace polygon {
    template<typename CoordType>
    struct geometry_concept<PROJECT_NAMESPACE::Box<CoordType>> { typedef rectangle_concept type; };

    template<typename CoordType>
    struct rectangle_traits<PROJECT_NAMESPACE::Box<CoordType>>
    {
        typedef CoordType coordinate_type;
        typedef interval_data<CoordType> interval_type;
        static inline interval_type get(const PROJECT_NAMESPACE::Box<CoordType>& box, orientation_2d orient)
        {
            if (orient == HORIZONTAL)
            {
                return interval_type(box.xl(), box.xh());
            }
            else
            {
                return interval_type(box.yl(), box.yh());
            }
        }
    };

    template<typename CoordType>
    struct rectangle_mutable_traits<PROJECT_NAMESPACE::Box<CoordType>>
    {
        template<typename T2>
        static inline void set(PROJECT_NAMESPACE::Box<CoordType>& box, orientation_2d orient, const T2& interval)
        {
            if (orient == HORIZONTAL)
            {
                box.setXL(low(interval));
                box.setXH(high(interval));
            }
            else
            {
                box.setYL(low(interval));
                box.setYH(high(interval));
            }
        }
        template<typename T2, typename T3>
        static inline PROJECT_NAMESPACE::Box<CoordType> construct(const T2& hor, const T3& ver)
        {
            return PROJECT_NAMESPACE::Box<CoordType>(low(hor), low(ver), high(hor), high(ver));
        }
    };
}};
