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

#include <cstring>
#include "global/type.hpp"

PROJECT_NAMESPACE_START

template<typename T>
class Point {
public:
  Point(T x = 0, T y = 0) : _d{x, y} {}
  Point(const Point& p) { memcpy(_d, p.d(), 2 * sizeof(T)); }
  ~Point() {}

  // Basic setting functions
  void  setX(const T x)                      { _d[0] = x;                          }
  void  setY(const T y)                      { _d[1] = y;                          }
  void  setXY(const T x, const T y)          { _d[0] = x; _d[1] = y;               }
  void  shiftXY(const T x, const T y)        { _d[0] += x; _d[1] += y;             }
  void  flipY(const T y)                     { _d[1] = 2 * y - _d[1];              }

  // Basic access functions
  T        x()              const { return _d[0]; }
  T        y()              const { return _d[1]; }
  T*       d()                    { return _d;    }
  T const *d()              const { return _d;    }

  static T Mdistance(const Point& p0, const Point& p1) {
    return (p0._d[0] > p1._d[0] ? p0._d[0] - p1._d[0] : p1._d[0] - p0._d[0]) +
           (p0._d[1] > p1._d[1] ? p0._d[1] - p1._d[1] : p1._d[1] - p0._d[1]);
  }

  // operators
  friend std::ostream&  operator <<  (std::ostream& os, const Point& p)        { os << '(' << p._d[0] << ' ' << p._d[1] << ')'; return os; }
  bool                  operator ==  (const Point& p)              const       { return _d[0] == p._d[0] && _d[1] == p._d[1]; }
  bool                  operator !=  (const Point& p)              const       { return !(*this == p); }
  bool                  operator <   (const Point& p)              const       { return _d[0] != p._d[0] ? _d[0] < p._d[0] : _d[1] < p._d[1]; }
  Point&                operator =   (const Point& p)                          { setXY(p._d[0], p._d[1]); return *this; }
  Point                 operator +   (const Point& p)              const       { return Point(_d[0] + p._d[0], _d[1] + p._d[1]); }
  Point                 operator -   (const Point& p)              const       { return Point(_d[0] - p._d[0], _d[1] - p._d[1]); }

private:
  T _d[2];
};

PROJECT_NAMESPACE_END

// boost polygon
#include <boost/polygon/point_traits.hpp>
#include <boost/polygon/polygon.hpp>
namespace boost { namespace polygon {
    template<typename CoordType>
    struct geometry_concept<PROJECT_NAMESPACE::Point<CoordType>> { typedef point_concept type;};
    // Point Concept
    template<typename CoordType>
    struct point_traits<PROJECT_NAMESPACE::Point<CoordType>>
    {
        typedef CoordType coordinate_type;
        static inline coordinate_type get(const PROJECT_NAMESPACE::Point<CoordType> &point, orientation_2d orient)
        {
            if (orient== HORIZONTAL)
            {
                return point.x();
            }
            else
            {
                return point.y();
            }
        }
    };
    template<typename CoordType>
    struct point_mutable_traits<PROJECT_NAMESPACE::Point<CoordType>>
    {
        typedef CoordType coordinate_type;
        static void inline set(PROJECT_NAMESPACE::Point<CoordType> &point, orientation_2d orient, CoordType value)
        {
            if (orient == HORIZONTAL)
            {
                point.setX(value);
            }
            else
            {
                point.setY(value);
            }
        }
        static inline PROJECT_NAMESPACE::Point<CoordType> construct(CoordType x_value, CoordType y_value)
        {
            return PROJECT_NAMESPACE::Point<CoordType>(x_value, y_value);
        }
    };
}};
