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

PROJECT_NAMESPACE_START

// Dense row-major matrix; row 0 is the first row of the source data.
template<typename T>
class Array2d {
 public:
  Array2d() : _numRows(0), _numCols(0) {}
  Array2d(const Int r, const Int c) : _numRows(r), _numCols(c), _vec(r * c) {}
  Array2d(const Int r, const Int c, const T& val) : _numRows(r), _numCols(c), _vec(r * c, val) {}
  ~Array2d() {}

  // get
  Int       numRows()                     const  { return _numRows; }
  Int       numCols()                     const  { return _numCols; }
  Int       size()                        const  { return _vec.size(); }
  bool      empty()                       const  { return _vec.empty(); }
  bool      inside(const Int r, const Int c) const { return 0 <= r and r < _numRows and 0 <= c and c < _numCols; }
  T&        at(const Int r, const Int c)         { return _vec.at(flatIdx(r, c)); }
  const T&  at(const Int r, const Int c)  const  { return _vec.at(flatIdx(r, c)); }

  // iterator
  inline typename Vector<T>::iterator       begin()        { return _vec.begin(); }
  inline typename Vector<T>::const_iterator begin()  const { return _vec.cbegin(); }
  inline typename Vector<T>::iterator       end()          { return _vec.end(); }
  inline typename Vector<T>::const_iterator end()    const { return _vec.cend(); }

  // set
  void clear() { _numRows = _numCols = 0; _vec.clear(); }
  void resize(const Int r, const Int c, const T& val) { _numRows = r; _numCols = c; _vec.assign(r * c, val); }
  void set(const Int r, const Int c, const T& val) { _vec.at(flatIdx(r, c)) = val; }
  void fill(const T& val) { std::fill(_vec.begin(), _vec.end(), val); }

 private:
  Int       _numRows;
  Int       _numCols;
  Vector<T> _vec;

  Int flatIdx(const Int r, const Int c) const {
    assert(inside(r, c));
    return r * _numCols + c;
  }
};

PROJECT_NAMESPACE_END
