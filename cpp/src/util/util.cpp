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
#include "util.hpp"
#include <sys/stat.h>
#include <cctype>

PROJECT_NAMESPACE_START

namespace util::fs {

bool existFile(const String& fileName)
{
  struct stat buf;
  return stat(fileName.c_str(), &buf) == 0;
}

String getFileName(const String& fileName)
{
  String            retStr = fileName;
  String::size_type pos    = retStr.rfind("/");
  if (pos != String::npos)
    retStr = retStr.substr(pos + 1);
  return retStr;
}

} // namespace util::fs

namespace util::str {

bool startsWith(const String& s, const String& prefix)
{
  return s.size() >= prefix.size() and s.compare(0, prefix.size(), prefix) == 0;
}

bool isDigits(const String& s)
{
  return !s.empty() and std::all_of(s.begin(), s.end(), [](const char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

Int trailingNum(const String& s)
{
  String::size_type pos = s.size();
  while (pos > 0 and std::isdigit(static_cast<unsigned char>(s[pos - 1]))) {
    --pos;
  }
  // layer numbers are short; longer suffixes would overflow Int
  if (pos == s.size() or s.size() - pos > 4) {
    return -1;
  }
  return std::stoi(s.substr(pos));
}

} // namespace util::str

PROJECT_NAMESPACE_END
