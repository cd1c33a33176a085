/* Copyright 2023 NVIDIA Corporation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */

#pragma once

#include <cstddef>
#include <vector>

#include "legate.h"
#include "cusample/cusample_c.h"

namespace cusample {

using Shape = std::vector<size_t>;

inline size_t volume(const Shape& shape)
{
  size_t result = 1;
  for (auto extent : shape) result *= extent;
  return result;
}

}  // namespace cusample
