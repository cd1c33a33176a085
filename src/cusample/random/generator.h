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

#include <memory>
#include <optional>

#include "cusample/array.h"
#include "cusample/random/bitgenerator.h"

namespace cusample {

// Wide enough to hold any range bound whose difference may overflow 64 bits
using wide_int_t = __int128;

struct IntervalParams {
  uint64_t diff;            // inclusive width of the range
  uint64_t mask;            // smallest all-ones value covering diff
  uint32_t width;           // interval kernel width, 32 or 64
  legate::Type::Code code;  // narrowest of UINT32, INT32, UINT64, INT64 holding [low, high]
};

// Throws InvalidArgumentError for an empty range and RangeOverflowError when the
// width does not fit in 64 unsigned bits or the values do not fit a 64-bit type
IntervalParams interval_params(wide_int_t low, wide_int_t high, bool endpoint);

class Generator {
 public:
  explicit Generator(std::unique_ptr<BitGenerator> bit_generator);

 public:
  BitGenerator& bit_generator() const { return *bit_generator_; }

 public:
  // Uniform integers in [low, high), or [low, high] with endpoint. The result
  // holds the exact values, typed by IntervalParams::code: signed when low < 0,
  // 64-bit when a bound falls outside the 32-bit type. dtype must be an integer
  // type; converting to it is left to the caller.
  Array integers(wide_int_t low,
                 wide_int_t high,
                 const Shape& shape,
                 legate::Type::Code dtype = legate::Type::Code::INT64,
                 bool endpoint            = false);
  Array integers(wide_int_t high, const Shape& shape);

  // Uniform in [0, 1)
  Array random(const Shape& shape, legate::Type::Code dtype = legate::Type::Code::FLOAT64);

  Array beta(double a,
             double b,
             const Shape& shape,
             legate::Type::Code dtype = legate::Type::Code::FLOAT64);

  // Only the inversion method is implemented. When out is given, it must match
  // dtype and shape; it receives the sample and is returned.
  Array standard_exponential(const Shape& shape,
                             legate::Type::Code dtype = legate::Type::Code::FLOAT64,
                             ExponentialMethod method = ExponentialMethod::INVERSION,
                             std::optional<Array> out = std::nullopt);

  Array exponential(double scale,
                    const Shape& shape,
                    legate::Type::Code dtype = legate::Type::Code::FLOAT64);

 private:
  Array allocate(legate::Type::Code code, const Shape& shape);

 private:
  std::unique_ptr<BitGenerator> bit_generator_;
};

// Generator over the algorithm named by CUSAMPLE_DEFAULT_GENERATOR (XORWOW by default)
Generator default_rng(const Seed& seed = Seed());

}  // namespace cusample
