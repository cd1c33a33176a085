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

#include "generator.h"

// Uniform draw in [0, max] by masked rejection: a draw d is kept iff (d & mask) <= max,
// where mask is the smallest all-ones value covering max.
template <typename field_t>
struct interval;

template <>
struct interval<uint32_t> {
  uint32_t max;
  uint32_t mask;

  template <typename gen_t>
  RANDUTIL_QUALIFIERS uint32_t operator()(gen_t& gen)
  {
    uint32_t value;
    do {
      value = curand(&gen) & mask;
    } while (value > max);
    return value;
  }
};

template <>
struct interval<uint64_t> {
  uint64_t max;
  uint64_t mask;

  template <typename gen_t>
  RANDUTIL_QUALIFIERS uint64_t operator()(gen_t& gen)
  {
    uint64_t value;
    do {
      // take two draws to get a 64 bits value
      const uint64_t low  = curand(&gen);
      const uint64_t high = curand(&gen);
      value               = ((high << 32) | low) & mask;
    } while (value > max);
    return value;
  }
};

// Widens a 32 bits functor's result for a 64 bits output
template <typename inner_t>
struct widen {
  inner_t inner;

  template <typename gen_t>
  RANDUTIL_QUALIFIERS uint64_t operator()(gen_t& gen)
  {
    return static_cast<uint64_t>(inner(gen));
  }
};

template <typename field_t>
static __global__ void __launch_bounds__(THREADS_PER_BLOCK, MIN_CTAS_PER_SM)
  shift_kernel(field_t* ptr, size_t n, field_t offset)
{
  const size_t idx = cusample::global_tid_1d();
  if (idx >= n) return;
  // unsigned wrap-around, so negative offsets come out right in two's complement
  ptr[idx] += offset;
}

static __global__ void __launch_bounds__(THREADS_PER_BLOCK, MIN_CTAS_PER_SM)
  widen_kernel(const uint32_t* in, uint64_t* out, size_t n, uint64_t offset)
{
  const size_t idx = cusample::global_tid_1d();
  if (idx >= n) return;
  out[idx] = static_cast<uint64_t>(in[idx]) + offset;
}
