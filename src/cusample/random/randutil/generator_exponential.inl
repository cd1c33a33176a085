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
#include "random_distributions.h"

// Inversion method with rate 1
template <typename field_t>
struct standard_exponential_t;

template <>
struct standard_exponential_t<float> {
  template <typename gen_t>
  RANDUTIL_QUALIFIERS float operator()(gen_t& gen)
  {
    return -::logf(curand_uniform(&gen));
  }
};

template <>
struct standard_exponential_t<double> {
  template <typename gen_t>
  RANDUTIL_QUALIFIERS double operator()(gen_t& gen)
  {
    return rk_standard_exponential(&gen);
  }
};

template <typename field_t>
static __global__ void __launch_bounds__(THREADS_PER_BLOCK, MIN_CTAS_PER_SM)
  scale_kernel(field_t* ptr, size_t n, field_t factor)
{
  const size_t idx = cusample::global_tid_1d();
  if (idx >= n) return;
  ptr[idx] *= factor;
}
