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

#include <cstdint>
#include <utility>

#include "cusample/cuda_help.h"
#include "cusample/random/randutil/randutil.h"
#include "cusample/random/randutil/randutil_curand.h"

namespace randutilimpl {

template <typename gen_t>
struct generatorid;

template <>
struct generatorid<gen_XORWOW_t> {
  static constexpr int rng_type = CURAND_RNG_PSEUDO_XORWOW;
};
template <>
struct generatorid<gen_Philox4_32_10_t> {
  static constexpr int rng_type = CURAND_RNG_PSEUDO_PHILOX4_32_10;
};
template <>
struct generatorid<gen_MRG32k3a_t> {
  static constexpr int rng_type = CURAND_RNG_PSEUDO_MRG32K3A;
};

template <typename Functor, typename... Fnargs>
curandStatus_t rng_dispatch(curandRngType_t rng_type, Functor f, Fnargs&&... args)
{
  switch (rng_type) {
    case CURAND_RNG_PSEUDO_XORWOW:
      return f.template operator()<gen_XORWOW_t>(std::forward<Fnargs>(args)...);
    case CURAND_RNG_PSEUDO_PHILOX4_32_10:
      return f.template operator()<gen_Philox4_32_10_t>(std::forward<Fnargs>(args)...);
    case CURAND_RNG_PSEUDO_MRG32K3A:
      return f.template operator()<gen_MRG32k3a_t>(std::forward<Fnargs>(args)...);
    default: break;
  }
  return CURAND_STATUS_TYPE_ERROR;
}

inline curandStatus_t launch_status()
{
  cudaError_t error = cudaGetLastError();
  if (error == cudaSuccess) return CURAND_STATUS_SUCCESS;
  return error == cudaErrorMemoryAllocation ? CURAND_STATUS_ALLOCATION_FAILED
                                            : CURAND_STATUS_LAUNCH_FAILURE;
}

template <typename gen_t>
static __global__ void __launch_bounds__(THREADS_PER_BLOCK, MIN_CTAS_PER_SM)
  init_kernel(gen_t* states, uint64_t seed, uint32_t nstreams)
{
  const size_t idx = cusample::global_tid_1d();
  if (idx >= nstreams) return;
  // one subsequence per stream keeps the streams independent
  curand_init(seed, idx, 0, &states[idx]);
}

// Thread idx owns stream idx: load the state, draw, and store the advanced state back
template <typename gen_t, typename func_t, typename out_t>
static __global__ void __launch_bounds__(THREADS_PER_BLOCK, MIN_CTAS_PER_SM)
  draw_kernel(gen_t* states, out_t* out, size_t n, func_t func)
{
  const size_t idx = cusample::global_tid_1d();
  if (idx >= n) return;
  gen_t state = states[idx];
  out[idx]    = func(state);
  states[idx] = state;
}

struct state_size_fn {
  template <typename gen_t>
  curandStatus_t operator()(size_t* bytes)
  {
    *bytes = sizeof(gen_t);
    return CURAND_STATUS_SUCCESS;
  }
};

struct init_fn {
  template <typename gen_t>
  curandStatus_t operator()(void* states, uint64_t seed, uint32_t nstreams, cudaStream_t stream)
  {
    if (nstreams == 0) return CURAND_STATUS_SUCCESS;
    init_kernel<gen_t><<<cusample::blocks_for(nstreams), THREADS_PER_BLOCK, 0, stream>>>(
      static_cast<gen_t*>(states), seed, nstreams);
    return launch_status();
  }
};

template <typename func_t, typename out_t>
struct draw_fn {
  template <typename gen_t>
  curandStatus_t operator()(void* states, out_t* out, size_t n, cudaStream_t stream, func_t func)
  {
    if (n == 0) return CURAND_STATUS_SUCCESS;
    draw_kernel<gen_t, func_t, out_t><<<cusample::blocks_for(n), THREADS_PER_BLOCK, 0, stream>>>(
      static_cast<gen_t*>(states), out, n, func);
    return launch_status();
  }
};

template <typename func_t, typename out_t>
curandStatus_t dispatch(
  curandRngType_t rng_type, void* states, out_t* out, size_t n, cudaStream_t stream, func_t func)
{
  if (nullptr == states || (n > 0 && nullptr == out)) return CURAND_STATUS_NOT_INITIALIZED;
  return rng_dispatch(rng_type, draw_fn<func_t, out_t>{}, states, out, n, stream, func);
}

}  // namespace randutilimpl
