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
#include <cuda_runtime.h>

#define THREADS_PER_BLOCK 128
#define MIN_CTAS_PER_SM 4

#define CHECK_CUDART(expr)                                  \
  do {                                                      \
    cudaError_t __result__ = (expr);                        \
    cusample::check_cudart(__result__, __FILE__, __LINE__); \
  } while (false)

namespace cusample {

#ifdef __CUDACC__
__device__ inline size_t global_tid_1d()
{
  return static_cast<size_t>(blockIdx.x) * blockDim.x + threadIdx.x;
}
#endif

inline size_t blocks_for(size_t count)
{
  return (count + THREADS_PER_BLOCK - 1) / THREADS_PER_BLOCK;
}

// Throws DeviceRuntimeError; defined in cudalibs.cc
void check_cudart(cudaError_t error, const char* file, int line);

}  // namespace cusample
