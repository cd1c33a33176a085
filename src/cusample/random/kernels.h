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
#include <cstdint>

#include <cuda_runtime_api.h>

#include "cusample/random/bitgenerator_util.h"

namespace cusample {

// Device procedures behind the generator core. Every sampling entry point fills
// n elements of out using the first n streams of the state block; n never
// exceeds the stream count the state was initialized with. Failures are
// reported by throwing KernelInvocationError.
class KernelLibrary {
 public:
  virtual ~KernelLibrary() {}

  // Per-stream state size; a constant of the algorithm
  virtual size_t state_bytes(BitGeneratorType type) = 0;

  virtual void init_states(BitGeneratorType type,
                           void* state,
                           uint64_t seed,
                           uint32_t stream_count,
                           cudaStream_t stream) = 0;

  virtual void raw_32(
    BitGeneratorType type, void* state, uint32_t* out, size_t n, cudaStream_t stream) = 0;

  // Uniform in [0, max] (inclusive); mask is the smallest all-ones value covering max
  virtual void interval_32(BitGeneratorType type,
                           void* state,
                           uint32_t* out,
                           size_t n,
                           cudaStream_t stream,
                           uint32_t max,
                           uint32_t mask) = 0;
  virtual void interval_64(BitGeneratorType type,
                           void* state,
                           uint64_t* out,
                           size_t n,
                           cudaStream_t stream,
                           uint64_t max,
                           uint64_t mask) = 0;

  // Uniform in [0, 1)
  virtual void uniform_32(
    BitGeneratorType type, void* state, float* out, size_t n, cudaStream_t stream) = 0;
  virtual void uniform_64(
    BitGeneratorType type, void* state, double* out, size_t n, cudaStream_t stream) = 0;

  virtual void beta_32(BitGeneratorType type,
                       void* state,
                       float* out,
                       size_t n,
                       cudaStream_t stream,
                       float a,
                       float b) = 0;
  virtual void beta_64(BitGeneratorType type,
                       void* state,
                       double* out,
                       size_t n,
                       cudaStream_t stream,
                       double a,
                       double b) = 0;

  virtual void standard_exponential_32(
    BitGeneratorType type, void* state, float* out, size_t n, cudaStream_t stream) = 0;
  virtual void standard_exponential_64(
    BitGeneratorType type, void* state, double* out, size_t n, cudaStream_t stream) = 0;

  // out[i] += offset, wrapping modulo the element width
  virtual void shift_32(uint32_t* out, size_t n, uint32_t offset, cudaStream_t stream) = 0;
  virtual void shift_64(uint64_t* out, size_t n, uint64_t offset, cudaStream_t stream) = 0;

  // out[i] = in[i] + offset, computed in 64 bits
  virtual void widen_32(
    const uint32_t* in, uint64_t* out, size_t n, uint64_t offset, cudaStream_t stream) = 0;

  // out[i] *= factor
  virtual void scale_32(float* out, size_t n, float factor, cudaStream_t stream)   = 0;
  virtual void scale_64(double* out, size_t n, double factor, cudaStream_t stream) = 0;
};

// cuRAND device API implementation, shared by the whole process
KernelLibrary& get_curand_kernels();

}  // namespace cusample
