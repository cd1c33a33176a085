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

#include "cusample/random/kernels.h"

namespace cusample {

class CURANDKernels : public KernelLibrary {
 public:
  size_t state_bytes(BitGeneratorType type) override;
  void init_states(BitGeneratorType type,
                   void* state,
                   uint64_t seed,
                   uint32_t stream_count,
                   cudaStream_t stream) override;

  void raw_32(
    BitGeneratorType type, void* state, uint32_t* out, size_t n, cudaStream_t stream) override;
  void interval_32(BitGeneratorType type,
                   void* state,
                   uint32_t* out,
                   size_t n,
                   cudaStream_t stream,
                   uint32_t max,
                   uint32_t mask) override;
  void interval_64(BitGeneratorType type,
                   void* state,
                   uint64_t* out,
                   size_t n,
                   cudaStream_t stream,
                   uint64_t max,
                   uint64_t mask) override;
  void uniform_32(
    BitGeneratorType type, void* state, float* out, size_t n, cudaStream_t stream) override;
  void uniform_64(
    BitGeneratorType type, void* state, double* out, size_t n, cudaStream_t stream) override;
  void beta_32(BitGeneratorType type,
               void* state,
               float* out,
               size_t n,
               cudaStream_t stream,
               float a,
               float b) override;
  void beta_64(BitGeneratorType type,
               void* state,
               double* out,
               size_t n,
               cudaStream_t stream,
               double a,
               double b) override;
  void standard_exponential_32(
    BitGeneratorType type, void* state, float* out, size_t n, cudaStream_t stream) override;
  void standard_exponential_64(
    BitGeneratorType type, void* state, double* out, size_t n, cudaStream_t stream) override;
  void shift_32(uint32_t* out, size_t n, uint32_t offset, cudaStream_t stream) override;
  void shift_64(uint64_t* out, size_t n, uint64_t offset, cudaStream_t stream) override;
  void widen_32(const uint32_t* in,
                uint64_t* out,
                size_t n,
                uint64_t offset,
                cudaStream_t stream) override;
  void scale_32(float* out, size_t n, float factor, cudaStream_t stream) override;
  void scale_64(double* out, size_t n, double factor, cudaStream_t stream) override;
};

}  // namespace cusample
