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
#include <curand.h>

/* Every generator state block holds one curandState*_t per stream. Sampling
 * entry points draw element i from stream i, so n must not exceed the number
 * of streams the block was initialized with. */

/* state */

extern "C" curandStatus_t randutilGetStateSize(curandRngType_t rng_type, size_t* bytes);

extern "C" curandStatus_t randutilInitStates(curandRngType_t rng_type,
                                             void* states,
                                             uint64_t seed,
                                             uint32_t nstreams,
                                             cudaStream_t stream);

/* raw and integer draws */

extern "C" curandStatus_t randutilGenerateRawUInt32(curandRngType_t rng_type,
                                                    void* states,
                                                    uint32_t* outputPtr,
                                                    size_t n,
                                                    cudaStream_t stream);

extern "C" curandStatus_t randutilGenerateInterval32(curandRngType_t rng_type,
                                                     void* states,
                                                     uint32_t* outputPtr,
                                                     size_t n,
                                                     cudaStream_t stream,
                                                     uint32_t max /* inclusive */,
                                                     uint32_t mask);
extern "C" curandStatus_t randutilGenerateInterval64(curandRngType_t rng_type,
                                                     void* states,
                                                     uint64_t* outputPtr,
                                                     size_t n,
                                                     cudaStream_t stream,
                                                     uint64_t max /* inclusive */,
                                                     uint64_t mask);

/* continuous distributions */

extern "C" curandStatus_t randutilGenerateUniformEx(curandRngType_t rng_type,
                                                    void* states,
                                                    float* outputPtr,
                                                    size_t n,
                                                    cudaStream_t stream);
extern "C" curandStatus_t randutilGenerateUniformDoubleEx(curandRngType_t rng_type,
                                                          void* states,
                                                          double* outputPtr,
                                                          size_t n,
                                                          cudaStream_t stream);

extern "C" curandStatus_t randutilGenerateBetaEx(curandRngType_t rng_type,
                                                 void* states,
                                                 float* outputPtr,
                                                 size_t n,
                                                 cudaStream_t stream,
                                                 float a,
                                                 float b);
extern "C" curandStatus_t randutilGenerateBetaDoubleEx(curandRngType_t rng_type,
                                                       void* states,
                                                       double* outputPtr,
                                                       size_t n,
                                                       cudaStream_t stream,
                                                       double a,
                                                       double b);

extern "C" curandStatus_t randutilGenerateStandardExponentialEx(curandRngType_t rng_type,
                                                                void* states,
                                                                float* outputPtr,
                                                                size_t n,
                                                                cudaStream_t stream);
extern "C" curandStatus_t randutilGenerateStandardExponentialDoubleEx(curandRngType_t rng_type,
                                                                      void* states,
                                                                      double* outputPtr,
                                                                      size_t n,
                                                                      cudaStream_t stream);

/* element-wise helpers (no generator state) */

extern "C" curandStatus_t randutilShiftUInt32(uint32_t* ptr,
                                              size_t n,
                                              uint32_t offset,
                                              cudaStream_t stream);
extern "C" curandStatus_t randutilShiftUInt64(uint64_t* ptr,
                                              size_t n,
                                              uint64_t offset,
                                              cudaStream_t stream);
// out[i] = in[i] + offset, in 64 bits
extern "C" curandStatus_t randutilWidenUInt32(
  const uint32_t* in, uint64_t* out, size_t n, uint64_t offset, cudaStream_t stream);

extern "C" curandStatus_t randutilScaleFloat(float* ptr,
                                             size_t n,
                                             float factor,
                                             cudaStream_t stream);
extern "C" curandStatus_t randutilScaleDouble(double* ptr,
                                              size_t n,
                                              double factor,
                                              cudaStream_t stream);
