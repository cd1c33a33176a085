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

#include "cusample/random/curand_kernels.h"
#include "cusample/random/curand_help.h"
#include "cusample/random/randutil/randutil.h"

namespace cusample {

size_t CURANDKernels::state_bytes(BitGeneratorType type)
{
  size_t bytes = 0;
  CHECK_CURAND(::randutilGetStateSize(get_curandRngType(type), &bytes));
  return bytes;
}

void CURANDKernels::init_states(
  BitGeneratorType type, void* state, uint64_t seed, uint32_t stream_count, cudaStream_t stream)
{
  CHECK_CURAND(::randutilInitStates(get_curandRngType(type), state, seed, stream_count, stream));
}

#pragma region integers

void CURANDKernels::raw_32(
  BitGeneratorType type, void* state, uint32_t* out, size_t n, cudaStream_t stream)
{
  CHECK_CURAND(::randutilGenerateRawUInt32(get_curandRngType(type), state, out, n, stream));
}

void CURANDKernels::interval_32(BitGeneratorType type,
                                void* state,
                                uint32_t* out,
                                size_t n,
                                cudaStream_t stream,
                                uint32_t max,
                                uint32_t mask)
{
  CHECK_CURAND(
    ::randutilGenerateInterval32(get_curandRngType(type), state, out, n, stream, max, mask));
}

void CURANDKernels::interval_64(BitGeneratorType type,
                                void* state,
                                uint64_t* out,
                                size_t n,
                                cudaStream_t stream,
                                uint64_t max,
                                uint64_t mask)
{
  CHECK_CURAND(
    ::randutilGenerateInterval64(get_curandRngType(type), state, out, n, stream, max, mask));
}

void CURANDKernels::shift_32(uint32_t* out, size_t n, uint32_t offset, cudaStream_t stream)
{
  CHECK_CURAND(::randutilShiftUInt32(out, n, offset, stream));
}

void CURANDKernels::shift_64(uint64_t* out, size_t n, uint64_t offset, cudaStream_t stream)
{
  CHECK_CURAND(::randutilShiftUInt64(out, n, offset, stream));
}

#pragma endregion

#pragma region floating point

void CURANDKernels::uniform_32(
  BitGeneratorType type, void* state, float* out, size_t n, cudaStream_t stream)
{
  CHECK_CURAND(::randutilGenerateUniformEx(get_curandRngType(type), state, out, n, stream));
}

void CURANDKernels::uniform_64(
  BitGeneratorType type, void* state, double* out, size_t n, cudaStream_t stream)
{
  CHECK_CURAND(::randutilGenerateUniformDoubleEx(get_curandRngType(type), state, out, n, stream));
}

void CURANDKernels::beta_32(BitGeneratorType type,
                            void* state,
                            float* out,
                            size_t n,
                            cudaStream_t stream,
                            float a,
                            float b)
{
  CHECK_CURAND(::randutilGenerateBetaEx(get_curandRngType(type), state, out, n, stream, a, b));
}

void CURANDKernels::beta_64(BitGeneratorType type,
                            void* state,
                            double* out,
                            size_t n,
                            cudaStream_t stream,
                            double a,
                            double b)
{
  CHECK_CURAND(
    ::randutilGenerateBetaDoubleEx(get_curandRngType(type), state, out, n, stream, a, b));
}

void CURANDKernels::standard_exponential_32(
  BitGeneratorType type, void* state, float* out, size_t n, cudaStream_t stream)
{
  CHECK_CURAND(
    ::randutilGenerateStandardExponentialEx(get_curandRngType(type), state, out, n, stream));
}

void CURANDKernels::standard_exponential_64(
  BitGeneratorType type, void* state, double* out, size_t n, cudaStream_t stream)
{
  CHECK_CURAND(::randutilGenerateStandardExponentialDoubleEx(
    get_curandRngType(type), state, out, n, stream));
}

void CURANDKernels::widen_32(
  const uint32_t* in, uint64_t* out, size_t n, uint64_t offset, cudaStream_t stream)
{
  CHECK_CURAND(::randutilWidenUInt32(in, out, n, offset, stream));
}

void CURANDKernels::scale_32(float* out, size_t n, float factor, cudaStream_t stream)
{
  CHECK_CURAND(::randutilScaleFloat(out, n, factor, stream));
}

void CURANDKernels::scale_64(double* out, size_t n, double factor, cudaStream_t stream)
{
  CHECK_CURAND(::randutilScaleDouble(out, n, factor, stream));
}

#pragma endregion

KernelLibrary& get_curand_kernels()
{
  static CURANDKernels kernels;
  return kernels;
}

}  // namespace cusample
