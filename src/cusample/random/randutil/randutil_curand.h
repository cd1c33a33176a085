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

// Device-side part of curand, only compiled by nvcc

#define RANDUTIL_QUALIFIERS __forceinline__ __device__
#include <curand_kernel.h>

using gen_XORWOW_t        = curandStateXORWOW_t;
using gen_Philox4_32_10_t = curandStatePhilox4_32_10_t;
using gen_MRG32k3a_t      = curandStateMRG32k3a_t;
