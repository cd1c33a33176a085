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

#ifndef __CUSAMPLE_C_H__
#define __CUSAMPLE_C_H__

#include <stdbool.h>
#include <stdint.h>

// Match these to BitGeneratorType in bitgenerator_util.h
enum CuSampleBitGeneratorType {
  CUSAMPLE_BITGENTYPE_XORWOW        = 1,
  CUSAMPLE_BITGENTYPE_MRG32K3A      = 2,
  CUSAMPLE_BITGENTYPE_PHILOX4_32_10 = 3,
};

enum CuSampleExponentialMethod {
  CUSAMPLE_EXPONENTIAL_INVERSION = 0,
  CUSAMPLE_EXPONENTIAL_ZIGGURAT  = 1,
};

#ifdef __cplusplus
extern "C" {
#endif

bool cusample_has_cuda_device(void);

#ifdef __cplusplus
}
#endif

#endif  // __CUSAMPLE_C_H__
