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

#include <string>

#include "cusample/cusample.h"

namespace cusample {

// Match these to CuSampleBitGeneratorType in cusample_c.h
enum class BitGeneratorType : uint32_t {
  XORWOW        = CUSAMPLE_BITGENTYPE_XORWOW,
  MRG32K3A      = CUSAMPLE_BITGENTYPE_MRG32K3A,
  PHILOX4_32_10 = CUSAMPLE_BITGENTYPE_PHILOX4_32_10,
};

enum class ExponentialMethod : int32_t {
  INVERSION = CUSAMPLE_EXPONENTIAL_INVERSION,
  ZIGGURAT  = CUSAMPLE_EXPONENTIAL_ZIGGURAT,
};

static inline const char* bitgenerator_name(BitGeneratorType type)
{
  switch (type) {
    case BitGeneratorType::XORWOW: return "XORWOW";
    case BitGeneratorType::MRG32K3A: return "MRG32K3A";
    case BitGeneratorType::PHILOX4_32_10: return "PHILOX4_32_10";
    default: LEGATE_ABORT;
  }
  return "";
}

// Returns false for names that match no generator type
static inline bool parse_bitgenerator_name(const std::string& name, BitGeneratorType& type)
{
  if (name == "XORWOW")
    type = BitGeneratorType::XORWOW;
  else if (name == "MRG32K3A")
    type = BitGeneratorType::MRG32K3A;
  else if (name == "PHILOX4_32_10")
    type = BitGeneratorType::PHILOX4_32_10;
  else
    return false;
  return true;
}

}  // namespace cusample
