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

#include "cusample/random/bitgenerator_util.h"

namespace cusample {

// Values of CUSAMPLE_STREAM_COUNT and CUSAMPLE_DEFAULT_GENERATOR, read once
uint32_t default_stream_count();
BitGeneratorType default_generator_type();

// Fall back to the defaults in env_defaults.h when value is null or malformed
uint32_t parse_stream_count(const char* value);
BitGeneratorType parse_generator_type(const char* value);

}  // namespace cusample
