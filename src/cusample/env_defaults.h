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

// Fallbacks for the environment variables read in settings.cc

// number of independent generator streams (and state blocks) per BitGenerator
#define STREAM_COUNT_DEFAULT 102400

// generator used by default_rng when CUSAMPLE_DEFAULT_GENERATOR is unset
#define DEFAULT_GENERATOR_NAME "XORWOW"
