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

#include <cstdint>
#include <vector>

namespace cusample {

// User-facing seed: an integer, a sequence of 32-bit words, or nothing at all,
// in which case the working seed comes from OS entropy.
class Seed {
 public:
  Seed();
  Seed(uint64_t value);
  explicit Seed(std::vector<uint32_t> words);

 public:
  bool from_entropy() const { return from_entropy_; }
  const std::vector<uint32_t>& words() const { return words_; }

 private:
  bool from_entropy_;
  std::vector<uint32_t> words_;
};

// Deterministic for explicit seeds: equal seeds give equal working seeds on any device
uint64_t expand_seed(const Seed& seed);

}  // namespace cusample
