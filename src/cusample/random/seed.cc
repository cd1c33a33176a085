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

#include <array>
#include <random>

#include "cusample/random/seed.h"

namespace cusample {

Seed::Seed() : from_entropy_(true) {}

Seed::Seed(uint64_t value) : from_entropy_(false)
{
  // little-endian 32-bit words, without the high word when it is zero
  words_.push_back(static_cast<uint32_t>(value & 0xFFFFFFFFull));
  if ((value >> 32) != 0) words_.push_back(static_cast<uint32_t>(value >> 32));
}

Seed::Seed(std::vector<uint32_t> words) : from_entropy_(false), words_(std::move(words)) {}

uint64_t expand_seed(const Seed& seed)
{
  std::vector<uint32_t> words = seed.words();
  if (seed.from_entropy()) {
    std::random_device entropy;
    words.resize(4);
    for (auto& word : words) word = entropy();
  }

  std::seed_seq sequence(words.begin(), words.end());
  std::array<uint32_t, 2> state;
  sequence.generate(state.begin(), state.end());
  return (static_cast<uint64_t>(state[1]) << 32) | state[0];
}

}  // namespace cusample
