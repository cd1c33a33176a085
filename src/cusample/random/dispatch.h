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

#include <algorithm>
#include <cstddef>

#include "cusample/random/bitgenerator.h"
#include "cusample/random/curand_help.h"

namespace cusample {

// Number of launches for n elements over stream_count streams
inline size_t chunk_count(size_t n, uint32_t stream_count)
{
  if (stream_count == 0) return 1;
  return (n + stream_count - 1) / stream_count;
}

// Calls fn(offset, size) for the contiguous chunks tiling [0, n), in order.
// A stream count of 0 means unbounded: one call covering everything.
template <typename Fn>
void for_each_chunk(size_t n, uint32_t stream_count, Fn&& fn)
{
  if (stream_count == 0) {
    fn(size_t{0}, n);
    return;
  }
  for (size_t offset = 0; offset < n; offset += stream_count)
    fn(offset, std::min<size_t>(stream_count, n - offset));
}

// Runs kernel(type, state, out + offset, size, stream) over every chunk of out,
// holding the generator lock for the whole request. Distribution parameters
// travel inside the kernel callable. An exception from one chunk leaves the
// later chunks unissued.
template <typename T, typename Kernel>
void dispatch(BitGenerator& generator, Kernel&& kernel, T* out, size_t n)
{
  std::lock_guard<std::mutex> guard(generator.lock());

  void* state         = generator.state();
  cudaStream_t stream = generator.device().current_stream();
  const auto type     = generator.type();

  randutil_log().debug() << "dispatch " << bitgenerator_name(type) << " size " << n << " in "
                         << chunk_count(n, generator.stream_count()) << " chunk(s)";

  for_each_chunk(n, generator.stream_count(), [&](size_t offset, size_t size) {
    kernel(type, state, out + offset, size, stream);
  });
}

}  // namespace cusample
