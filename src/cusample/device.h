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

namespace cusample {

// Runtime seam between the generator core and the device it runs on.
// Allocations are raw byte buffers; work is enqueued on current_stream()
// and only copy_to_host() waits for it.
class Device {
 public:
  virtual ~Device() {}

  virtual int32_t current_device() const = 0;
  virtual cudaStream_t current_stream() = 0;

  // allocate(0) returns nullptr
  virtual void* allocate(size_t bytes)  = 0;
  virtual void deallocate(void* ptr)    = 0;

  virtual void fill_zero(void* ptr, size_t bytes, cudaStream_t stream)                   = 0;
  virtual void copy(void* dst, const void* src, size_t bytes, cudaStream_t stream)       = 0;
  virtual void copy_to_host(void* dst, const void* src, size_t bytes, cudaStream_t stream) = 0;
};

// CUDA runtime backed device, shared by the whole process
Device& get_cuda_device();

}  // namespace cusample
