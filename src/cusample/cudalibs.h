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

#include "cusample/cuda_help.h"
#include "cusample/device.h"

namespace cusample {

// Per-device CUDA resources, created lazily the first time a device asks for them
struct CUDALibraries {
 public:
  CUDALibraries(int32_t device);
  ~CUDALibraries();

 private:
  // Prevent copying and overwriting
  CUDALibraries(const CUDALibraries& rhs)            = delete;
  CUDALibraries& operator=(const CUDALibraries& rhs) = delete;

 public:
  void finalize();
  cudaStream_t get_cached_stream();

 private:
  void finalize_stream();

 private:
  int32_t device_;
  bool finalized_;
  cudaStream_t stream_;
};

CUDALibraries& get_cuda_libraries(int32_t device);

// Return a cached stream for the current GPU
cudaStream_t get_cached_stream();

class CUDADevice : public Device {
 public:
  int32_t current_device() const override;
  cudaStream_t current_stream() override;

  void* allocate(size_t bytes) override;
  void deallocate(void* ptr) override;

  void fill_zero(void* ptr, size_t bytes, cudaStream_t stream) override;
  void copy(void* dst, const void* src, size_t bytes, cudaStream_t stream) override;
  void copy_to_host(void* dst, const void* src, size_t bytes, cudaStream_t stream) override;
};

}  // namespace cusample
