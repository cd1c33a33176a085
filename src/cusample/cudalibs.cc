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

#include <stdio.h>

#include <map>
#include <memory>
#include <mutex>
#include <sstream>

#include "cusample/cusample.h"
#include "cusample/cudalibs.h"
#include "cusample/errors.h"

namespace cusample {

using namespace legate;

static Logger log_cuda("cusample.cuda");

void check_cudart(cudaError_t error, const char* file, int line)
{
  if (error != cudaSuccess) {
    std::stringstream ss;
    ss << "Internal CUDA failure with error " << cudaGetErrorString(error) << " ("
       << static_cast<int>(error) << ") in file " << file << " at line " << line;
    log_cuda.error() << ss.str();
    throw DeviceRuntimeError(ss.str(), static_cast<int>(error));
  }
}

CUDALibraries::CUDALibraries(int32_t device)
  : device_(device), finalized_(false), stream_(nullptr)
{
}

CUDALibraries::~CUDALibraries() { finalize(); }

void CUDALibraries::finalize()
{
  if (finalized_) return;
  if (stream_ != nullptr) finalize_stream();
  finalized_ = true;
}

void CUDALibraries::finalize_stream()
{
  cudaError_t status = cudaStreamDestroy(stream_);
  // the runtime may already be gone when this runs from a static destructor
  if (status != cudaSuccess && status != cudaErrorCudartUnloading) {
    fprintf(stderr,
            "Internal CUDA stream destruction failure "
            "with error code %d on device %d in cuSample\n",
            status,
            device_);
  }
  stream_ = nullptr;
}

cudaStream_t CUDALibraries::get_cached_stream()
{
  if (nullptr == stream_) {
    CHECK_CUDART(cudaStreamCreateWithFlags(&stream_, cudaStreamNonBlocking));
    log_cuda.debug() << "created cached stream for device " << device_;
  }
  return stream_;
}

static std::mutex lock_libraries;
static std::map<int32_t, std::unique_ptr<CUDALibraries>> libraries;

CUDALibraries& get_cuda_libraries(int32_t device)
{
  std::lock_guard<std::mutex> guard(lock_libraries);
  auto finder = libraries.find(device);
  if (finder == libraries.end()) {
    auto result = libraries.emplace(device, std::make_unique<CUDALibraries>(device));
    return *result.first->second;
  }
  return *finder->second;
}

cudaStream_t get_cached_stream()
{
  int32_t device = 0;
  CHECK_CUDART(cudaGetDevice(&device));
  return get_cuda_libraries(device).get_cached_stream();
}

int32_t CUDADevice::current_device() const
{
  int32_t device = 0;
  CHECK_CUDART(cudaGetDevice(&device));
  return device;
}

cudaStream_t CUDADevice::current_stream() { return get_cached_stream(); }

void* CUDADevice::allocate(size_t bytes)
{
  if (bytes == 0) return nullptr;
  void* ptr = nullptr;
  CHECK_CUDART(cudaMalloc(&ptr, bytes));
  return ptr;
}

void CUDADevice::deallocate(void* ptr)
{
  if (nullptr == ptr) return;
  cudaError_t status = cudaFree(ptr);
  if (status != cudaSuccess && status != cudaErrorCudartUnloading)
    log_cuda.error() << "cudaFree failed with error " << cudaGetErrorString(status);
}

void CUDADevice::fill_zero(void* ptr, size_t bytes, cudaStream_t stream)
{
  if (bytes == 0) return;
  CHECK_CUDART(cudaMemsetAsync(ptr, 0, bytes, stream));
}

void CUDADevice::copy(void* dst, const void* src, size_t bytes, cudaStream_t stream)
{
  if (bytes == 0) return;
  CHECK_CUDART(cudaMemcpyAsync(dst, src, bytes, cudaMemcpyDeviceToDevice, stream));
}

void CUDADevice::copy_to_host(void* dst, const void* src, size_t bytes, cudaStream_t stream)
{
  if (bytes == 0) return;
  CHECK_CUDART(cudaMemcpyAsync(dst, src, bytes, cudaMemcpyDeviceToHost, stream));
  CHECK_CUDART(cudaStreamSynchronize(stream));
}

Device& get_cuda_device()
{
  static CUDADevice device;
  return device;
}

}  // namespace cusample

extern "C" {

bool cusample_has_cuda_device()
{
  int count          = 0;
  cudaError_t status = cudaGetDeviceCount(&count);
  if (status != cudaSuccess) {
    // clear the error so later runtime calls do not report it
    cudaGetLastError();
    return false;
  }
  return count > 0;
}
}
