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

#include <sstream>

#include "cusample/errors.h"
#include "cusample/random/bitgenerator.h"
#include "cusample/random/curand_help.h"
#include "cusample/random/dispatch.h"

namespace cusample {

using namespace legate;

static Logger log_curand("cusample.random");

Logger& randutil_log() { return log_curand; }

void randutil_check_curand(curandStatus_t error, const char* file, int line)
{
  if (error != CURAND_STATUS_SUCCESS) {
    std::stringstream ss;
    ss << "Internal CURAND failure with error " << (int)error << " in file " << file
       << " at line " << line;
    randutil_log().error() << ss.str();
    throw KernelInvocationError(ss.str(), static_cast<int>(error));
  }
}

void DeviceAffinityGuard::check(const BitGenerator& generator)
{
  const int32_t current = generator.device().current_device();
  if (current != generator.device_id()) {
    randutil_log().error() << "generator state of device " << generator.device_id()
                           << " used from device " << current;
    throw CrossDeviceAccessError(generator.device_id(), current);
  }
}

BitGenerator::BitGenerator(BitGeneratorType type, const Seed& seed, uint32_t stream_count)
  : BitGenerator(get_cuda_device(), get_curand_kernels(), type, seed, stream_count)
{
}

BitGenerator::BitGenerator(Device& device,
                           KernelLibrary& kernels,
                           BitGeneratorType type,
                           const Seed& seed,
                           uint32_t stream_count)
  : device_(&device),
    kernels_(&kernels),
    type_(type),
    stream_count_(stream_count),
    seed_(0),
    device_id_(-1),
    state_bytes_(0),
    state_(nullptr)
{
  if (stream_count == 0) throw InvalidArgumentError("stream count must be positive");
  seed_ = expand_seed(seed);
  initialize();
}

void BitGenerator::initialize()
{
  std::lock_guard<std::mutex> guard(lock_);

  device_id_   = device_->current_device();
  state_bytes_ = kernels_->state_bytes(type_);
  state_       = device_->allocate(state_size());
  try {
    cudaStream_t stream = device_->current_stream();
    device_->fill_zero(state_, state_size(), stream);
    kernels_->init_states(type_, state_, seed_, stream_count_, stream);
  } catch (...) {
    device_->deallocate(state_);
    state_ = nullptr;
    throw;
  }

  randutil_log().debug() << "BitGenerator::create " << bitgenerator_name(type_) << " on device "
                         << device_id_ << " with " << stream_count_ << " streams of "
                         << state_bytes_ << " bytes";
}

BitGenerator::~BitGenerator()
{
  randutil_log().debug() << "BitGenerator::destroy " << bitgenerator_name(type_) << " on device "
                         << device_id_;
  device_->deallocate(state_);
}

void* BitGenerator::state() const
{
  DeviceAffinityGuard::check(*this);
  return state_;
}

Array BitGenerator::random_raw(const Shape& shape)
{
  DeviceAffinityGuard::check(*this);
  Array result(*device_, Type::Code::UINT32, shape);
  KernelLibrary* kernels = kernels_;
  dispatch(
    *this,
    [kernels](BitGeneratorType type, void* state, uint32_t* out, size_t n, cudaStream_t stream) {
      kernels->raw_32(type, state, out, n, stream);
    },
    result.ptr<uint32_t>(),
    result.size());
  return result;
}

}  // namespace cusample
