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

#include <mutex>

#include "cusample/array.h"
#include "cusample/device.h"
#include "cusample/settings.h"
#include "cusample/random/bitgenerator_util.h"
#include "cusample/random/kernels.h"
#include "cusample/random/seed.h"

namespace cusample {

// Device-resident state for stream_count independent streams of one algorithm.
// The state is allocated, zero-filled and seeded once at construction, on the
// device current at that time, and is only usable while that device is current.
class BitGenerator {
 public:
  BitGenerator(BitGeneratorType type,
               const Seed& seed      = Seed(),
               uint32_t stream_count = default_stream_count());
  BitGenerator(Device& device,
               KernelLibrary& kernels,
               BitGeneratorType type,
               const Seed& seed,
               uint32_t stream_count);
  ~BitGenerator();

 private:
  // Prevent copying and overwriting
  BitGenerator(const BitGenerator& rhs)            = delete;
  BitGenerator& operator=(const BitGenerator& rhs) = delete;

 public:
  // Throws CrossDeviceAccessError unless the owning device is current
  void* state() const;

  uint32_t stream_count() const { return stream_count_; }
  BitGeneratorType type() const { return type_; }
  size_t state_bytes() const { return state_bytes_; }
  size_t state_size() const { return state_bytes_ * stream_count_; }
  int32_t device_id() const { return device_id_; }
  uint64_t seed() const { return seed_; }

  Device& device() const { return *device_; }
  KernelLibrary& kernels() const { return *kernels_; }
  std::mutex& lock() const { return lock_; }

 public:
  // One raw 32-bit word per element
  Array random_raw(const Shape& shape);

 private:
  void initialize();

 private:
  Device* device_;
  KernelLibrary* kernels_;
  BitGeneratorType type_;
  uint32_t stream_count_;
  uint64_t seed_;
  int32_t device_id_;
  size_t state_bytes_;
  void* state_;
  mutable std::mutex lock_;
};

class DeviceAffinityGuard {
 public:
  static void check(const BitGenerator& generator);
};

}  // namespace cusample
