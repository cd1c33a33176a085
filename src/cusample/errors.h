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
#include <stdexcept>
#include <string>

namespace cusample {

class RandomError : public std::runtime_error {
 public:
  explicit RandomError(const std::string& message) : std::runtime_error(message) {}
};

// Generator state or an array used from a device other than the one it was allocated on
class CrossDeviceAccessError : public RandomError {
 public:
  CrossDeviceAccessError(int32_t owner, int32_t current)
    : RandomError("device memory was allocated on device " + std::to_string(owner) +
                  " but the current device is " + std::to_string(current)),
      owner_(owner),
      current_(current)
  {
  }

  int32_t owner() const { return owner_; }
  int32_t current() const { return current_; }

 private:
  int32_t owner_;
  int32_t current_;
};

class RangeOverflowError : public RandomError {
 public:
  explicit RangeOverflowError(const std::string& message) : RandomError(message) {}
};

class UnsupportedMethodError : public RandomError {
 public:
  explicit UnsupportedMethodError(const std::string& message) : RandomError(message) {}
};

class InvalidArgumentError : public RandomError {
 public:
  explicit InvalidArgumentError(const std::string& message) : RandomError(message) {}
};

// Failure reported by the kernel library; status is the library's error code
class KernelInvocationError : public RandomError {
 public:
  KernelInvocationError(const std::string& message, int status)
    : RandomError(message), status_(status)
  {
  }

  int status() const { return status_; }

 private:
  int status_;
};

// CUDA runtime failure outside of a kernel launch (allocation, copies, streams)
class DeviceRuntimeError : public RandomError {
 public:
  DeviceRuntimeError(const std::string& message, int error) : RandomError(message), error_(error)
  {
  }

  int error() const { return error_; }

 private:
  int error_;
};

}  // namespace cusample
