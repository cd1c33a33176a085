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

#include <memory>
#include <vector>

#include "cusample/cusample.h"
#include "cusample/device.h"

namespace cusample {

template <typename T>
struct type_code_of;

template <>
struct type_code_of<int32_t> {
  static constexpr legate::Type::Code value = legate::Type::Code::INT32;
};
template <>
struct type_code_of<int64_t> {
  static constexpr legate::Type::Code value = legate::Type::Code::INT64;
};
template <>
struct type_code_of<uint32_t> {
  static constexpr legate::Type::Code value = legate::Type::Code::UINT32;
};
template <>
struct type_code_of<uint64_t> {
  static constexpr legate::Type::Code value = legate::Type::Code::UINT64;
};
template <>
struct type_code_of<float> {
  static constexpr legate::Type::Code value = legate::Type::Code::FLOAT32;
};
template <>
struct type_code_of<double> {
  static constexpr legate::Type::Code value = legate::Type::Code::FLOAT64;
};

// Element size of the codes an Array can hold; throws InvalidArgumentError otherwise
size_t type_size(legate::Type::Code code);
const char* type_name(legate::Type::Code code);

bool is_integer_type(legate::Type::Code code);

// A typed, shaped buffer on one device. Copies are handles to the same buffer.
class Array {
 public:
  Array(Device& device, legate::Type::Code code, const Shape& shape);

 public:
  legate::Type::Code code() const { return code_; }
  const Shape& shape() const { return shape_; }
  size_t size() const { return size_; }
  size_t bytes() const { return size_ * type_size(code_); }
  int32_t device_id() const { return device_id_; }
  void* data() const { return buffer_.get(); }

  bool same_buffer(const Array& other) const;

  template <typename T>
  T* ptr() const
  {
    check_type(type_code_of<T>::value);
    return static_cast<T*>(data());
  }

  // Enqueues a device copy of source (same type and shape) into this array.
  // Both arrays must live on the current device.
  void copy_from(const Array& source);

  // Copies the contents back to the host; waits for pending work on the stream.
  // Throws CrossDeviceAccessError unless the array's device is current.
  template <typename T>
  std::vector<T> read() const
  {
    check_device();
    std::vector<T> result(size_);
    device_->copy_to_host(result.data(), ptr<T>(), bytes(), device_->current_stream());
    return result;
  }

 private:
  void check_type(legate::Type::Code code) const;
  void check_device() const;

 private:
  Device* device_;
  legate::Type::Code code_;
  Shape shape_;
  size_t size_;
  int32_t device_id_;
  std::shared_ptr<void> buffer_;
};

}  // namespace cusample
