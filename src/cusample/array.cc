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

#include "cusample/array.h"
#include "cusample/errors.h"

namespace cusample {

using namespace legate;

size_t type_size(Type::Code code)
{
  switch (code) {
    case Type::Code::INT32:
    case Type::Code::UINT32:
    case Type::Code::FLOAT32: return 4;
    case Type::Code::INT64:
    case Type::Code::UINT64:
    case Type::Code::FLOAT64: return 8;
    default: break;
  }
  throw InvalidArgumentError("unsupported array type code " +
                             std::to_string(static_cast<int>(code)));
}

const char* type_name(Type::Code code)
{
  switch (code) {
    case Type::Code::INT32: return "int32";
    case Type::Code::INT64: return "int64";
    case Type::Code::UINT32: return "uint32";
    case Type::Code::UINT64: return "uint64";
    case Type::Code::FLOAT32: return "float32";
    case Type::Code::FLOAT64: return "float64";
    default: break;
  }
  return "unsupported";
}

bool is_integer_type(Type::Code code)
{
  switch (code) {
    case Type::Code::INT8:
    case Type::Code::INT16:
    case Type::Code::INT32:
    case Type::Code::INT64:
    case Type::Code::UINT8:
    case Type::Code::UINT16:
    case Type::Code::UINT32:
    case Type::Code::UINT64: return true;
    default: break;
  }
  return false;
}

Array::Array(Device& device, Type::Code code, const Shape& shape)
  : device_(&device),
    code_(code),
    shape_(shape),
    size_(volume(shape)),
    device_id_(device.current_device())
{
  Device* owner = device_;
  void* ptr     = device.allocate(size_ * type_size(code));
  buffer_       = std::shared_ptr<void>(ptr, [owner](void* p) { owner->deallocate(p); });
}

bool Array::same_buffer(const Array& other) const
{
  return !buffer_.owner_before(other.buffer_) && !other.buffer_.owner_before(buffer_);
}

void Array::copy_from(const Array& source)
{
  if (source.code_ != code_ || source.shape_ != shape_) {
    std::stringstream ss;
    ss << "cannot copy a " << type_name(source.code_) << " array of " << source.size_
       << " elements into a " << type_name(code_) << " array of " << size_ << " elements";
    throw InvalidArgumentError(ss.str());
  }
  check_device();
  source.check_device();
  if (same_buffer(source)) return;
  device_->copy(data(), source.data(), bytes(), device_->current_stream());
}

void Array::check_device() const
{
  const int32_t current = device_->current_device();
  if (current != device_id_) throw CrossDeviceAccessError(device_id_, current);
}

void Array::check_type(Type::Code code) const
{
  if (code != code_) {
    std::stringstream ss;
    ss << "array holds " << type_name(code_) << " elements, accessed as " << type_name(code);
    throw InvalidArgumentError(ss.str());
  }
}

}  // namespace cusample
