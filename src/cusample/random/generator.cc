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

#include <limits>
#include <sstream>

#include "cusample/errors.h"
#include "cusample/random/curand_help.h"
#include "cusample/random/dispatch.h"
#include "cusample/random/generator.h"

namespace cusample {

using namespace legate;

namespace {

uint32_t bit_length(uint64_t value)
{
  uint32_t length = 0;
  while (value != 0) {
    ++length;
    value >>= 1;
  }
  return length;
}

void check_floating_type(Type::Code dtype, const char* operation)
{
  if (dtype != Type::Code::FLOAT32 && dtype != Type::Code::FLOAT64) {
    std::stringstream ss;
    ss << operation << " requires a float32 or float64 dtype, got " << type_name(dtype);
    throw InvalidArgumentError(ss.str());
  }
}

}  // namespace

IntervalParams interval_params(wide_int_t low, wide_int_t high, bool endpoint)
{
  const wide_int_t diff = high - low - (endpoint ? 0 : 1);
  if (diff < 0) throw InvalidArgumentError("low >= high, the sampling range is empty");
  if (diff > static_cast<wide_int_t>(std::numeric_limits<uint64_t>::max()))
    throw RangeOverflowError("high - low must be within 64-bit unsigned range");

  IntervalParams params;
  params.diff = static_cast<uint64_t>(diff);

  const uint32_t length = bit_length(params.diff);
  params.mask  = length == 64 ? std::numeric_limits<uint64_t>::max() : (uint64_t{1} << length) - 1;
  params.width = params.diff <= std::numeric_limits<uint32_t>::max() ? 32 : 64;

  const wide_int_t last = low + diff;
  if (low >= 0) {
    if (last <= std::numeric_limits<uint32_t>::max())
      params.code = Type::Code::UINT32;
    else if (last <= static_cast<wide_int_t>(std::numeric_limits<uint64_t>::max()))
      params.code = Type::Code::UINT64;
    else
      throw RangeOverflowError("integers in [low, high] must fit in 64 bits");
  } else {
    if (low >= std::numeric_limits<int32_t>::min() && last <= std::numeric_limits<int32_t>::max())
      params.code = Type::Code::INT32;
    else if (low >= std::numeric_limits<int64_t>::min() &&
             last <= std::numeric_limits<int64_t>::max())
      params.code = Type::Code::INT64;
    else
      throw RangeOverflowError("integers in [low, high] must fit in 64 bits");
  }
  return params;
}

Generator::Generator(std::unique_ptr<BitGenerator> bit_generator)
  : bit_generator_(std::move(bit_generator))
{
  if (!bit_generator_) throw InvalidArgumentError("generator requires a bit generator");
}

Array Generator::allocate(Type::Code code, const Shape& shape)
{
  DeviceAffinityGuard::check(*bit_generator_);
  return Array(bit_generator_->device(), code, shape);
}

Array Generator::integers(
  wide_int_t low, wide_int_t high, const Shape& shape, Type::Code dtype, bool endpoint)
{
  const IntervalParams params = interval_params(low, high, endpoint);
  if (!is_integer_type(dtype)) {
    std::stringstream ss;
    ss << "integers requires an integer dtype, got " << type_name(dtype);
    throw InvalidArgumentError(ss.str());
  }

  KernelLibrary& kernels = bit_generator_->kernels();
  // low in two's complement; the additions below wrap into the signed result types
  const uint64_t offset  = static_cast<uint64_t>(low);
  const bool wide_result = type_size(params.code) == 8;

  if (params.width == 32) {
    Array samples   = allocate(wide_result ? Type::Code::UINT32 : params.code, shape);
    auto* offsets   = static_cast<uint32_t*>(samples.data());
    const auto max  = static_cast<uint32_t>(params.diff);
    const auto mask = static_cast<uint32_t>(params.mask);
    dispatch(
      *bit_generator_,
      [&](BitGeneratorType type, void* state, uint32_t* out, size_t n, cudaStream_t stream) {
        kernels.interval_32(type, state, out, n, stream, max, mask);
      },
      offsets,
      samples.size());
    if (samples.size() == 0) return wide_result ? allocate(params.code, shape) : samples;

    cudaStream_t stream = bit_generator_->device().current_stream();
    if (!wide_result) {
      if (static_cast<uint32_t>(offset) != 0)
        kernels.shift_32(offsets, samples.size(), static_cast<uint32_t>(offset), stream);
      return samples;
    }
    // samples is released on return; deallocation waits for the widen on the device
    Array result = allocate(params.code, shape);
    kernels.widen_32(
      offsets, static_cast<uint64_t*>(result.data()), result.size(), offset, stream);
    return result;
  }

  Array result = allocate(params.code, shape);
  auto* values = static_cast<uint64_t*>(result.data());
  dispatch(
    *bit_generator_,
    [&](BitGeneratorType type, void* state, uint64_t* out, size_t n, cudaStream_t stream) {
      kernels.interval_64(type, state, out, n, stream, params.diff, params.mask);
    },
    values,
    result.size());
  if (offset != 0 && result.size() > 0)
    kernels.shift_64(values, result.size(), offset, bit_generator_->device().current_stream());
  return result;
}

Array Generator::integers(wide_int_t high, const Shape& shape)
{
  return integers(0, high, shape);
}

Array Generator::random(const Shape& shape, Type::Code dtype)
{
  check_floating_type(dtype, "random");
  KernelLibrary& kernels = bit_generator_->kernels();
  Array result           = allocate(dtype, shape);
  if (dtype == Type::Code::FLOAT32)
    dispatch(
      *bit_generator_,
      [&](BitGeneratorType type, void* state, float* out, size_t n, cudaStream_t stream) {
        kernels.uniform_32(type, state, out, n, stream);
      },
      result.ptr<float>(),
      result.size());
  else
    dispatch(
      *bit_generator_,
      [&](BitGeneratorType type, void* state, double* out, size_t n, cudaStream_t stream) {
        kernels.uniform_64(type, state, out, n, stream);
      },
      result.ptr<double>(),
      result.size());
  return result;
}

Array Generator::beta(double a, double b, const Shape& shape, Type::Code dtype)
{
  check_floating_type(dtype, "beta");
  KernelLibrary& kernels = bit_generator_->kernels();
  Array result           = allocate(dtype, shape);
  if (dtype == Type::Code::FLOAT32) {
    const auto fa = static_cast<float>(a);
    const auto fb = static_cast<float>(b);
    dispatch(
      *bit_generator_,
      [&](BitGeneratorType type, void* state, float* out, size_t n, cudaStream_t stream) {
        kernels.beta_32(type, state, out, n, stream, fa, fb);
      },
      result.ptr<float>(),
      result.size());
  } else {
    dispatch(
      *bit_generator_,
      [&](BitGeneratorType type, void* state, double* out, size_t n, cudaStream_t stream) {
        kernels.beta_64(type, state, out, n, stream, a, b);
      },
      result.ptr<double>(),
      result.size());
  }
  return result;
}

Array Generator::standard_exponential(const Shape& shape,
                                      Type::Code dtype,
                                      ExponentialMethod method,
                                      std::optional<Array> out)
{
  if (method == ExponentialMethod::ZIGGURAT)
    throw UnsupportedMethodError("the ziggurat method is not supported for standard_exponential");
  check_floating_type(dtype, "standard_exponential");
  if (out.has_value() && (out->code() != dtype || out->shape() != shape)) {
    std::stringstream ss;
    ss << "destination holds " << out->size() << " " << type_name(out->code())
       << " elements, expected " << volume(shape) << " " << type_name(dtype);
    throw InvalidArgumentError(ss.str());
  }
  if (out.has_value()) {
    const int32_t current = bit_generator_->device().current_device();
    if (out->device_id() != current) throw CrossDeviceAccessError(out->device_id(), current);
  }

  KernelLibrary& kernels = bit_generator_->kernels();
  Array result           = allocate(dtype, shape);
  if (dtype == Type::Code::FLOAT32)
    dispatch(
      *bit_generator_,
      [&](BitGeneratorType type, void* state, float* chunk, size_t n, cudaStream_t stream) {
        kernels.standard_exponential_32(type, state, chunk, n, stream);
      },
      result.ptr<float>(),
      result.size());
  else
    dispatch(
      *bit_generator_,
      [&](BitGeneratorType type, void* state, double* chunk, size_t n, cudaStream_t stream) {
        kernels.standard_exponential_64(type, state, chunk, n, stream);
      },
      result.ptr<double>(),
      result.size());

  if (!out.has_value()) return result;
  out->copy_from(result);
  return *out;
}

Array Generator::exponential(double scale, const Shape& shape, Type::Code dtype)
{
  if (!(scale >= 0.0)) throw InvalidArgumentError("exponential requires a non-negative scale");
  Array result = standard_exponential(shape, dtype);
  if (scale == 1.0 || result.size() == 0) return result;

  KernelLibrary& kernels = bit_generator_->kernels();
  cudaStream_t stream    = bit_generator_->device().current_stream();
  if (dtype == Type::Code::FLOAT32)
    kernels.scale_32(result.ptr<float>(), result.size(), static_cast<float>(scale), stream);
  else
    kernels.scale_64(result.ptr<double>(), result.size(), scale, stream);
  return result;
}

Generator default_rng(const Seed& seed)
{
  return Generator(std::make_unique<BitGenerator>(default_generator_type(), seed));
}

}  // namespace cusample
