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

#include <gtest/gtest.h>

#include <memory>

#include "fake_backend.h"

#include "cusample/random/generator.h"

namespace cusample {

using legate::Type;
using test::FakeDevice;
using test::RecordingKernels;

TEST(IntervalParamsTest, ExclusiveRange)
{
  auto params = interval_params(0, 10, false);
  EXPECT_EQ(params.diff, 9u);
  EXPECT_EQ(params.mask, 15u);
  EXPECT_EQ(params.width, 32u);
}

TEST(IntervalParamsTest, InclusiveRange)
{
  auto params = interval_params(0, 10, true);
  EXPECT_EQ(params.diff, 10u);
  EXPECT_EQ(params.mask, 15u);
}

TEST(IntervalParamsTest, SingleValueRange)
{
  auto params = interval_params(5, 6, false);
  EXPECT_EQ(params.diff, 0u);
  EXPECT_EQ(params.mask, 0u);
}

TEST(IntervalParamsTest, PowerOfTwoBoundaries)
{
  EXPECT_EQ(interval_params(0, 16, false).mask, 15u);
  EXPECT_EQ(interval_params(0, 16, true).mask, 31u);
  EXPECT_EQ(interval_params(-8, 8, false).diff, 15u);
}

TEST(IntervalParamsTest, WidthSelection)
{
  const wide_int_t two = 2;
  EXPECT_EQ(interval_params(0, wide_int_t{1} << 31, false).width, 32u);
  EXPECT_EQ(interval_params(0, wide_int_t{1} << 32, false).width, 32u);
  EXPECT_EQ(interval_params(0, wide_int_t{1} << 32, true).width, 64u);
  EXPECT_EQ(interval_params(0, wide_int_t{1} << 40, false).width, 64u);

  auto full = interval_params(0, wide_int_t{1} << 64, false);
  EXPECT_EQ(full.width, 64u);
  EXPECT_EQ(full.diff, ~uint64_t{0});
  EXPECT_EQ(full.mask, ~uint64_t{0});

  EXPECT_THROW(interval_params(0, wide_int_t{1} << 64, true), RangeOverflowError);
  EXPECT_THROW(interval_params(0, two << 64, false), RangeOverflowError);
}

TEST(IntervalParamsTest, ResultTypeFollowsTheValueRange)
{
  const wide_int_t big = wide_int_t{1} << 40;
  EXPECT_EQ(interval_params(0, 10, false).code, Type::Code::UINT32);
  EXPECT_EQ(interval_params(0, wide_int_t{1} << 32, false).code, Type::Code::UINT32);
  EXPECT_EQ(interval_params(0, wide_int_t{1} << 32, true).code, Type::Code::UINT64);
  EXPECT_EQ(interval_params(big, big + 10, false).code, Type::Code::UINT64);
  EXPECT_EQ(interval_params(big, big + 10, false).width, 32u);
  EXPECT_EQ(interval_params(-5, 5, false).code, Type::Code::INT32);
  EXPECT_EQ(interval_params(-(wide_int_t{1} << 31), 0, false).code, Type::Code::INT32);
  EXPECT_EQ(interval_params(-(wide_int_t{1} << 31) - 1, 0, false).code, Type::Code::INT64);
  EXPECT_EQ(interval_params(-1, wide_int_t{1} << 31, false).code, Type::Code::INT32);
  EXPECT_EQ(interval_params(-1, wide_int_t{1} << 31, true).code, Type::Code::INT64);
}

TEST(IntervalParamsTest, ValuesBeyond64BitsAreRejected)
{
  const wide_int_t two64 = wide_int_t{1} << 64;
  EXPECT_THROW(interval_params(two64, two64 + 10, false), RangeOverflowError);
  EXPECT_THROW(interval_params(-1, wide_int_t{1} << 63, true), RangeOverflowError);
  EXPECT_THROW(interval_params(-(wide_int_t{1} << 63) - 1, 0, false), RangeOverflowError);
  EXPECT_NO_THROW(interval_params(-(wide_int_t{1} << 63), wide_int_t{1} << 63, false));
  EXPECT_NO_THROW(interval_params(two64 - 10, two64, false));
}

TEST(IntervalParamsTest, EmptyRangeIsRejected)
{
  EXPECT_THROW(interval_params(10, 10, false), InvalidArgumentError);
  EXPECT_THROW(interval_params(10, 5, true), InvalidArgumentError);
  EXPECT_NO_THROW(interval_params(10, 10, true));
}

class GeneratorTest : public ::testing::Test {
 protected:
  Generator make(uint32_t stream_count = 16, uint64_t seed = 99)
  {
    return Generator(std::make_unique<BitGenerator>(
      device, kernels, BitGeneratorType::XORWOW, Seed(seed), stream_count));
  }

  FakeDevice device;
  RecordingKernels kernels;
};

TEST_F(GeneratorTest, NarrowRangeUses32BitKernel)
{
  auto generator = make();
  kernels.clear();
  Array result = generator.integers(0, wide_int_t{1} << 31, {5});

  EXPECT_EQ(result.code(), Type::Code::UINT32);
  EXPECT_EQ(result.shape(), Shape({5}));
  auto launches = kernels.launches_of("interval_32");
  ASSERT_EQ(launches.size(), 1u);
  EXPECT_EQ(launches[0].max, 0x7FFFFFFFu);
  EXPECT_EQ(launches[0].mask, 0x7FFFFFFFu);
  EXPECT_TRUE(kernels.launches_of("interval_64").empty());
  EXPECT_TRUE(kernels.launches_of("shift_32").empty());
}

TEST_F(GeneratorTest, WideRangeUses64BitKernel)
{
  auto generator = make();
  kernels.clear();
  Array result = generator.integers(0, wide_int_t{1} << 40, {5});

  EXPECT_EQ(result.code(), Type::Code::UINT64);
  auto launches = kernels.launches_of("interval_64");
  ASSERT_EQ(launches.size(), 1u);
  EXPECT_EQ(launches[0].max, (uint64_t{1} << 40) - 1);
  EXPECT_EQ(launches[0].mask, (uint64_t{1} << 40) - 1);
  EXPECT_TRUE(kernels.launches_of("interval_32").empty());
  for (auto value : result.read<uint64_t>()) EXPECT_LT(value, uint64_t{1} << 40);
}

TEST_F(GeneratorTest, OverflowingRangeAllocatesNothing)
{
  auto generator = make();
  kernels.clear();
  const size_t allocations = device.allocations();

  EXPECT_THROW(generator.integers(0, wide_int_t{1} << 65, {5}), RangeOverflowError);
  EXPECT_EQ(device.allocations(), allocations);
  EXPECT_TRUE(kernels.launches().empty());
}

TEST_F(GeneratorTest, IntegersStayInRange)
{
  auto generator = make(16);
  Array result   = generator.integers(0, 10, {1000});
  for (auto value : result.read<uint32_t>()) EXPECT_LT(value, 10u);
}

TEST_F(GeneratorTest, IntegersIncludeEndpoint)
{
  auto generator = make(64);
  Array result   = generator.integers(3, 4, {200}, Type::Code::INT64, true);
  bool seen_low = false, seen_high = false;
  for (auto value : result.read<uint32_t>()) {
    ASSERT_TRUE(value == 3 || value == 4) << value;
    seen_low  = seen_low || value == 3;
    seen_high = seen_high || value == 4;
  }
  EXPECT_TRUE(seen_low);
  EXPECT_TRUE(seen_high);
}

TEST_F(GeneratorTest, NegativeLowGivesSignedValues)
{
  auto generator = make();
  kernels.clear();
  Array result = generator.integers(-5, 5, {500});

  EXPECT_EQ(result.code(), Type::Code::INT32);
  EXPECT_EQ(kernels.launches_of("interval_32").size(), 32u);
  ASSERT_EQ(kernels.launches_of("shift_32").size(), 1u);
  bool seen_negative = false;
  for (auto value : result.read<int32_t>()) {
    EXPECT_GE(value, -5);
    EXPECT_LT(value, 5);
    seen_negative = seen_negative || value < 0;
  }
  EXPECT_TRUE(seen_negative);
}

TEST_F(GeneratorTest, LargeLowKeepsItsHighBits)
{
  auto generator       = make();
  const wide_int_t low = wide_int_t{1} << 40;
  kernels.clear();
  Array result = generator.integers(low, low + 10, {64});

  EXPECT_EQ(result.code(), Type::Code::UINT64);
  // the range still fits the 32-bit kernel; offsets are widened before adding low
  EXPECT_EQ(kernels.launches_of("interval_32").size(), 4u);
  EXPECT_TRUE(kernels.launches_of("interval_64").empty());
  auto widen = kernels.launches_of("widen_32");
  ASSERT_EQ(widen.size(), 1u);
  EXPECT_EQ(widen[0].max, uint64_t{1} << 40);
  EXPECT_EQ(widen[0].n, 64u);
  for (auto value : result.read<uint64_t>()) {
    EXPECT_GE(value, uint64_t{1} << 40);
    EXPECT_LT(value, (uint64_t{1} << 40) + 10);
  }
}

TEST_F(GeneratorTest, FarNegativeLowGivesInt64Values)
{
  auto generator       = make();
  const wide_int_t low = -(wide_int_t{1} << 40);
  Array narrow         = generator.integers(low, low + 3, {50});
  EXPECT_EQ(narrow.code(), Type::Code::INT64);
  for (auto value : narrow.read<int64_t>()) {
    EXPECT_GE(value, -(int64_t{1} << 40));
    EXPECT_LT(value, -(int64_t{1} << 40) + 3);
  }

  kernels.clear();
  Array wide = generator.integers(low, wide_int_t{1} << 40, {50});
  EXPECT_EQ(wide.code(), Type::Code::INT64);
  EXPECT_EQ(kernels.launches_of("interval_64").size(), 4u);
  for (auto value : wide.read<int64_t>()) {
    EXPECT_GE(value, -(int64_t{1} << 40));
    EXPECT_LT(value, int64_t{1} << 40);
  }
}

TEST_F(GeneratorTest, HighOnlyOverloadStartsAtZero)
{
  auto generator = make();
  kernels.clear();
  Array result = generator.integers(6, {50});
  EXPECT_EQ(kernels.launches_of("interval_32")[0].max, 5u);
  for (auto value : result.read<uint32_t>()) EXPECT_LT(value, 6u);
}

TEST_F(GeneratorTest, IntegersRequireIntegerDtype)
{
  auto generator = make();
  EXPECT_THROW(generator.integers(0, 10, {5}, Type::Code::FLOAT64), InvalidArgumentError);
  EXPECT_NO_THROW(generator.integers(0, 10, {5}, Type::Code::INT8));
}

TEST_F(GeneratorTest, IntegersAreChunkedByStreamCount)
{
  auto generator = make(16);
  kernels.clear();
  generator.integers(0, 100, {40});
  auto launches = kernels.launches_of("interval_32");
  ASSERT_EQ(launches.size(), 3u);
  EXPECT_EQ(launches[0].n, 16u);
  EXPECT_EQ(launches[1].n, 16u);
  EXPECT_EQ(launches[2].n, 8u);
}

TEST_F(GeneratorTest, SameSeedSameIntegers)
{
  auto first  = make(16, 5);
  auto second = make(16, 5);
  EXPECT_EQ(first.integers(0, 1000, {100}).read<uint32_t>(),
            second.integers(0, 1000, {100}).read<uint32_t>());
}

TEST_F(GeneratorTest, BetaPassesShapeParametersToEveryChunk)
{
  auto generator = make(16);
  kernels.clear();
  Array result = generator.beta(2.0, 5.0, {4, 10});

  EXPECT_EQ(result.code(), Type::Code::FLOAT64);
  EXPECT_EQ(result.size(), 40u);
  auto launches = kernels.launches_of("beta_64");
  ASSERT_EQ(launches.size(), 3u);
  for (auto& launch : launches) {
    EXPECT_DOUBLE_EQ(launch.a, 2.0);
    EXPECT_DOUBLE_EQ(launch.b, 5.0);
  }
}

TEST_F(GeneratorTest, BetaSinglePrecision)
{
  auto generator = make();
  kernels.clear();
  Array result = generator.beta(0.5, 0.5, {8}, Type::Code::FLOAT32);
  EXPECT_EQ(result.code(), Type::Code::FLOAT32);
  ASSERT_EQ(kernels.launches_of("beta_32").size(), 1u);
  EXPECT_FLOAT_EQ(static_cast<float>(kernels.launches_of("beta_32")[0].a), 0.5f);
}

TEST_F(GeneratorTest, FloatingSamplersRejectIntegerDtype)
{
  auto generator = make();
  EXPECT_THROW(generator.beta(1.0, 1.0, {4}, Type::Code::INT32), InvalidArgumentError);
  EXPECT_THROW(generator.random({4}, Type::Code::UINT64), InvalidArgumentError);
  EXPECT_THROW(generator.standard_exponential({4}, Type::Code::INT64), InvalidArgumentError);
}

TEST_F(GeneratorTest, ZigguratIsUnsupported)
{
  auto generator = make();
  kernels.clear();
  const size_t allocations = device.allocations();

  EXPECT_THROW(generator.standard_exponential(
                 {100}, Type::Code::FLOAT64, ExponentialMethod::ZIGGURAT),
               UnsupportedMethodError);
  EXPECT_EQ(device.allocations(), allocations);
  EXPECT_TRUE(kernels.launches().empty());
}

TEST_F(GeneratorTest, StandardExponentialIsNonNegative)
{
  auto generator = make();
  Array result   = generator.standard_exponential({100});
  EXPECT_EQ(result.code(), Type::Code::FLOAT64);
  for (auto value : result.read<double>()) EXPECT_GE(value, 0.0);
}

TEST_F(GeneratorTest, DestinationIsFilledAndReturned)
{
  auto generator = make(16, 21);
  auto reference = make(16, 21);
  Array destination(device, Type::Code::FLOAT64, {50});

  Array result = generator.standard_exponential(
    {50}, Type::Code::FLOAT64, ExponentialMethod::INVERSION, destination);

  EXPECT_TRUE(result.same_buffer(destination));
  EXPECT_EQ(result.data(), destination.data());
  EXPECT_EQ(destination.read<double>(), reference.standard_exponential({50}).read<double>());
}

TEST_F(GeneratorTest, MismatchedDestinationIsRejected)
{
  auto generator = make();
  Array wrong_type(device, Type::Code::FLOAT32, {50});
  Array wrong_shape(device, Type::Code::FLOAT64, {5, 10});

  EXPECT_THROW(generator.standard_exponential(
                 {50}, Type::Code::FLOAT64, ExponentialMethod::INVERSION, wrong_type),
               InvalidArgumentError);
  EXPECT_THROW(generator.standard_exponential(
                 {50}, Type::Code::FLOAT64, ExponentialMethod::INVERSION, wrong_shape),
               InvalidArgumentError);
}

TEST_F(GeneratorTest, DestinationOnOtherDeviceIsRejected)
{
  auto generator = make();
  device.set_device(1);
  Array elsewhere(device, Type::Code::FLOAT64, {50});
  device.set_device(0);
  kernels.clear();
  const size_t allocations = device.allocations();

  EXPECT_THROW(generator.standard_exponential(
                 {50}, Type::Code::FLOAT64, ExponentialMethod::INVERSION, elsewhere),
               CrossDeviceAccessError);
  EXPECT_EQ(device.allocations(), allocations);
  EXPECT_TRUE(kernels.launches().empty());
}

TEST_F(GeneratorTest, RandomIsInUnitInterval)
{
  auto generator = make();
  for (auto value : generator.random({200}).read<double>()) {
    EXPECT_GE(value, 0.0);
    EXPECT_LT(value, 1.0);
  }
  for (auto value : generator.random({200}, Type::Code::FLOAT32).read<float>()) {
    EXPECT_GE(value, 0.0f);
    EXPECT_LE(value, 1.0f);
  }
}

TEST_F(GeneratorTest, ExponentialScalesTheStandardSample)
{
  auto generator = make(16, 8);
  auto reference = make(16, 8);
  kernels.clear();

  auto scaled   = generator.exponential(3.0, {20}).read<double>();
  auto standard = reference.standard_exponential({20}).read<double>();
  ASSERT_EQ(kernels.launches_of("scale_64").size(), 1u);
  for (size_t idx = 0; idx < scaled.size(); ++idx)
    EXPECT_DOUBLE_EQ(scaled[idx], 3.0 * standard[idx]);

  EXPECT_THROW(generator.exponential(-1.0, {4}), InvalidArgumentError);
}

TEST_F(GeneratorTest, OtherDeviceAllocatesNothing)
{
  auto generator = make();
  kernels.clear();
  const size_t allocations = device.allocations();
  device.set_device(1);

  EXPECT_THROW(generator.integers(0, 10, {5}), CrossDeviceAccessError);
  EXPECT_THROW(generator.beta(1.0, 2.0, {5}), CrossDeviceAccessError);
  EXPECT_THROW(generator.standard_exponential({5}), CrossDeviceAccessError);
  EXPECT_THROW(generator.random({5}), CrossDeviceAccessError);
  EXPECT_EQ(device.allocations(), allocations);
  EXPECT_TRUE(kernels.launches().empty());
}

TEST_F(GeneratorTest, EmptyShapeProducesEmptyArray)
{
  auto generator = make();
  kernels.clear();
  Array result = generator.beta(1.0, 1.0, {0});
  EXPECT_EQ(result.size(), 0u);
  EXPECT_TRUE(kernels.launches().empty());
}

}  // namespace cusample
