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

#include "fake_backend.h"

#include "cusample/random/bitgenerator.h"

namespace cusample {

using test::FakeDevice;
using test::RecordingKernels;

class BitGeneratorTest : public ::testing::TestWithParam<BitGeneratorType> {
 protected:
  FakeDevice device;
  RecordingKernels kernels;
};

TEST_P(BitGeneratorTest, StateIsSizedByStreamCount)
{
  BitGenerator generator(device, kernels, GetParam(), Seed(7), 1000);

  EXPECT_GT(generator.state_bytes(), 0u);
  EXPECT_EQ(generator.state_bytes(), kernels.state_bytes(GetParam()));
  EXPECT_EQ(generator.state_size(), 1000 * generator.state_bytes());
  EXPECT_EQ(device.allocated_bytes(generator.state()), generator.state_size());
  EXPECT_EQ(generator.stream_count(), 1000u);
  EXPECT_EQ(generator.type(), GetParam());
}

TEST_P(BitGeneratorTest, StateIsZeroedThenInitializedOnce)
{
  BitGenerator generator(device, kernels, GetParam(), Seed(7), 256);

  EXPECT_EQ(device.zero_fills(), 1u);
  EXPECT_FALSE(kernels.state_was_dirty());
  ASSERT_EQ(kernels.launches().size(), 1u);
  const auto& launch = kernels.launches().front();
  EXPECT_EQ(launch.kernel, "init_states");
  EXPECT_EQ(launch.type, GetParam());
  EXPECT_EQ(launch.state, generator.state());
  EXPECT_EQ(launch.stream, FakeDevice::stream());
  EXPECT_EQ(kernels.init_seed(), expand_seed(Seed(7)));
  EXPECT_EQ(kernels.init_stream_count(), 256u);
  EXPECT_EQ(generator.seed(), expand_seed(Seed(7)));
}

TEST_P(BitGeneratorTest, SameSeedSameSequence)
{
  BitGenerator first(device, kernels, GetParam(), Seed(1234), 64);
  BitGenerator second(device, kernels, GetParam(), Seed(1234), 64);

  EXPECT_EQ(first.random_raw({100}).read<uint32_t>(), second.random_raw({100}).read<uint32_t>());
  EXPECT_EQ(first.random_raw({3, 5}).read<uint32_t>(),
            second.random_raw({3, 5}).read<uint32_t>());
}

TEST_P(BitGeneratorTest, DifferentSeedsDiffer)
{
  BitGenerator first(device, kernels, GetParam(), Seed(1), 64);
  BitGenerator second(device, kernels, GetParam(), Seed(2), 64);

  EXPECT_NE(first.random_raw({100}).read<uint32_t>(), second.random_raw({100}).read<uint32_t>());
}

INSTANTIATE_TEST_SUITE_P(AllTypes,
                         BitGeneratorTest,
                         ::testing::Values(BitGeneratorType::XORWOW,
                                           BitGeneratorType::MRG32K3A,
                                           BitGeneratorType::PHILOX4_32_10));

TEST(BitGeneratorLifetimeTest, ZeroStreamCountIsRejected)
{
  FakeDevice device;
  RecordingKernels kernels;
  EXPECT_THROW(BitGenerator(device, kernels, BitGeneratorType::XORWOW, Seed(1), 0),
               InvalidArgumentError);
  EXPECT_EQ(device.allocations(), 0u);
  EXPECT_TRUE(kernels.launches().empty());
}

TEST(BitGeneratorLifetimeTest, DestructionReleasesState)
{
  FakeDevice device;
  RecordingKernels kernels;
  {
    BitGenerator generator(device, kernels, BitGeneratorType::PHILOX4_32_10, Seed(3), 16);
    EXPECT_EQ(device.live_allocations(), 1u);
  }
  EXPECT_EQ(device.live_allocations(), 0u);
}

TEST(BitGeneratorLifetimeTest, FailedInitializationReleasesState)
{
  FakeDevice device;
  RecordingKernels kernels;
  kernels.fail_at(0);
  EXPECT_THROW(BitGenerator(device, kernels, BitGeneratorType::XORWOW, Seed(3), 16),
               KernelInvocationError);
  EXPECT_EQ(device.allocations(), 1u);
  EXPECT_EQ(device.live_allocations(), 0u);
}

TEST(BitGeneratorLifetimeTest, RecordsOwningDevice)
{
  FakeDevice device;
  RecordingKernels kernels;
  device.set_device(3);
  BitGenerator generator(device, kernels, BitGeneratorType::XORWOW, Seed(3), 16);
  EXPECT_EQ(generator.device_id(), 3);
}

TEST(DeviceAffinityGuardTest, SameDevicePasses)
{
  FakeDevice device;
  RecordingKernels kernels;
  BitGenerator generator(device, kernels, BitGeneratorType::XORWOW, Seed(3), 16);
  EXPECT_NO_THROW(DeviceAffinityGuard::check(generator));
  EXPECT_NE(generator.state(), nullptr);
}

TEST(DeviceAffinityGuardTest, OtherDeviceIsRejected)
{
  FakeDevice device;
  RecordingKernels kernels;
  BitGenerator generator(device, kernels, BitGeneratorType::MRG32K3A, Seed(3), 16);
  device.set_device(1);

  EXPECT_THROW(DeviceAffinityGuard::check(generator), CrossDeviceAccessError);
  try {
    generator.state();
    FAIL() << "state() accessed from another device";
  } catch (const CrossDeviceAccessError& error) {
    EXPECT_EQ(error.owner(), 0);
    EXPECT_EQ(error.current(), 1);
  }
}

TEST(DeviceAffinityGuardTest, RawDrawsFromOtherDeviceAllocateNothing)
{
  FakeDevice device;
  RecordingKernels kernels;
  BitGenerator generator(device, kernels, BitGeneratorType::XORWOW, Seed(3), 16);
  const size_t allocations = device.allocations();
  kernels.clear();

  device.set_device(2);
  EXPECT_THROW(generator.random_raw({10}), CrossDeviceAccessError);
  EXPECT_EQ(device.allocations(), allocations);
  EXPECT_TRUE(kernels.launches().empty());

  device.set_device(0);
  EXPECT_EQ(generator.random_raw({10}).size(), 10u);
}

}  // namespace cusample
