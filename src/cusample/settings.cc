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

#include <cerrno>
#include <cstdlib>
#include <limits>

#include "cusample/env_defaults.h"
#include "cusample/settings.h"

namespace cusample {

using namespace legate;

static Logger log_settings("cusample.settings");

uint32_t parse_stream_count(const char* value)
{
  if (nullptr == value) return STREAM_COUNT_DEFAULT;

  char* end                = nullptr;
  errno                    = 0;
  unsigned long long count = std::strtoull(value, &end, 10);
  if (errno != 0 || end == value || *end != '\0' || count == 0 ||
      count > std::numeric_limits<uint32_t>::max() || value[0] == '-') {
    log_settings.warning() << "ignoring invalid CUSAMPLE_STREAM_COUNT value \"" << value
                           << "\", using " << STREAM_COUNT_DEFAULT;
    return STREAM_COUNT_DEFAULT;
  }
  return static_cast<uint32_t>(count);
}

BitGeneratorType parse_generator_type(const char* value)
{
  BitGeneratorType type = BitGeneratorType::XORWOW;
  parse_bitgenerator_name(DEFAULT_GENERATOR_NAME, type);
  if (nullptr == value) return type;

  if (!parse_bitgenerator_name(value, type)) {
    log_settings.warning() << "ignoring unknown CUSAMPLE_DEFAULT_GENERATOR value \"" << value
                           << "\", using " << DEFAULT_GENERATOR_NAME;
  }
  return type;
}

uint32_t default_stream_count()
{
  static const uint32_t count = parse_stream_count(getenv("CUSAMPLE_STREAM_COUNT"));
  return count;
}

BitGeneratorType default_generator_type()
{
  static const BitGeneratorType type =
    parse_generator_type(getenv("CUSAMPLE_DEFAULT_GENERATOR"));
  return type;
}

}  // namespace cusample
