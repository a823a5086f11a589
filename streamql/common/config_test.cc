/*!
 * \file config_test.cc
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
 */
#include "streamql/common/config.h"

#include "gtest/gtest.h"

namespace streamql {

TEST(TestConfig, Defaults) {
  EngineConfig config;
  EXPECT_EQ(NanPolicy::SKIP, config.nan_policy);
  EXPECT_EQ(common::LOG_SEVERITY_INFO, config.log_level);
}

TEST(TestConfig, ReadJson) {
  common::Status status;
  EngineConfig config;
  std::tie(status, config) = EngineConfig::from_json(
      "{ \"aggregate\": { \"nan_policy\": \"Propagate\" }, \"log\": { \"level\": \"error\" } }");
  ASSERT_TRUE(status.IsOk());
  EXPECT_EQ(NanPolicy::PROPAGATE, config.nan_policy);
  EXPECT_EQ(common::LOG_SEVERITY_ERROR, config.log_level);
}

TEST(TestConfig, MissingKeysKeepDefaults) {
  common::Status status;
  EngineConfig config;
  std::tie(status, config) = EngineConfig::from_json("{ \"log\": { \"level\": \"warning\" } }");
  ASSERT_TRUE(status.IsOk());
  EXPECT_EQ(NanPolicy::SKIP, config.nan_policy);
  EXPECT_EQ(common::LOG_SEVERITY_WARNING, config.log_level);
}

TEST(TestConfig, BadValues) {
  common::Status status;
  EngineConfig config;
  std::tie(status, config) = EngineConfig::from_json("{ \"aggregate\": { \"nan_policy\": \"maybe\" } }");
  EXPECT_EQ(common::Status::kBadArg, status.Code());

  std::tie(status, config) = EngineConfig::from_json("{ not json");
  EXPECT_EQ(common::Status::kBadArg, status.Code());
}

}  // namespace streamql
