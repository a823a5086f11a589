/*!
 * \file distinct_test.cc
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
#include "streamql/query/query_processing/distinct.h"

#include "gtest/gtest.h"

#include "streamql/query/query_processing/mock_stage.h"

namespace streamql {
namespace qp {

TEST(TestDistinct, DuplicatesCollapse) {
  auto distinct = std::make_shared<Distinct>();
  auto mock = std::make_shared<MockStage>();
  distinct->pass(mock);
  distinct->insert(make_record({{"a", 1}}));
  distinct->insert(make_record({{"a", 1}}));
  EXPECT_EQ(1u, mock->inserts_);
  distinct->remove(make_record({{"a", 1}}));
  EXPECT_EQ(0u, mock->removes_);
  distinct->remove(make_record({{"a", 1}}));
  EXPECT_EQ(1u, mock->removes_);
  EXPECT_TRUE(distinct->counts_.empty());
  EXPECT_TRUE(mock->balanced());
}

TEST(TestDistinct, UnknownRemoveIgnored) {
  auto distinct = std::make_shared<Distinct>();
  auto mock = std::make_shared<MockStage>();
  distinct->pass(mock);
  distinct->remove(make_record({{"a", 1}}));
  EXPECT_TRUE(mock->events_.empty());
  EXPECT_TRUE(distinct->counts_.empty());
}

TEST(TestDistinct, Update) {
  auto distinct = std::make_shared<Distinct>();
  auto mock = std::make_shared<MockStage>();
  distinct->pass(mock);
  auto a = make_record({{"a", 1}});
  auto b = make_record({{"a", 2}});
  distinct->insert(a);
  distinct->insert(a);
  // one copy of `a` is still there
  distinct->insert_remove(b, a);
  EXPECT_EQ(R"(+{"a":2})", mock->events_.back());
  distinct->insert_remove(b, a);
  EXPECT_EQ(R"(-{"a":1})", mock->events_.back());
  distinct->insert_remove(a, b);
  distinct->insert_remove(a, b);
  EXPECT_EQ(R"(~{"a":1}/{"a":2})", mock->events_.back());
  size_t count = mock->events_.size();
  distinct->insert_remove(a, make_record({{"a", 1}}));
  EXPECT_EQ(count, mock->events_.size());
}

}  // namespace qp
}  // namespace streamql
