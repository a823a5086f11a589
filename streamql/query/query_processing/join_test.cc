/*!
 * \file join_test.cc
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
#include "streamql/query/query_processing/join.h"

#include "gtest/gtest.h"

#include "streamql/query/errors.h"
#include "streamql/query/query_processing/mock_stage.h"
#include "streamql/query/queryparser.h"

namespace streamql {
namespace qp {

static JoinNode parse_join(const char* json) {
  common::Status status;
  QueryPtr query;
  ErrorMsg error_msg;
  std::tie(status, query, error_msg) = QueryParser::parse_query(json);
  EXPECT_TRUE(status.IsOk()) << error_msg;
  return query->joins.at(0);
}

static const char* ORDERS_JOIN_USERS = R"(
{
  "select": ["*"],
  "from": {"stream": "orders"},
  "join": [{"from": {"stream": "users"}, "on": [{"left": {"prop": "uid"}, "right": {"prop": "id"}}]}]
})";

struct JoinFixture {
  Context                    ctx;
  std::shared_ptr<Join>      join;
  std::shared_ptr<MockStage> mock;

  explicit JoinFixture(const char* json, bool first = true) {
    join = std::make_shared<Join>(ctx, parse_join(json), StagePtr(), first);
    mock = std::make_shared<MockStage>();
    join->pass(mock);
    join->start();
  }
};

TEST(TestJoin, MatchesBothDirections) {
  JoinFixture fx(ORDERS_JOIN_USERS);
  auto order = make_record({{"oid", 1}, {"uid", 10}});
  auto user = make_record({{"id", 10}, {"name", "ann"}});
  fx.join->insert(order);
  EXPECT_TRUE(fx.mock->events_.empty());
  fx.ctx.streams().publish_insert("users", user);
  ASSERT_EQ(1u, fx.mock->events_.size());
  EXPECT_EQ(R"(+{"oid":1,"uid":10,"id":10,"name":"ann"})", fx.mock->events_[0]);

  auto order2 = make_record({{"oid", 2}, {"uid", 10}});
  fx.join->insert(order2);
  EXPECT_EQ(R"(+{"oid":2,"uid":10,"id":10,"name":"ann"})", fx.mock->events_.back());

  // removing the user retracts both pairs
  fx.ctx.streams().publish_remove("users", user);
  EXPECT_EQ(2u, fx.mock->removes_);
  fx.join->remove(order);
  fx.join->remove(order2);
  EXPECT_EQ(2u, fx.mock->removes_);
  EXPECT_TRUE(fx.mock->balanced());
  EXPECT_EQ(0u, fx.join->size(Join::LEFT));
  EXPECT_EQ(0u, fx.join->size(Join::RIGHT));
}

TEST(TestJoin, LaterJoinMatchesCombinedRecords) {
  JoinFixture fx(ORDERS_JOIN_USERS, false);
  EXPECT_FALSE(fx.join->first_);
  fx.ctx.streams().publish_insert("users", make_record({{"id", 10}, {"name", "ann"}}));
  auto combined = make_record({{"oid", 1}, {"sku", "x"}, {"uid", 10}});
  fx.join->insert(combined);
  ASSERT_EQ(1u, fx.mock->events_.size());
  EXPECT_EQ(R"(+{"oid":1,"sku":"x","uid":10,"id":10,"name":"ann"})", fx.mock->events_[0]);
  fx.join->remove(combined);
  EXPECT_TRUE(fx.mock->balanced());
}

TEST(TestJoin, NullKeysNeverMatch) {
  JoinFixture fx(ORDERS_JOIN_USERS);
  fx.join->insert(make_record({{"oid", 1}}));
  fx.join->insert(make_record({{"oid", 2}, {"uid", Value()}}));
  fx.ctx.streams().publish_insert("users", make_record({{"name", "nobody"}}));
  fx.ctx.streams().publish_insert("users", make_record({{"id", Value()}}));
  EXPECT_TRUE(fx.mock->events_.empty());
  EXPECT_EQ(0u, fx.join->size(Join::LEFT));
}

TEST(TestJoin, AliasNestsRightRecord) {
  JoinFixture fx(R"(
  {
    "select": ["*"],
    "from": {"stream": "orders"},
    "join": [{"from": {"stream": "users"},
              "on": [{"left": {"prop": "uid"}, "right": {"prop": "id"}},
                     {"left": {"prop": "region"}, "right": {"prop": "region"}}],
              "as": "u"}]
  })");
  fx.ctx.streams().publish_insert("users", make_record({{"id", 1}, {"region", "eu"}}));
  fx.ctx.streams().publish_insert("users", make_record({{"id", 1}, {"region", "us"}}));
  fx.join->insert(make_record({{"uid", 1}, {"region", "us"}}));
  ASSERT_EQ(1u, fx.mock->events_.size());
  EXPECT_EQ(R"(+{"uid":1,"region":"us","u":{"id":1,"region":"us"}})", fx.mock->events_[0]);
}

TEST(TestJoin, DuplicateRecords) {
  JoinFixture fx(ORDERS_JOIN_USERS);
  auto order = make_record({{"uid", 5}});
  fx.join->insert(order);
  fx.join->insert(order);
  fx.ctx.streams().publish_insert("users", make_record({{"id", 5}}));
  EXPECT_EQ(2u, fx.mock->inserts_);
  fx.join->remove(make_record({{"uid", 5}}));
  EXPECT_EQ(1u, fx.mock->removes_);
  EXPECT_EQ(1u, fx.join->size(Join::LEFT));
}

TEST(TestJoin, StopUnsubscribes) {
  JoinFixture fx(ORDERS_JOIN_USERS);
  EXPECT_EQ(1u, fx.ctx.streams().subscribers("users"));
  fx.join->stop();
  EXPECT_EQ(0u, fx.ctx.streams().subscribers("users"));
  fx.join->insert(make_record({{"uid", 1}}));
  fx.ctx.streams().publish_insert("users", make_record({{"id", 1}}));
  EXPECT_TRUE(fx.mock->events_.empty());
}

TEST(TestJoin, KeysCantAggregate) {
  Context ctx;
  auto spec = parse_join(R"(
  {
    "select": ["*"],
    "from": {"stream": "orders"},
    "join": [{"from": {"stream": "users"},
              "on": [{"left": {"fn": "count", "args": [{"prop": "uid"}]}, "right": {"prop": "id"}}]}]
  })");
  EXPECT_THROW(std::make_shared<Join>(ctx, spec, StagePtr(), true), QueryConfigError);
}

}  // namespace qp
}  // namespace streamql
