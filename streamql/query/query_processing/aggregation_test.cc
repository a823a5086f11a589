/*!
 * \file aggregation_test.cc
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
#include "streamql/query/query_processing/aggregation.h"

#include "gtest/gtest.h"

#include "streamql/query/errors.h"
#include "streamql/query/query_processing/mock_stage.h"
#include "streamql/query/queryparser.h"

namespace streamql {
namespace qp {

static std::shared_ptr<Aggregation> build(const char* json, NanPolicy policy = NanPolicy::SKIP) {
  common::Status status;
  QueryPtr query;
  ErrorMsg error_msg;
  std::tie(status, query, error_msg) = QueryParser::parse_query(json);
  EXPECT_TRUE(status.IsOk()) << error_msg;
  FunctionRegistry udfs;
  return std::make_shared<Aggregation>(resolve_fields(*query, udfs), query->group, udfs, policy);
}

struct AggregationFixture {
  std::shared_ptr<Aggregation> agg;
  std::shared_ptr<MockStage>   mock;

  explicit AggregationFixture(const char* json, NanPolicy policy = NanPolicy::SKIP)
      : agg(build(json, policy))
        , mock(std::make_shared<MockStage>()) {
    agg->pass(mock);
  }
};

TEST(TestAggregation, SingleGroupCount) {
  AggregationFixture fx(R"({"select": [{"expr": {"fn": "count", "args": [{"star": ""}]}, "as": "n"}],
                            "from": {"stream": "s"}})");
  auto a = make_record({{"id", 1}});
  auto b = make_record({{"id", 2}});
  fx.agg->insert(a);
  fx.agg->insert(b);
  fx.agg->remove(a);
  fx.agg->remove(b);
  std::vector<std::string> expected = {
    R"(+{"n":1})",
    R"(~{"n":2}/{"n":1})",
    R"(~{"n":1}/{"n":2})",
    R"(-{"n":1})",
  };
  EXPECT_EQ(expected, fx.mock->events_);
  EXPECT_TRUE(fx.mock->balanced());
  EXPECT_EQ(0u, fx.agg->size());
}

TEST(TestAggregation, UnchangedRowIsSuppressed) {
  AggregationFixture fx(R"({"select": [{"expr": {"fn": "max", "args": [{"prop": "x"}]}, "as": "m"}],
                            "from": {"stream": "s"}})");
  fx.agg->insert(make_record({{"x", 5}}));
  fx.agg->insert(make_record({{"x", 3}}));
  fx.agg->remove(make_record({{"x", 3}}));
  ASSERT_EQ(1u, fx.mock->events_.size());
  EXPECT_EQ(R"(+{"m":5})", fx.mock->events_[0]);
}

TEST(TestAggregation, PlainFieldsFollowLastRecord) {
  AggregationFixture fx(R"({"select": [{"expr": {"prop": "x"}},
                                       {"expr": {"fn": "count", "args": [{"star": ""}]}, "as": "n"}],
                            "from": {"stream": "s"}})");
  fx.agg->insert(make_record({{"x", 1}}));
  fx.agg->insert(make_record({{"x", 2}}));
  EXPECT_EQ(R"(~{"x":2,"n":2}/{"x":1,"n":1})", fx.mock->events_.back());
}

TEST(TestAggregation, GroupBy) {
  AggregationFixture fx(R"({"select": [{"expr": {"prop": "k"}},
                                       {"expr": {"fn": "sum", "args": [{"prop": "x"}]}, "as": "s"}],
                            "from": {"stream": "s"},
                            "group": {"by": [{"prop": "k"}]}})");
  fx.agg->insert(make_record({{"k", "a"}, {"x", 1}}));
  fx.agg->insert(make_record({{"k", "b"}, {"x", 2}}));
  fx.agg->insert(make_record({{"k", "a"}, {"x", 3}}));
  EXPECT_EQ(2u, fx.agg->size());
  std::vector<std::string> expected = {
    R"(+{"k":"a","s":1})",
    R"(+{"k":"b","s":2})",
    R"(~{"k":"a","s":4}/{"k":"a","s":1})",
  };
  EXPECT_EQ(expected, fx.mock->events_);
  fx.agg->remove(make_record({{"k", "b"}, {"x", 2}}));
  EXPECT_EQ(R"(-{"k":"b","s":2})", fx.mock->events_.back());
  EXPECT_EQ(1u, fx.agg->size());
  // unknown group
  fx.agg->remove(make_record({{"k", "c"}, {"x", 2}}));
  EXPECT_EQ(4u, fx.mock->events_.size());
}

TEST(TestAggregation, Having) {
  AggregationFixture fx(R"({"select": [{"expr": {"prop": "k"}},
                                       {"expr": {"fn": "count", "args": [{"star": ""}]}, "as": "n"}],
                            "from": {"stream": "s"},
                            "group": {"by": [{"prop": "k"}],
                                      "having": {"op": ">", "args": [{"fn": "count", "args": [{"star": ""}]},
                                                                     {"num": 1}]}}})");
  auto rec = make_record({{"k", "a"}});
  fx.agg->insert(rec);
  EXPECT_TRUE(fx.mock->events_.empty());
  fx.agg->insert(rec);
  fx.agg->insert(rec);
  fx.agg->remove(rec);
  fx.agg->remove(rec);
  EXPECT_EQ(1u, fx.agg->size());
  fx.agg->remove(rec);
  std::vector<std::string> expected = {
    R"(+{"k":"a","n":2})",
    R"(~{"k":"a","n":3}/{"k":"a","n":2})",
    R"(~{"k":"a","n":2}/{"k":"a","n":3})",
    R"(-{"k":"a","n":2})",
  };
  EXPECT_EQ(expected, fx.mock->events_);
  EXPECT_EQ(0u, fx.agg->size());
}

TEST(TestAggregation, UpdateWithinGroup) {
  AggregationFixture fx(R"({"select": [{"expr": {"prop": "k"}},
                                       {"expr": {"fn": "sum", "args": [{"prop": "x"}]}, "as": "s"}],
                            "from": {"stream": "s"},
                            "group": {"by": [{"prop": "k"}]}})");
  auto a1 = make_record({{"k", "a"}, {"x", 1}});
  auto a4 = make_record({{"k", "a"}, {"x", 4}});
  auto b4 = make_record({{"k", "b"}, {"x", 4}});
  fx.agg->insert(a1);
  fx.agg->insert_remove(a4, a1);
  EXPECT_EQ(2u, fx.mock->events_.size());
  EXPECT_EQ(R"(~{"k":"a","s":4}/{"k":"a","s":1})", fx.mock->events_.back());
  fx.agg->insert_remove(b4, a4);
  std::vector<std::string> tail(fx.mock->events_.end() - 2, fx.mock->events_.end());
  std::vector<std::string> expected = {R"(-{"k":"a","s":4})", R"(+{"k":"b","s":4})"};
  EXPECT_EQ(expected, tail);
  EXPECT_EQ(1u, fx.agg->size());
}

TEST(TestAggregation, NanPolicy) {
  const char* query = R"({"select": [{"expr": {"fn": "avg", "args": [{"prop": "x"}]}, "as": "a"}],
                          "from": {"stream": "s"}})";
  AggregationFixture skip(query, NanPolicy::SKIP);
  AggregationFixture zero(query, NanPolicy::ZERO);
  for (auto* fx: {&skip, &zero}) {
    fx->agg->insert(make_record({{"x", 4}}));
    fx->agg->insert(make_record({{"x", "n/a"}}));
  }
  EXPECT_EQ(R"(+{"a":4})", skip.mock->events_.back());
  EXPECT_EQ(R"(~{"a":2}/{"a":4})", zero.mock->events_.back());
}

TEST(TestAggregation, ConfigurationErrors) {
  EXPECT_THROW(build(R"({"select": [{"expr": {"fn": "sum", "args": [{"star": ""}]}}], "from": {"stream": "s"}})"),
               QueryConfigError);
  EXPECT_THROW(build(R"({"select": [{"expr": {"fn": "count", "args": [{"prop": "a"}, {"prop": "b"}]}}],
                         "from": {"stream": "s"}})"),
               QueryConfigError);
  EXPECT_THROW(build(R"({"select": [{"expr": {"fn": "count", "args": [{"star": ""}]}}],
                         "from": {"stream": "s"},
                         "group": {"by": [{"fn": "max", "args": [{"prop": "a"}]}]}})"),
               QueryConfigError);
}

}  // namespace qp
}  // namespace streamql
