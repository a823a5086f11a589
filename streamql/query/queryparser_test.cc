/*!
 * \file queryparser_test.cc
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
#include "streamql/query/queryparser.h"

#include "gtest/gtest.h"

namespace streamql {
namespace qp {

static QueryPtr parse_ok(const char* json) {
  common::Status status;
  QueryPtr query;
  ErrorMsg error_msg;
  std::tie(status, query, error_msg) = QueryParser::parse_query(json);
  EXPECT_TRUE(status.IsOk()) << error_msg;
  return query;
}

static ErrorMsg parse_error(const char* json) {
  common::Status status;
  QueryPtr query;
  ErrorMsg error_msg;
  std::tie(status, query, error_msg) = QueryParser::parse_query(json);
  EXPECT_EQ(common::Status::kQueryParsingError, status.Code());
  EXPECT_FALSE(query);
  return error_msg;
}

TEST(TestQueryParser, FullQuery) {
  auto query = parse_ok(R"(
  {
    "select": ["*", {"expr": {"fn": "count", "args": [{"star": ""}]}, "as": "n"}],
    "distinct": true,
    "from": {"stream": "orders", "window": {"fn": "length", "size": 2}},
    "join": [{"from": {"stream": "customers"},
              "on": [{"left": {"prop": "cid"}, "right": {"prop": "id"}}],
              "as": "c"}],
    "where": {"op": ">", "args": [{"prop": "price"}, {"num": 10}]},
    "group": {"by": [{"prop": "cid"}], "having": {"op": ">", "args": [{"prop": "n"}, {"num": 1}]}},
    "union": [{"all": true, "query": {"select": ["*"], "from": {"stream": "archive"}}}],
    "limit": 5
  })");
  ASSERT_TRUE(query);
  ASSERT_EQ(2u, query->fields.size());
  EXPECT_TRUE(query->fields[0].star);
  EXPECT_EQ("n", query->fields[1].alias);
  EXPECT_EQ(ExprNode::Kind::CALL, query->fields[1].expr->kind);
  EXPECT_EQ(ExprNode::Kind::STAR, query->fields[1].expr->args.at(0)->kind);
  EXPECT_TRUE(query->distinct);
  EXPECT_EQ("orders", query->source.stream);
  EXPECT_EQ(WindowKind::LENGTH, query->source.window.kind);
  EXPECT_EQ(2u, query->source.window.size);
  ASSERT_EQ(1u, query->joins.size());
  EXPECT_EQ("customers", query->joins[0].source.stream);
  EXPECT_EQ("c", query->joins[0].alias);
  EXPECT_EQ(PropertyPath{"cid"}, query->joins[0].on.at(0).left->path);
  ASSERT_TRUE(query->where);
  EXPECT_EQ(">", query->where->name);
  ASSERT_TRUE(query->group);
  EXPECT_EQ(1u, query->group->fields.size());
  EXPECT_TRUE(query->group->having);
  ASSERT_EQ(1u, query->unions.size());
  EXPECT_TRUE(query->unions[0].all);
  EXPECT_EQ("archive", query->unions[0].query->source.stream);
  EXPECT_TRUE(query->has_limit);
  EXPECT_EQ(5u, query->limit);
}

TEST(TestQueryParser, SubQueryAndTimeWindow) {
  auto query = parse_ok(R"(
  {
    "select": [{"expr": {"prop": "a.b"}}],
    "from": {"query": {"select": ["*"], "from": {"stream": "s", "window": {"fn": "time", "duration": "10s"}}}}
  })");
  ASSERT_TRUE(query);
  EXPECT_TRUE(query->source.is_subquery());
  EXPECT_FALSE(query->has_limit);
  const auto& inner = query->source.query->source;
  EXPECT_EQ(WindowKind::TIME, inner.window.kind);
  EXPECT_EQ(10000000000ull, inner.window.duration);
  EXPECT_EQ((PropertyPath{"a", "b"}), query->fields[0].expr->path);
}

TEST(TestQueryParser, Literals) {
  auto query = parse_ok(R"(
  {
    "select": [{"expr": {"num": 1.5}}, {"expr": {"str": "x"}}, {"expr": {"bool": true}}, {"expr": {"null": ""}}],
    "from": {"stream": "s"}
  })");
  ASSERT_TRUE(query);
  EXPECT_EQ(Value(1.5), query->fields[0].expr->literal);
  EXPECT_EQ(Value("x"), query->fields[1].expr->literal);
  EXPECT_EQ(Value(true), query->fields[2].expr->literal);
  EXPECT_TRUE(query->fields[3].expr->literal.is_null());
}

TEST(TestQueryParser, Errors) {
  parse_error("{ not json");
  parse_error(R"({"from": {"stream": "s"}})");
  parse_error(R"({"select": ["*"]})");
  parse_error(R"({"select": [], "from": {"stream": "s"}})");
  parse_error(R"({"select": ["*"], "from": {}})");
  parse_error(R"({"select": ["*"], "from": {"stream": "s", "window": {"fn": "session"}}})");
  parse_error(R"({"select": ["*"], "from": {"stream": "s", "window": {"fn": "length", "size": 0}}})");
  parse_error(R"({"select": ["*"], "from": {"stream": "s", "window": {"fn": "time", "duration": "soon"}}})");
  parse_error(R"({"select": [{"expr": {"op": "^", "args": [{"num": 1}, {"num": 2}]}}], "from": {"stream": "s"}})");
  parse_error(R"({"select": [{"expr": {"op": "=", "args": [{"num": 1}]}}], "from": {"stream": "s"}})");
  parse_error(R"({"select": [{"expr": {"num": "one"}}], "from": {"stream": "s"}})");
  parse_error(R"({"select": ["*"], "from": {"stream": "s"}, "join": [{"from": {"stream": "t"}}]})");
  parse_error(R"({"select": ["*"], "from": {"stream": "s"}, "union": [{"all": true}]})");
  auto msg = parse_error(R"({"select": [{"as": "x"}], "from": {"stream": "s"}})");
  EXPECT_NE(std::string::npos, msg.find("expr"));
}

}  // namespace qp
}  // namespace streamql
