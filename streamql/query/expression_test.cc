/*!
 * \file expression_test.cc
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
#include "streamql/query/expression.h"

#include <cmath>
#include <stdexcept>

#include "gtest/gtest.h"

#include "streamql/query/errors.h"
#include "streamql/query/queryparser.h"

namespace streamql {
namespace qp {

static ExprNodePtr parse(const char* json) {
  common::Status status;
  boost::property_tree::ptree tree;
  ErrorMsg error_msg;
  std::tie(status, tree, error_msg) = QueryParser::parse_json(json);
  EXPECT_TRUE(status.IsOk()) << error_msg;
  ExprNodePtr expr;
  std::tie(status, expr, error_msg) = QueryParser::parse_expression(tree);
  EXPECT_TRUE(status.IsOk()) << error_msg;
  return expr;
}

static Value eval(const char* json, const Record& record, const FunctionRegistry& udfs = FunctionRegistry()) {
  auto expr = Expression::compile(parse(json), udfs);
  common::Status status;
  Value value;
  std::tie(status, value) = expr->eval(record);
  EXPECT_TRUE(status.IsOk()) << status.ToString();
  return value;
}

TEST(TestExpression, Arithmetic) {
  Record rec = {{"a", 6}, {"b", 4}, {"s", "x"}};
  EXPECT_EQ(Value(10), eval(R"({"op": "+", "args": [{"prop": "a"}, {"prop": "b"}]})", rec));
  EXPECT_EQ(Value(2), eval(R"({"op": "-", "args": [{"prop": "a"}, {"prop": "b"}]})", rec));
  EXPECT_EQ(Value(1.5), eval(R"({"op": "/", "args": [{"prop": "a"}, {"prop": "b"}]})", rec));
  EXPECT_EQ(Value(2), eval(R"({"op": "%", "args": [{"prop": "a"}, {"prop": "b"}]})", rec));
  EXPECT_EQ(Value(-6), eval(R"({"op": "neg", "args": [{"prop": "a"}]})", rec));
  EXPECT_EQ(Value("x6"), eval(R"({"op": "+", "args": [{"prop": "s"}, {"prop": "a"}]})", rec));
  // missing property is null and null propagates through arithmetic
  EXPECT_TRUE(eval(R"({"op": "*", "args": [{"prop": "missing"}, {"num": 2}]})", rec).is_null());
}

TEST(TestExpression, Comparison) {
  Record rec = {{"a", 6}, {"s", "abc"}, {"n", make_record({{"x", 1}})}};
  EXPECT_EQ(Value(true), eval(R"({"op": ">", "args": [{"prop": "a"}, {"num": 5}]})", rec));
  EXPECT_EQ(Value(false), eval(R"({"op": "<=", "args": [{"prop": "a"}, {"num": 5}]})", rec));
  EXPECT_EQ(Value(true), eval(R"({"op": "<", "args": [{"prop": "s"}, {"str": "abd"}]})", rec));
  EXPECT_TRUE(eval(R"({"op": "<", "args": [{"prop": "s"}, {"num": 1}]})", rec).is_null());
  EXPECT_EQ(Value(true), eval(R"({"op": "=", "args": [{"prop": "n.x"}, {"num": 1}]})", rec));
  EXPECT_EQ(Value(true), eval(R"({"op": "!=", "args": [{"prop": "a"}, {"str": "6"}]})", rec));
}

TEST(TestExpression, LogicShortCircuit) {
  FunctionRegistry udfs;
  int calls = 0;
  udfs.register_function("touch", [&calls](const std::vector<Value>&) {
    calls++;
    return Value(true);
  });
  Record rec = {{"a", 0}};
  EXPECT_EQ(Value(false), eval(R"({"op": "and", "args": [{"prop": "a"}, {"fn": "touch"}]})", rec, udfs));
  EXPECT_EQ(Value(true), eval(R"({"op": "or", "args": [{"bool": true}, {"fn": "touch"}]})", rec, udfs));
  EXPECT_EQ(0, calls);
  EXPECT_EQ(Value(true), eval(R"({"op": "or", "args": [{"prop": "a"}, {"fn": "touch"}]})", rec, udfs));
  EXPECT_EQ(1, calls);
  EXPECT_EQ(Value(true), eval(R"({"op": "not", "args": [{"prop": "a"}]})", rec, udfs));
}

TEST(TestExpression, BuiltinFunctions) {
  Record rec = {{"name", "Bob"}, {"tags", Array{Value(1), Value(2)}}, {"x", -3}};
  EXPECT_EQ(Value("bob"), eval(R"({"fn": "LOWER", "args": [{"prop": "name"}]})", rec));
  EXPECT_EQ(Value("BOB"), eval(R"({"fn": "upper", "args": [{"prop": "name"}]})", rec));
  EXPECT_EQ(Value(3), eval(R"({"fn": "abs", "args": [{"prop": "x"}]})", rec));
  EXPECT_EQ(Value(2), eval(R"({"fn": "length", "args": [{"prop": "tags"}]})", rec));
  EXPECT_EQ(Value("Bob"), eval(R"({"fn": "coalesce", "args": [{"prop": "nope"}, {"prop": "name"}]})", rec));
  EXPECT_EQ(Value("Bob-3"), eval(R"({"fn": "concat", "args": [{"prop": "name"}, {"prop": "x"}]})", rec));
}

TEST(TestExpression, UserDefinedFunctionErrors) {
  FunctionRegistry udfs;
  udfs.register_function("fail", [](const std::vector<Value>&) -> Value {
    throw std::runtime_error("rejected");
  });
  auto expr = Expression::compile(parse(R"({"fn": "fail", "args": [{"prop": "a"}]})"), udfs);
  common::Status status;
  Value value;
  std::tie(status, value) = expr->eval(Record{{"a", 1}});
  EXPECT_EQ(common::Status::kBadData, status.Code());
}

TEST(TestExpression, UserDefinedFunctionShadowsAggregate) {
  FunctionRegistry udfs;
  udfs.register_function("count", [](const std::vector<Value>& args) { return Value(static_cast<u64>(args.size())); });
  auto expr = Expression::compile(parse(R"({"fn": "count", "args": [{"prop": "a"}, {"prop": "b"}]})"), udfs);
  EXPECT_FALSE(expr->is_aggregate());
  common::Status status;
  Value value;
  std::tie(status, value) = expr->eval(Record{});
  EXPECT_EQ(Value(2), value);
}

TEST(TestExpression, ConfigurationErrors) {
  FunctionRegistry udfs;
  EXPECT_THROW(Expression::compile(parse(R"({"fn": "nosuchfn", "args": []})"), udfs), QueryConfigError);
  EXPECT_THROW(Expression::compile(parse(R"({"fn": "lower", "args": []})"), udfs), QueryConfigError);
  EXPECT_THROW(Expression::compile(parse(R"({"fn": "sum", "args": [{"fn": "count", "args": [{"star": ""}]}]})"),
                                   udfs), QueryConfigError);
  EXPECT_THROW(Expression::compile(parse(R"({"fn": "lower", "args": [{"star": ""}]})"), udfs), QueryConfigError);
  // binary operators take exactly two operands
  auto one = ExprNode::make_literal(Value(1));
  EXPECT_THROW(Expression::compile(ExprNode::make_op("+", {one, one, one}), udfs), QueryConfigError);
  EXPECT_THROW(Expression::compile(ExprNode::make_op("<", {one, one, one}), udfs), QueryConfigError);
  EXPECT_THROW(Expression::compile(ExprNode::make_op("-", {one}), udfs), QueryConfigError);
  EXPECT_THROW(Expression::compile(ExprNode::make_op("not", {one, one}), udfs), QueryConfigError);
  EXPECT_THROW(Expression::compile(ExprNode::make_op("and", {one}), udfs), QueryConfigError);
  // logical operators chain
  auto chained = Expression::compile(ExprNode::make_op("or", {ExprNode::make_literal(Value(false)),
                                                              ExprNode::make_literal(Value(false)), one}), udfs);
  EXPECT_EQ("(false or false or 1)", chained->to_string());
  EXPECT_EQ(Value(true), std::get<1>(chained->eval(Record())));
}

TEST(TestExpression, UsedProperties) {
  FunctionRegistry udfs;
  auto expr = Expression::compile(parse(R"(
    {"op": "and", "args": [
      {"op": ">", "args": [{"prop": "a.b"}, {"prop": "c"}]},
      {"op": "=", "args": [{"prop": "a.b"}, {"fn": "sum", "args": [{"prop": "d"}]}]}
    ]})"), udfs);
  std::vector<PropertyPath> expected = {{"a", "b"}, {"c"}, {"d"}};
  EXPECT_EQ(expected, expr->used_properties());
  EXPECT_TRUE(expr->is_aggregate());
  ASSERT_EQ(1u, expr->aggregate_calls().size());
  EXPECT_EQ("sum", expr->aggregate_calls().front().name);
}

TEST(TestExpression, AggregateValues) {
  FunctionRegistry udfs;
  auto expr = Expression::compile(parse(R"(
    {"op": "/", "args": [{"fn": "SUM", "args": [{"prop": "x"}]}, {"fn": "count", "args": [{"star": ""}]}]})"), udfs);
  ASSERT_EQ(2u, expr->aggregate_calls().size());
  EXPECT_TRUE(expr->aggregate_calls()[1].star);
  EXPECT_EQ("(sum(x) / count(*))", expr->to_string());

  std::vector<Value> values = {Value(9), Value(3)};
  common::Status status;
  Value value;
  std::tie(status, value) = expr->eval(Record{}, &values);
  EXPECT_TRUE(status.IsOk());
  EXPECT_EQ(Value(3), value);

  // aggregate outside of the aggregation stage
  std::tie(status, value) = expr->eval(Record{});
  EXPECT_EQ(common::Status::kBadData, status.Code());
}

TEST(TestExpression, TextForm) {
  FunctionRegistry udfs;
  EXPECT_EQ("a.b", Expression::compile(parse(R"({"prop": "a.b"})"), udfs)->to_string());
  EXPECT_TRUE(Expression::compile(parse(R"({"prop": "a.b"})"), udfs)->is_property());
  EXPECT_EQ("lower(name)", Expression::compile(parse(R"({"fn": "Lower", "args": [{"prop": "name"}]})"),
                                               udfs)->to_string());
}

}  // namespace qp
}  // namespace streamql
