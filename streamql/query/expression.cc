/*!
 * \file expression.cc
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

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <map>

#include <boost/algorithm/string.hpp>

#include "streamql/query/errors.h"
#include "streamql/query/query_processing/aggregate_function.h"

namespace streamql {
namespace qp {

enum class OpCode {
  ADD, SUB, MUL, DIV, MOD,
  EQ, NE, LT, LE, GT, GE,
  AND, OR, NOT, NEG,
};

struct CompiledNode {
  ExprNode::Kind                                   kind;
  Value                                            literal;
  PropertyPath                                     path;
  OpCode                                           op;
  ScalarFunction                                   fn;
  //! Aggregate call index, -1 for scalar calls
  int                                              slot;
  std::vector<std::shared_ptr<const CompiledNode>> args;

  CompiledNode() : kind(ExprNode::Kind::LITERAL), op(OpCode::ADD), slot(-1) { }
};

typedef std::shared_ptr<const CompiledNode> CompiledNodePtr;

namespace {

const std::map<std::string, OpCode> OPCODES = {
  {"+", OpCode::ADD}, {"-", OpCode::SUB}, {"*", OpCode::MUL}, {"/", OpCode::DIV}, {"%", OpCode::MOD},
  {"=", OpCode::EQ}, {"!=", OpCode::NE}, {"<", OpCode::LT}, {"<=", OpCode::LE}, {">", OpCode::GT},
  {">=", OpCode::GE}, {"and", OpCode::AND}, {"or", OpCode::OR}, {"not", OpCode::NOT}, {"neg", OpCode::NEG},
};

//! Text form used by `+` concatenation and concat()
std::string to_text(const Value& value) {
  if (value.is_string()) {
    return value.as_string();
  }
  return value.to_json();
}

struct Builtin {
  size_t         min_args;
  size_t         max_args;
  ScalarFunction fn;
};

const std::map<std::string, Builtin>& builtins() {
  static const std::map<std::string, Builtin> inst = {
    {"lower", {1, 1, [](const std::vector<Value>& args) {
      return args[0].is_string() ? Value(boost::algorithm::to_lower_copy(args[0].as_string())) : Value();
    }}},
    {"upper", {1, 1, [](const std::vector<Value>& args) {
      return args[0].is_string() ? Value(boost::algorithm::to_upper_copy(args[0].as_string())) : Value();
    }}},
    {"abs", {1, 1, [](const std::vector<Value>& args) {
      return args[0].is_null() ? Value() : Value(std::fabs(args[0].to_number()));
    }}},
    {"length", {1, 1, [](const std::vector<Value>& args) {
      const auto& arg = args[0];
      if (arg.is_string()) {
        return Value(static_cast<u64>(arg.as_string().size()));
      } else if (arg.is_array()) {
        return Value(static_cast<u64>(arg.as_array().size()));
      } else if (arg.is_record()) {
        return Value(static_cast<u64>(arg.as_record()->size()));
      }
      return Value();
    }}},
    {"coalesce", {1, SIZE_MAX, [](const std::vector<Value>& args) {
      for (const auto& arg: args) {
        if (!arg.is_null()) {
          return arg;
        }
      }
      return Value();
    }}},
    {"concat", {1, SIZE_MAX, [](const std::vector<Value>& args) {
      std::string result;
      for (const auto& arg: args) {
        if (!arg.is_null()) {
          result += to_text(arg);
        }
      }
      return Value(result);
    }}},
  };
  return inst;
}

struct Compiler {
  FunctionRegistry const&    udfs;
  std::vector<PropertyPath>  used;
  std::vector<AggregateCall> calls;

  explicit Compiler(FunctionRegistry const& r) : udfs(r) { }

  void add_path(const PropertyPath& path) {
    merge_properties(&used, std::vector<PropertyPath>{path});
  }

  CompiledNodePtr compile(const ExprNodePtr& node, std::string* text) {
    auto result = std::make_shared<CompiledNode>();
    result->kind = node->kind;
    switch (node->kind) {
      case ExprNode::Kind::LITERAL:
        result->literal = node->literal;
        *text = node->literal.to_json();
        break;
      case ExprNode::Kind::PROPERTY:
        result->path = node->path;
        add_path(node->path);
        *text = join_path(node->path);
        break;
      case ExprNode::Kind::STAR:
        throw QueryConfigError("`*` is only allowed as an aggregate function argument");
      case ExprNode::Kind::OP:
        compile_op(node, result.get(), text);
        break;
      case ExprNode::Kind::CALL:
        compile_call(node, result.get(), text);
        break;
    }
    return result;
  }

  void compile_op(const ExprNodePtr& node, CompiledNode* result, std::string* text) {
    auto it = OPCODES.find(node->name);
    if (it == OPCODES.end()) {
      throw QueryConfigError("unknown operator `" + node->name + "`");
    }
    result->op = it->second;
    std::vector<std::string> parts;
    for (const auto& arg: node->args) {
      std::string part;
      result->args.push_back(compile(arg, &part));
      parts.push_back(part);
    }
    if (result->op == OpCode::NOT || result->op == OpCode::NEG) {
      if (parts.size() != 1) {
        throw QueryConfigError("operator `" + node->name + "` takes one argument");
      }
      *text = (result->op == OpCode::NOT ? "not " : "-") + parts[0];
    } else if (result->op == OpCode::AND || result->op == OpCode::OR) {
      if (parts.size() < 2) {
        throw QueryConfigError("operator `" + node->name + "` takes at least two arguments");
      }
      *text = "(" + boost::algorithm::join(parts, " " + node->name + " ") + ")";
    } else {
      if (parts.size() != 2) {
        throw QueryConfigError("operator `" + node->name + "` takes two arguments");
      }
      *text = "(" + boost::algorithm::join(parts, " " + node->name + " ") + ")";
    }
  }

  void compile_call(const ExprNodePtr& node, CompiledNode* result, std::string* text) {
    auto name = boost::algorithm::to_lower_copy(node->name);
    std::vector<std::string> parts;
    if (auto udf = udfs.find(name)) {
      result->fn = *udf;
      for (const auto& arg: node->args) {
        std::string part;
        result->args.push_back(compile(arg, &part));
        parts.push_back(part);
      }
    } else if (is_aggregate_function(name)) {
      AggregateCall call;
      call.name = name;
      for (const auto& arg: node->args) {
        if (arg->kind == ExprNode::Kind::STAR) {
          call.star = true;
          parts.push_back("*");
          continue;
        }
        auto expr = Expression::compile(arg, udfs);
        if (expr->is_aggregate()) {
          throw QueryConfigError("aggregate function `" + name + "` can't take an aggregate argument");
        }
        merge_properties(&used, expr->used_properties());
        parts.push_back(expr->to_string());
        call.args.push_back(expr);
      }
      result->slot = static_cast<int>(calls.size());
      calls.push_back(call);
    } else {
      auto it = builtins().find(name);
      if (it == builtins().end()) {
        throw QueryConfigError("unknown function `" + node->name + "`");
      }
      const auto& builtin = it->second;
      if (node->args.size() < builtin.min_args || node->args.size() > builtin.max_args) {
        throw QueryConfigError("wrong number of arguments for function `" + name + "`");
      }
      result->fn = builtin.fn;
      for (const auto& arg: node->args) {
        std::string part;
        result->args.push_back(compile(arg, &part));
        parts.push_back(part);
      }
    }
    *text = name + "(" + boost::algorithm::join(parts, ", ") + ")";
  }
};

typedef std::tuple<common::Status, Value> EvalResult;

EvalResult eval_node(const CompiledNode& node, const Record& record, const std::vector<Value>* aggregates);

EvalResult compare(OpCode op, const Value& lhs, const Value& rhs) {
  if (op == OpCode::EQ) {
    return std::make_tuple(common::Status::Ok(), Value(lhs == rhs));
  }
  if (op == OpCode::NE) {
    return std::make_tuple(common::Status::Ok(), Value(lhs != rhs));
  }
  int cmp;
  if (lhs.is_number() && rhs.is_number()) {
    double a = lhs.as_number(), b = rhs.as_number();
    if (std::isnan(a) || std::isnan(b)) {
      return std::make_tuple(common::Status::Ok(), Value(false));
    }
    cmp = a < b ? -1 : (a > b ? 1 : 0);
  } else if (lhs.is_string() && rhs.is_string()) {
    cmp = lhs.as_string().compare(rhs.as_string());
  } else {
    // mixed types are not ordered
    return std::make_tuple(common::Status::Ok(), Value());
  }
  bool result = false;
  switch (op) {
    case OpCode::LT:
      result = cmp < 0;
      break;
    case OpCode::LE:
      result = cmp <= 0;
      break;
    case OpCode::GT:
      result = cmp > 0;
      break;
    case OpCode::GE:
      result = cmp >= 0;
      break;
    default:
      break;
  }
  return std::make_tuple(common::Status::Ok(), Value(result));
}

EvalResult arithmetic(OpCode op, const Value& lhs, const Value& rhs) {
  if (op == OpCode::ADD && (lhs.is_string() || rhs.is_string())) {
    return std::make_tuple(common::Status::Ok(), Value(to_text(lhs) + to_text(rhs)));
  }
  if (lhs.is_null() || rhs.is_null()) {
    return std::make_tuple(common::Status::Ok(), Value());
  }
  double a = lhs.to_number(), b = rhs.to_number();
  double result = 0;
  switch (op) {
    case OpCode::ADD:
      result = a + b;
      break;
    case OpCode::SUB:
      result = a - b;
      break;
    case OpCode::MUL:
      result = a * b;
      break;
    case OpCode::DIV:
      result = a / b;
      break;
    case OpCode::MOD:
      result = std::fmod(a, b);
      break;
    default:
      break;
  }
  return std::make_tuple(common::Status::Ok(), Value(result));
}

EvalResult eval_op(const CompiledNode& node, const Record& record, const std::vector<Value>* aggregates) {
  common::Status status;
  Value lhs;
  if (node.op == OpCode::AND || node.op == OpCode::OR) {
    for (const auto& arg: node.args) {
      std::tie(status, lhs) = eval_node(*arg, record, aggregates);
      if (!status.IsOk()) {
        return std::make_tuple(status, Value());
      }
      bool truth = lhs.truthy();
      if (node.op == OpCode::AND && !truth) {
        return std::make_tuple(common::Status::Ok(), Value(false));
      }
      if (node.op == OpCode::OR && truth) {
        return std::make_tuple(common::Status::Ok(), Value(true));
      }
    }
    return std::make_tuple(common::Status::Ok(), Value(node.op == OpCode::AND));
  }
  std::tie(status, lhs) = eval_node(*node.args[0], record, aggregates);
  if (!status.IsOk()) {
    return std::make_tuple(status, Value());
  }
  if (node.op == OpCode::NOT) {
    return std::make_tuple(common::Status::Ok(), Value(!lhs.truthy()));
  }
  if (node.op == OpCode::NEG) {
    return std::make_tuple(common::Status::Ok(), lhs.is_null() ? Value() : Value(-lhs.to_number()));
  }
  Value rhs;
  std::tie(status, rhs) = eval_node(*node.args[1], record, aggregates);
  if (!status.IsOk()) {
    return std::make_tuple(status, Value());
  }
  switch (node.op) {
    case OpCode::EQ:
    case OpCode::NE:
    case OpCode::LT:
    case OpCode::LE:
    case OpCode::GT:
    case OpCode::GE:
      return compare(node.op, lhs, rhs);
    default:
      return arithmetic(node.op, lhs, rhs);
  }
}

EvalResult eval_node(const CompiledNode& node, const Record& record, const std::vector<Value>* aggregates) {
  switch (node.kind) {
    case ExprNode::Kind::LITERAL:
      return std::make_tuple(common::Status::Ok(), node.literal);
    case ExprNode::Kind::PROPERTY: {
      auto value = record.find_path(node.path);
      return std::make_tuple(common::Status::Ok(), value ? *value : Value());
    }
    case ExprNode::Kind::STAR:
      break;
    case ExprNode::Kind::OP:
      return eval_op(node, record, aggregates);
    case ExprNode::Kind::CALL: {
      if (node.slot >= 0) {
        if (aggregates == nullptr || static_cast<size_t>(node.slot) >= aggregates->size()) {
          return std::make_tuple(common::Status::BadData("aggregate value is not available"), Value());
        }
        return std::make_tuple(common::Status::Ok(), aggregates->at(static_cast<size_t>(node.slot)));
      }
      std::vector<Value> args;
      for (const auto& arg: node.args) {
        common::Status status;
        Value value;
        std::tie(status, value) = eval_node(*arg, record, aggregates);
        if (!status.IsOk()) {
          return std::make_tuple(status, Value());
        }
        args.push_back(value);
      }
      try {
        return std::make_tuple(common::Status::Ok(), node.fn(args));
      } catch (const std::exception& e) {
        return std::make_tuple(common::Status::BadData(e.what()), Value());
      }
    }
  }
  return std::make_tuple(common::Status::Internal("bad expression node"), Value());
}

}  // namespace

void merge_properties(std::vector<PropertyPath>* dest, const std::vector<PropertyPath>& src) {
  for (const auto& path: src) {
    if (std::find(dest->begin(), dest->end(), path) == dest->end()) {
      dest->push_back(path);
    }
  }
}

Expression::Expression(std::shared_ptr<const CompiledNode> root,
                       std::vector<PropertyPath>&& used,
                       std::vector<AggregateCall>&& calls,
                       std::string&& text)
    : root_(root)
      , used_(std::move(used))
      , calls_(std::move(calls))
      , text_(std::move(text)) { }

ExpressionPtr Expression::compile(ExprNodePtr node, FunctionRegistry const& udfs) {
  if (!node) {
    throw QueryConfigError("empty expression");
  }
  Compiler compiler(udfs);
  std::string text;
  auto root = compiler.compile(node, &text);
  return std::make_shared<Expression>(root, std::move(compiler.used), std::move(compiler.calls), std::move(text));
}

std::tuple<common::Status, Value> Expression::eval(const Record& record, const std::vector<Value>* aggregates) const {
  return eval_node(*root_, record, aggregates);
}

bool Expression::is_property() const {
  return root_->kind == ExprNode::Kind::PROPERTY;
}

std::string Expression::to_string() const {
  return text_;
}

}  // namespace qp
}  // namespace streamql
