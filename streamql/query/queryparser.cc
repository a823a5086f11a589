/*!
 * \file queryparser.cc
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

#include <set>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "streamql/common/datetime.h"
#include "streamql/common/logging.h"

namespace streamql {
namespace qp {

using boost::property_tree::ptree;

static const std::set<std::string> UNARY_OPS = {"not", "neg"};

static const std::set<std::string> BINARY_OPS = {
  "+", "-", "*", "/", "%", "=", "!=", "<", "<=", ">", ">=",
};

static const std::set<std::string> LOGIC_OPS = {"and", "or"};

static common::Status parse_error(const std::string& msg, ErrorMsg* error_msg) {
  *error_msg = msg;
  return common::Status::QueryParsingError(msg);
}

static common::Status parse_query_impl(ptree const& node, QueryPtr* result, ErrorMsg* error_msg);

static common::Status parse_expr_impl(ptree const& node, ExprNodePtr* result, ErrorMsg* error_msg);

static common::Status parse_expr_list(ptree const& list, std::vector<ExprNodePtr>* result, ErrorMsg* error_msg) {
  for (const auto& child: list) {
    ExprNodePtr expr;
    CHECK_STATUS(parse_expr_impl(child.second, &expr, error_msg));
    result->push_back(expr);
  }
  return common::Status::Ok();
}

static common::Status parse_expr_impl(ptree const& node, ExprNodePtr* result, ErrorMsg* error_msg) {
  if (node.empty()) {
    return parse_error("expression object expected, got `" + node.data() + "`", error_msg);
  }
  if (auto prop = node.get_child_optional("prop")) {
    auto path = prop->get_value<std::string>();
    if (split_path(path).empty()) {
      return parse_error("empty property path", error_msg);
    }
    *result = ExprNode::make_property(path);
    return common::Status::Ok();
  }
  if (auto num = node.get_child_optional("num")) {
    auto value = num->get_value_optional<double>();
    if (!value) {
      return parse_error("number literal expected, got `" + num->data() + "`", error_msg);
    }
    *result = ExprNode::make_literal(Value(*value));
    return common::Status::Ok();
  }
  if (auto str = node.get_child_optional("str")) {
    *result = ExprNode::make_literal(Value(str->get_value<std::string>()));
    return common::Status::Ok();
  }
  if (auto flag = node.get_child_optional("bool")) {
    auto value = flag->get_value_optional<bool>();
    if (!value) {
      return parse_error("boolean literal expected, got `" + flag->data() + "`", error_msg);
    }
    *result = ExprNode::make_literal(Value(*value));
    return common::Status::Ok();
  }
  if (node.get_child_optional("null")) {
    *result = ExprNode::make_literal(Value());
    return common::Status::Ok();
  }
  if (node.get_child_optional("star")) {
    *result = ExprNode::make_star();
    return common::Status::Ok();
  }
  std::vector<ExprNodePtr> args;
  if (auto list = node.get_child_optional("args")) {
    CHECK_STATUS(parse_expr_list(*list, &args, error_msg));
  }
  if (auto op = node.get_child_optional("op")) {
    auto name = boost::algorithm::to_lower_copy(op->get_value<std::string>());
    if (UNARY_OPS.count(name)) {
      if (args.size() != 1) {
        return parse_error("operator `" + name + "` takes one argument", error_msg);
      }
    } else if (BINARY_OPS.count(name)) {
      if (args.size() != 2) {
        return parse_error("operator `" + name + "` takes two arguments", error_msg);
      }
    } else if (LOGIC_OPS.count(name)) {
      if (args.size() < 2) {
        return parse_error("operator `" + name + "` takes at least two arguments", error_msg);
      }
    } else {
      return parse_error("unknown operator `" + name + "`", error_msg);
    }
    *result = ExprNode::make_op(name, std::move(args));
    return common::Status::Ok();
  }
  if (auto fn = node.get_child_optional("fn")) {
    auto name = fn->get_value<std::string>();
    if (name.empty()) {
      return parse_error("empty function name", error_msg);
    }
    *result = ExprNode::make_call(name, std::move(args));
    return common::Status::Ok();
  }
  return parse_error("unknown expression kind", error_msg);
}

static common::Status parse_window(ptree const& node, WindowSpec* window, ErrorMsg* error_msg) {
  auto fn = boost::algorithm::to_lower_copy(node.get<std::string>("fn", ""));
  if (fn == "length") {
    auto size = node.get_optional<u64>("size");
    if (!size || *size == 0) {
      return parse_error("length window requires positive `size`", error_msg);
    }
    window->kind = WindowKind::LENGTH;
    window->size = *size;
  } else if (fn == "time") {
    auto text = node.get<std::string>("duration", "");
    try {
      window->duration = DateTimeUtil::parse_duration(text.data(), text.size());
    } catch (const BadDateTimeFormat& e) {
      return parse_error("bad window duration `" + text + "`: " + e.what(), error_msg);
    }
    if (window->duration == 0) {
      return parse_error("time window requires positive `duration`", error_msg);
    }
    window->kind = WindowKind::TIME;
  } else {
    return parse_error("unknown window function `" + fn + "`", error_msg);
  }
  return common::Status::Ok();
}

static common::Status parse_source(ptree const& node, SourceNode* source, ErrorMsg* error_msg) {
  if (auto sub = node.get_child_optional("query")) {
    QueryPtr query;
    CHECK_STATUS(parse_query_impl(*sub, &query, error_msg));
    source->query = query;
  } else {
    source->stream = node.get<std::string>("stream", "");
    if (source->stream.empty()) {
      return parse_error("source requires `stream` or `query`", error_msg);
    }
  }
  if (auto window = node.get_child_optional("window")) {
    CHECK_STATUS(parse_window(*window, &source->window, error_msg));
  }
  return common::Status::Ok();
}

static common::Status parse_fields(ptree const& list, std::vector<FieldNode>* fields, ErrorMsg* error_msg) {
  for (const auto& child: list) {
    FieldNode field;
    if (child.second.empty()) {
      if (child.second.data() != "*") {
        return parse_error("select item must be `*` or an object", error_msg);
      }
      field.star = true;
    } else {
      auto expr = child.second.get_child_optional("expr");
      if (!expr) {
        return parse_error("select item requires `expr`", error_msg);
      }
      CHECK_STATUS(parse_expr_impl(*expr, &field.expr, error_msg));
      field.alias = child.second.get<std::string>("as", "");
    }
    fields->push_back(field);
  }
  if (fields->empty()) {
    return parse_error("empty select list", error_msg);
  }
  return common::Status::Ok();
}

static common::Status parse_joins(ptree const& list, std::vector<JoinNode>* joins, ErrorMsg* error_msg) {
  for (const auto& child: list) {
    JoinNode join;
    auto from = child.second.get_child_optional("from");
    if (!from) {
      return parse_error("join requires `from`", error_msg);
    }
    CHECK_STATUS(parse_source(*from, &join.source, error_msg));
    auto on = child.second.get_child_optional("on");
    if (!on || on->empty()) {
      return parse_error("join requires non-empty `on`", error_msg);
    }
    for (const auto& item: *on) {
      JoinKey key;
      auto left = item.second.get_child_optional("left");
      auto right = item.second.get_child_optional("right");
      if (!left || !right) {
        return parse_error("join key requires `left` and `right`", error_msg);
      }
      CHECK_STATUS(parse_expr_impl(*left, &key.left, error_msg));
      CHECK_STATUS(parse_expr_impl(*right, &key.right, error_msg));
      join.on.push_back(key);
    }
    join.alias = child.second.get<std::string>("as", "");
    joins->push_back(join);
  }
  return common::Status::Ok();
}

static common::Status parse_query_impl(ptree const& node, QueryPtr* result, ErrorMsg* error_msg) {
  auto query = std::make_shared<Query>();
  try {
    auto select = node.get_child_optional("select");
    if (!select) {
      return parse_error("query requires `select`", error_msg);
    }
    CHECK_STATUS(parse_fields(*select, &query->fields, error_msg));

    auto from = node.get_child_optional("from");
    if (!from) {
      return parse_error("query requires `from`", error_msg);
    }
    CHECK_STATUS(parse_source(*from, &query->source, error_msg));

    if (auto joins = node.get_child_optional("join")) {
      CHECK_STATUS(parse_joins(*joins, &query->joins, error_msg));
    }
    if (auto where = node.get_child_optional("where")) {
      CHECK_STATUS(parse_expr_impl(*where, &query->where, error_msg));
    }
    if (auto group = node.get_child_optional("group")) {
      query->group = std::make_shared<GroupNode>();
      if (auto by = group->get_child_optional("by")) {
        CHECK_STATUS(parse_expr_list(*by, &query->group->fields, error_msg));
      }
      if (auto having = group->get_child_optional("having")) {
        CHECK_STATUS(parse_expr_impl(*having, &query->group->having, error_msg));
      }
    }
    if (auto unions = node.get_child_optional("union")) {
      for (const auto& child: *unions) {
        UnionNode item;
        item.all = child.second.get<bool>("all", false);
        auto sub = child.second.get_child_optional("query");
        if (!sub) {
          return parse_error("union requires `query`", error_msg);
        }
        CHECK_STATUS(parse_query_impl(*sub, &item.query, error_msg));
        query->unions.push_back(item);
      }
    }
    query->distinct = node.get<bool>("distinct", false);
    if (auto limit = node.get_optional<u64>("limit")) {
      query->has_limit = true;
      query->limit = *limit;
    }
  } catch (const boost::property_tree::ptree_error& e) {
    return parse_error(e.what(), error_msg);
  }
  *result = query;
  return common::Status::Ok();
}

std::tuple<common::Status, ptree, ErrorMsg> QueryParser::parse_json(const char* query) {
  ptree tree;
  ErrorMsg error_msg;
  std::stringstream stream;
  stream << query;
  try {
    boost::property_tree::json_parser::read_json(stream, tree);
  } catch (const boost::property_tree::json_parser_error& e) {
    error_msg = e.what();
    LOG(ERROR) << "Query parsing error: " << error_msg;
    return std::make_tuple(common::Status::QueryParsingError(error_msg), tree, error_msg);
  }
  return std::make_tuple(common::Status::Ok(), tree, error_msg);
}

std::tuple<common::Status, QueryPtr, ErrorMsg> QueryParser::parse_query(ptree const& node) {
  QueryPtr query;
  ErrorMsg error_msg;
  auto status = parse_query_impl(node, &query, &error_msg);
  if (!status.IsOk()) {
    LOG(ERROR) << "Invalid query: " << error_msg;
    query.reset();
  }
  return std::make_tuple(status, query, error_msg);
}

std::tuple<common::Status, QueryPtr, ErrorMsg> QueryParser::parse_query(const char* query) {
  common::Status status;
  ptree tree;
  ErrorMsg error_msg;
  std::tie(status, tree, error_msg) = parse_json(query);
  if (!status.IsOk()) {
    return std::make_tuple(status, QueryPtr(), error_msg);
  }
  return parse_query(tree);
}

std::tuple<common::Status, ExprNodePtr, ErrorMsg> QueryParser::parse_expression(ptree const& node) {
  ExprNodePtr expr;
  ErrorMsg error_msg;
  common::Status status;
  try {
    status = parse_expr_impl(node, &expr, &error_msg);
  } catch (const boost::property_tree::ptree_error& e) {
    status = parse_error(e.what(), &error_msg);
  }
  return std::make_tuple(status, expr, error_msg);
}

}  // namespace qp
}  // namespace streamql
