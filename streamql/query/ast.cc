/*!
 * \file ast.cc
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
#include "streamql/query/ast.h"

namespace streamql {
namespace qp {

ExprNodePtr ExprNode::make_literal(Value value) {
  auto node = std::make_shared<ExprNode>();
  node->kind = Kind::LITERAL;
  node->literal = std::move(value);
  return node;
}

ExprNodePtr ExprNode::make_property(const std::string& path) {
  auto node = std::make_shared<ExprNode>();
  node->kind = Kind::PROPERTY;
  node->path = split_path(path);
  return node;
}

ExprNodePtr ExprNode::make_star() {
  auto node = std::make_shared<ExprNode>();
  node->kind = Kind::STAR;
  return node;
}

ExprNodePtr ExprNode::make_op(const std::string& op, std::vector<ExprNodePtr> args) {
  auto node = std::make_shared<ExprNode>();
  node->kind = Kind::OP;
  node->name = op;
  node->args = std::move(args);
  return node;
}

ExprNodePtr ExprNode::make_call(const std::string& fn, std::vector<ExprNodePtr> args) {
  auto node = std::make_shared<ExprNode>();
  node->kind = Kind::CALL;
  node->name = fn;
  node->args = std::move(args);
  return node;
}

}  // namespace qp
}  // namespace streamql
