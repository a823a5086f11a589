/*!
 * \file ast.h
 * Parsed query representation. Produced by QueryParser, consumed by Select.
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
#ifndef STREAMQL_QUERY_AST_H_
#define STREAMQL_QUERY_AST_H_

#include <memory>
#include <string>
#include <vector>

#include "streamql/common/types.h"
#include "streamql/record/value.h"

namespace streamql {
namespace qp {

struct ExprNode;
struct Query;

typedef std::shared_ptr<const ExprNode> ExprNodePtr;
typedef std::shared_ptr<const Query>    QueryPtr;

//! Expression tree node
struct ExprNode {
  enum class Kind {
    LITERAL,   //! constant value
    PROPERTY,  //! record property path
    STAR,      //! `*`, only valid as function argument (count(*))
    OP,        //! operator application
    CALL,      //! function call, scalar or aggregate
  };

  Kind                     kind;
  Value                    literal;
  PropertyPath             path;
  //! Operator or function name
  std::string              name;
  std::vector<ExprNodePtr> args;

  ExprNode() : kind(Kind::LITERAL) { }

  static ExprNodePtr make_literal(Value value);
  static ExprNodePtr make_property(const std::string& path);
  static ExprNodePtr make_star();
  static ExprNodePtr make_op(const std::string& op, std::vector<ExprNodePtr> args);
  static ExprNodePtr make_call(const std::string& fn, std::vector<ExprNodePtr> args);
};

//! One entry of the select list
struct FieldNode {
  //! `*` projection
  bool        star;
  ExprNodePtr expr;
  //! Output name, empty if not aliased
  std::string alias;

  FieldNode() : star(false) { }
};

enum class WindowKind {
  NONE,
  LENGTH,
  TIME,
};

struct WindowSpec {
  WindowKind kind;
  //! Number of records, LENGTH only
  u64        size;
  //! Nanoseconds, TIME only
  u64        duration;

  WindowSpec() : kind(WindowKind::NONE), size(0), duration(0) { }
};

//! Where records come from: named stream or nested query
struct SourceNode {
  std::string stream;
  QueryPtr    query;
  WindowSpec  window;

  bool is_subquery() const { return static_cast<bool>(query); }
};

struct JoinKey {
  //! Evaluated against records coming from the left (upstream) side
  ExprNodePtr left;
  //! Evaluated against records coming from the joined source
  ExprNodePtr right;
};

struct JoinNode {
  SourceNode           source;
  std::vector<JoinKey> on;
  //! Name the right record is nested under, empty to merge fields
  std::string          alias;
};

struct UnionNode {
  bool     all;
  QueryPtr query;

  UnionNode() : all(false) { }
};

struct GroupNode {
  std::vector<ExprNodePtr> fields;
  ExprNodePtr              having;
};

struct Query {
  std::vector<FieldNode>     fields;
  ExprNodePtr                where;
  std::shared_ptr<GroupNode> group;
  std::vector<JoinNode>      joins;
  std::vector<UnionNode>     unions;
  bool                       distinct;
  bool                       has_limit;
  u64                        limit;
  SourceNode                 source;

  Query() : distinct(false), has_limit(false), limit(0) { }
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_AST_H_
