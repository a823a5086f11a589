/*!
 * \file expression.h
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
#ifndef STREAMQL_QUERY_EXPRESSION_H_
#define STREAMQL_QUERY_EXPRESSION_H_

#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include "streamql/common/status.h"
#include "streamql/query/ast.h"
#include "streamql/query/functions.h"
#include "streamql/record/value.h"

namespace streamql {
namespace qp {

struct CompiledNode;
class Expression;

typedef std::shared_ptr<const Expression> ExpressionPtr;

//! Aggregate function call found inside an expression
struct AggregateCall {
  //! Lower-case function name
  std::string                name;
  std::vector<ExpressionPtr> args;
  //! Set for `count(*)`
  bool                       star;

  AggregateCall() : star(false) { }
};

/** Compiled scalar expression.
 * Evaluates against a record and reports the property paths it reads.
 * Aggregate calls are numbered in the order they appear; their current values
 * are supplied by the caller (the aggregation stage).
 */
class Expression {
 public:
  /** Compile expression tree.
   * @param node is an expression tree
   * @param udfs is a set of user-defined functions that can be called
   * @throw QueryConfigError on unknown function, wrong arity or nested aggregates
   */
  static ExpressionPtr compile(ExprNodePtr node, FunctionRegistry const& udfs);

  /** Evaluate expression.
   * @param record is an input record
   * @param aggregates is a list of aggregate call values, one per aggregate_calls() item
   * @return status and value, missing properties evaluate to null
   */
  std::tuple<common::Status, Value> eval(const Record& record,
                                         const std::vector<Value>* aggregates = nullptr) const;

  //! Ordered, deduplicated list of property paths the expression reads
  const std::vector<PropertyPath>& used_properties() const { return used_; }

  //! True if expression contains an aggregate function call
  bool is_aggregate() const { return !calls_.empty(); }

  const std::vector<AggregateCall>& aggregate_calls() const { return calls_; }

  //! True if expression is a plain property reference
  bool is_property() const;

  //! Human readable form, used to name unaliased fields
  std::string to_string() const;

  Expression(const Expression&) = delete;
  Expression& operator = (const Expression&) = delete;

  Expression(std::shared_ptr<const CompiledNode> root,
             std::vector<PropertyPath>&& used,
             std::vector<AggregateCall>&& calls,
             std::string&& text);

 private:
  std::shared_ptr<const CompiledNode> root_;
  std::vector<PropertyPath>           used_;
  std::vector<AggregateCall>          calls_;
  std::string                         text_;
};

//! Add paths from `src` that are not already in `dest`, keeping order
void merge_properties(std::vector<PropertyPath>* dest, const std::vector<PropertyPath>& src);

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_EXPRESSION_H_
