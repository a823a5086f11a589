/*!
 * \file field_resolver.h
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
#ifndef STREAMQL_QUERY_FIELD_RESOLVER_H_
#define STREAMQL_QUERY_FIELD_RESOLVER_H_

#include <string>
#include <vector>

#include "streamql/query/ast.h"
#include "streamql/query/expression.h"
#include "streamql/query/functions.h"

namespace streamql {
namespace qp {

struct ResolvedField {
  //! `*`, expr_ is not set
  bool          star_;
  ExpressionPtr expr_;
  //! Output field name
  std::string   name_;

  ResolvedField() : star_(false) { }
};

//! Select list in output order
struct ResolvedFields {
  std::vector<ResolvedField> fields_;
  //! At least one field is `*`
  bool                       star_;
  //! At least one field calls an aggregate function
  bool                       aggregate_;

  ResolvedFields() : star_(false), aggregate_(false) { }

  //! Used properties of all non-star fields
  std::vector<PropertyPath> used_properties() const;
};

/** Compile the select list.
 * Output name is the alias, or the last path segment for plain properties,
 * or the expression text.
 * @throw QueryConfigError if a field can't be compiled
 */
ResolvedFields resolve_fields(const Query& query, const FunctionRegistry& udfs);

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_FIELD_RESOLVER_H_
