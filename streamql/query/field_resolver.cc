/*!
 * \file field_resolver.cc
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
#include "streamql/query/field_resolver.h"

namespace streamql {
namespace qp {

std::vector<PropertyPath> ResolvedFields::used_properties() const {
  std::vector<PropertyPath> result;
  for (const auto& field: fields_) {
    if (!field.star_) {
      merge_properties(&result, field.expr_->used_properties());
    }
  }
  return result;
}

ResolvedFields resolve_fields(const Query& query, const FunctionRegistry& udfs) {
  ResolvedFields result;
  for (const auto& node: query.fields) {
    ResolvedField field;
    if (node.star) {
      field.star_ = true;
      field.name_ = "*";
      result.star_ = true;
    } else {
      field.expr_ = Expression::compile(node.expr, udfs);
      if (!node.alias.empty()) {
        field.name_ = node.alias;
      } else if (field.expr_->is_property()) {
        field.name_ = node.expr->path.back();
      } else {
        field.name_ = field.expr_->to_string();
      }
      result.aggregate_ = result.aggregate_ || field.expr_->is_aggregate();
    }
    result.fields_.push_back(field);
  }
  return result;
}

}  // namespace qp
}  // namespace streamql
