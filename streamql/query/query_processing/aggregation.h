/*!
 * \file aggregation.h
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
#ifndef STREAMQL_QUERY_QUERY_PROCESSING_AGGREGATION_H_
#define STREAMQL_QUERY_QUERY_PROCESSING_AGGREGATION_H_

#include <memory>
#include <vector>

#include "streamql/common/config.h"
#include "streamql/query/ast.h"
#include "streamql/query/field_resolver.h"
#include "streamql/query/query_processing/aggregate_function.h"
#include "streamql/query/stage_framework.h"
#include "streamql/record/containers.h"

namespace streamql {
namespace qp {

/** Incremental group-by.
 * Every group keeps its own aggregate function instances, one per aggregate
 * call of every select list field and of `having`. The group row is rendered
 * after each change and emitted only if it differs from the previous one:
 * first row is an insert, a changed row is one insert_remove, a row that
 * disappears (last member removed or `having` no longer holds) is a remove.
 * Plain fields are evaluated against the record that caused the change.
 */
struct Aggregation : Stage {
  struct Group {
    //! Indexed by expression, then by aggregate call
    std::vector<std::vector<std::unique_ptr<AggregateFunction>>> functions_;
    u64                                                          members_;
    //! Last emitted row, null if nothing is emitted
    RecordPtr                                                    row_;

    Group() : members_(0) { }
  };

  ResolvedFields                    fields_;
  std::vector<ExpressionPtr>        keys_;
  //! One per select list field (null for `*`), then `having` if present
  std::vector<ExpressionPtr>        exprs_;
  bool                              has_having_;
  NanPolicy                         policy_;
  ValueMap<std::unique_ptr<Group>>  groups_;

  /** Build aggregation stage.
   * @param group is a group clause, can be null (single group)
   * @throw QueryConfigError on unknown aggregate or wrong arity
   */
  Aggregation(const ResolvedFields& fields,
              std::shared_ptr<const GroupNode> group,
              const FunctionRegistry& udfs,
              NanPolicy policy);

  virtual void insert(const RecordPtr& record);

  virtual void remove(const RecordPtr& record);

  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed);

  virtual const char* name() const { return "aggregation"; }

  size_t size() const { return groups_.size(); }

 private:
  std::unique_ptr<Group> make_group() const;

  bool group_key(const Record& record, Value* key) const;

  void fold(Group* group, const Record& record, bool insert);

  RecordPtr render(const Group& group, const Record& record) const;

  //! Render the group after a change, emit the difference, drop empty group
  void update(const Value& key, Group* group, const Record& record);
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_QUERY_PROCESSING_AGGREGATION_H_
