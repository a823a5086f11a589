/*!
 * \file aggregation.cc
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
#include "streamql/query/query_processing/aggregation.h"

#include "streamql/common/logging.h"
#include "streamql/query/errors.h"

namespace streamql {
namespace qp {

Aggregation::Aggregation(const ResolvedFields& fields,
                         std::shared_ptr<const GroupNode> group,
                         const FunctionRegistry& udfs,
                         NanPolicy policy)
    : fields_(fields)
      , has_having_(false)
      , policy_(policy) {
  for (const auto& field: fields_.fields_) {
    exprs_.push_back(field.star_ ? ExpressionPtr() : field.expr_);
  }
  if (group) {
    for (const auto& node: group->fields) {
      auto key = Expression::compile(node, udfs);
      if (key->is_aggregate()) {
        throw QueryConfigError("can't group by aggregate function: " + key->to_string());
      }
      keys_.push_back(key);
    }
    if (group->having) {
      exprs_.push_back(Expression::compile(group->having, udfs));
      has_having_ = true;
    }
  }
  // fails early on unknown functions and wrong arity
  make_group();
  LOG(INFO) << "aggregation by " << keys_.size() << " key(s), nan policy " << to_string(policy_);
}

std::unique_ptr<Aggregation::Group> Aggregation::make_group() const {
  std::unique_ptr<Group> group(new Group());
  for (const auto& expr: exprs_) {
    std::vector<std::unique_ptr<AggregateFunction>> functions;
    if (expr) {
      for (const auto& call: expr->aggregate_calls()) {
        functions.push_back(create_aggregate_function(call, policy_));
      }
    }
    group->functions_.push_back(std::move(functions));
  }
  return group;
}

bool Aggregation::group_key(const Record& record, Value* key) const {
  Array values;
  for (const auto& expr: keys_) {
    common::Status status;
    Value value;
    std::tie(status, value) = expr->eval(record);
    if (!status.IsOk()) {
      LOG(WARNING) << "group key " << expr->to_string() << " can't be evaluated for record "
                   << record << ", " << status.ToString();
      return false;
    }
    values.push_back(value);
  }
  *key = Value(std::move(values));
  return true;
}

void Aggregation::fold(Group* group, const Record& record, bool insert) {
  for (auto& functions: group->functions_) {
    for (auto& fn: functions) {
      if (insert) {
        fn->insert(record);
      } else {
        fn->remove(record);
      }
    }
  }
}

RecordPtr Aggregation::render(const Group& group, const Record& record) const {
  auto values = [&group](size_t ix) {
    std::vector<Value> result;
    for (const auto& fn: group.functions_[ix]) {
      result.push_back(fn->value());
    }
    return result;
  };
  if (has_having_) {
    auto ix = exprs_.size() - 1;
    auto aggregates = values(ix);
    common::Status status;
    Value value;
    std::tie(status, value) = exprs_[ix]->eval(record, &aggregates);
    if (!status.IsOk()) {
      LOG(WARNING) << "having " << exprs_[ix]->to_string() << " can't be evaluated, " << status.ToString();
      return RecordPtr();
    }
    if (!value.truthy()) {
      return RecordPtr();
    }
  }
  Record row;
  for (size_t ix = 0; ix < fields_.fields_.size(); ix++) {
    const auto& field = fields_.fields_[ix];
    if (field.star_) {
      for (const auto& kv: record) {
        row.set(kv.first, kv.second);
      }
      continue;
    }
    auto aggregates = values(ix);
    common::Status status;
    Value value;
    std::tie(status, value) = field.expr_->eval(record, &aggregates);
    if (!status.IsOk()) {
      LOG(WARNING) << "field `" << field.name_ << "` can't be computed, " << status.ToString();
      value = Value();
    }
    row.set(field.name_, value);
  }
  return make_record(std::move(row));
}

void Aggregation::update(const Value& key, Group* group, const Record& record) {
  auto old_row = group->row_;
  RecordPtr new_row;
  if (group->members_ != 0) {
    new_row = render(*group, record);
  }
  group->row_ = new_row;
  if (group->members_ == 0) {
    groups_.erase(key);
  }
  if (old_row && new_row) {
    if (*old_row != *new_row) {
      emit_insert_remove(new_row, old_row);
    }
  } else if (new_row) {
    emit_insert(new_row);
  } else if (old_row) {
    emit_remove(old_row);
  }
}

void Aggregation::insert(const RecordPtr& record) {
  Value key;
  if (!group_key(*record, &key)) {
    return;
  }
  if (groups_.find(key) == groups_.end()) {
    groups_[key] = make_group();
  }
  Group* group = groups_.find(key)->second.get();
  fold(group, *record, true);
  group->members_++;
  update(key, group, *record);
}

void Aggregation::remove(const RecordPtr& record) {
  Value key;
  if (!group_key(*record, &key)) {
    return;
  }
  auto it = groups_.find(key);
  if (it == groups_.end()) {
    LOG(WARNING) << "aggregation: remove from unknown group " << key;
    return;
  }
  Group* group = it->second.get();
  fold(group, *record, false);
  group->members_--;
  update(key, group, *record);
}

void Aggregation::insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
  Value new_key, old_key;
  if (group_key(*inserted, &new_key) && group_key(*removed, &old_key) && new_key == old_key) {
    auto it = groups_.find(new_key);
    if (it != groups_.end()) {
      // same group, one transition
      Group* group = it->second.get();
      fold(group, *removed, false);
      fold(group, *inserted, true);
      update(new_key, group, *inserted);
      return;
    }
  }
  remove(removed);
  insert(inserted);
}

}  // namespace qp
}  // namespace streamql
