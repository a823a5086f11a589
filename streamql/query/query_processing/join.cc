/*!
 * \file join.cc
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
#include "streamql/query/query_processing/join.h"

#include <algorithm>

#include "streamql/common/logging.h"
#include "streamql/query/errors.h"
#include "streamql/query/query_processing/repeater.h"
#include "streamql/query/query_processing/source.h"
#include "streamql/query/select.h"

namespace streamql {
namespace qp {

void JoinInput::insert(const RecordPtr& record) {
  if (owner_) {
    owner_->insert_side(Join::RIGHT, record);
  }
}

void JoinInput::remove(const RecordPtr& record) {
  if (owner_) {
    owner_->remove_side(Join::RIGHT, record);
  }
}

static ExpressionPtr compile_key(const ExprNodePtr& node, const FunctionRegistry& udfs) {
  auto expr = Expression::compile(node, udfs);
  if (expr->is_aggregate()) {
    throw QueryConfigError("join key can't call aggregate function: " + expr->to_string());
  }
  return expr;
}

Join::Join(Context& ctx, const JoinNode& spec, StagePtr root, bool first)
    : alias_(spec.alias)
      , first_(first) {
  if (spec.on.empty()) {
    throw QueryConfigError("join requires at least one key");
  }
  for (const auto& key: spec.on) {
    left_.keys_.push_back(compile_key(key.left, ctx.functions()));
    right_.keys_.push_back(compile_key(key.right, ctx.functions()));
  }
  input_ = std::make_shared<JoinInput>(this);
  StagePtr tail;
  if (spec.source.is_subquery()) {
    source_ = std::make_shared<Select>(ctx, spec.source.query);
    tail = source_;
  } else {
    stream_ = std::make_shared<StreamSource>(ctx, spec.source.stream);
    source_ = stream_;
    tail = source_;
    if (spec.source.window.kind != WindowKind::NONE) {
      tail = tail->pass(make_repeater(ctx, spec.source.window));
    }
  }
  tail->pass(input_);
  if (root) {
    root->bind_lifetime(source_);
  }
  LOG(INFO) << "join" << (first_ ? " (first)" : "") << " with "
            << (spec.source.is_subquery() ? "sub-query" : "stream `" + spec.source.stream + "`")
            << ", " << spec.on.size() << " key(s)";
}

Join::~Join() {
  input_->owner_ = nullptr;
  source_->stop();
}

void Join::start() {
  if (stream_) {
    stream_->start();
  }
}

void Join::stop() {
  source_->stop();
  Stage::stop();
}

void Join::insert(const RecordPtr& record) {
  insert_side(LEFT, record);
}

void Join::remove(const RecordPtr& record) {
  remove_side(LEFT, record);
}

bool Join::key(const Side& side, const Record& record, Value* result) const {
  Array values;
  for (const auto& expr: side.keys_) {
    common::Status status;
    Value value;
    std::tie(status, value) = expr->eval(record);
    if (!status.IsOk()) {
      LOG(WARNING) << "join key " << expr->to_string() << " can't be evaluated, "
                   << status.ToString() << ", record " << record;
      return false;
    }
    if (value.is_null()) {
      return false;
    }
    values.push_back(value);
  }
  *result = Value(std::move(values));
  return true;
}

RecordPtr Join::combine(const RecordPtr& left, const RecordPtr& right) const {
  Record result = *left;
  if (!alias_.empty()) {
    result.set(alias_, Value(right));
  } else {
    for (const auto& field: *right) {
      if (!result.has(field.first)) {
        result.set(field.first, field.second);
      }
    }
  }
  return make_record(std::move(result));
}

void Join::insert_side(SideId side, const RecordPtr& record) {
  Side& own = side == LEFT ? left_ : right_;
  Side& other = side == LEFT ? right_ : left_;
  Value k;
  if (!key(own, *record, &k)) {
    return;
  }
  auto it = other.index_.find(k);
  if (it != other.index_.end()) {
    auto matches = it->second;
    for (const auto& match: matches) {
      emit_insert(side == LEFT ? combine(record, match) : combine(match, record));
    }
  }
  own.index_[k].push_back(record);
}

void Join::remove_side(SideId side, const RecordPtr& record) {
  Side& own = side == LEFT ? left_ : right_;
  Side& other = side == LEFT ? right_ : left_;
  Value k;
  if (!key(own, *record, &k)) {
    return;
  }
  if (own.index_.find(k) == own.index_.end()) {
    return;
  }
  auto& records = own.index_[k];
  auto pos = std::find(records.begin(), records.end(), record);
  if (pos == records.end()) {
    pos = std::find_if(records.begin(), records.end(),
                       [&record](const RecordPtr& item) { return *item == *record; });
  }
  if (pos == records.end()) {
    // never indexed, nothing was matched
    return;
  }
  auto removed = *pos;
  records.erase(pos);
  if (records.empty()) {
    own.index_.erase(k);
  }
  auto it = other.index_.find(k);
  if (it != other.index_.end()) {
    auto matches = it->second;
    for (const auto& match: matches) {
      emit_remove(side == LEFT ? combine(removed, match) : combine(match, removed));
    }
  }
}

size_t Join::size(SideId side) const {
  const Side& own = side == LEFT ? left_ : right_;
  size_t total = 0;
  for (const auto& kv: own.index_) {
    total += kv.second.size();
  }
  return total;
}

}  // namespace qp
}  // namespace streamql
