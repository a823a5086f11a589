/*!
 * \file filter.cc
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
#include "streamql/query/query_processing/filter.h"

#include "streamql/common/logging.h"
#include "streamql/query/errors.h"

namespace streamql {
namespace qp {

Filter::Filter(ExpressionPtr condition)
    : condition_(condition) {
  if (condition_->is_aggregate()) {
    throw QueryConfigError("where clause can't call aggregate function: " + condition_->to_string());
  }
}

Filter::Result Filter::check(const RecordPtr& record) const {
  common::Status status;
  Value value;
  std::tie(status, value) = condition_->eval(*record);
  if (!status.IsOk()) {
    LOG(WARNING) << "filter " << condition_->to_string() << " skips record " << *record
                 << ", " << status.ToString();
    return FAILED;
  }
  return value.truthy() ? PASS : REJECT;
}

void Filter::insert(const RecordPtr& record) {
  if (check(record) == PASS) {
    emit_insert(record);
  }
}

void Filter::remove(const RecordPtr& record) {
  if (check(record) == PASS) {
    emit_remove(record);
  }
}

void Filter::insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
  bool new_pass = check(inserted) == PASS;
  bool old_pass = check(removed) == PASS;
  if (new_pass && old_pass) {
    emit_insert_remove(inserted, removed);
  } else if (new_pass) {
    emit_insert(inserted);
  } else if (old_pass) {
    emit_remove(removed);
  }
}

}  // namespace qp
}  // namespace streamql
