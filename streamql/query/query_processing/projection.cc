/*!
 * \file projection.cc
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
#include "streamql/query/query_processing/projection.h"

#include "streamql/common/logging.h"
#include "streamql/query/errors.h"

namespace streamql {
namespace qp {

Projection::Projection(const ResolvedFields& fields)
    : fields_(fields) {
  if (fields_.aggregate_) {
    throw QueryConfigError("projection can't compute aggregate functions");
  }
}

common::Status Projection::project(const RecordPtr& record, RecordPtr* result) const {
  Record output;
  for (const auto& field: fields_.fields_) {
    if (field.star_) {
      for (const auto& kv: *record) {
        output.set(kv.first, kv.second);
      }
      continue;
    }
    common::Status status;
    Value value;
    std::tie(status, value) = field.expr_->eval(*record);
    if (!status.IsOk()) {
      LOG(WARNING) << "field `" << field.name_ << "` can't be computed for record " << *record
                   << ", " << status.ToString();
      return status;
    }
    output.set(field.name_, value);
  }
  *result = make_record(std::move(output));
  return common::Status::Ok();
}

void Projection::insert(const RecordPtr& record) {
  RecordPtr output;
  if (project(record, &output).IsOk()) {
    emit_insert(output);
  }
}

void Projection::remove(const RecordPtr& record) {
  RecordPtr output;
  if (project(record, &output).IsOk()) {
    emit_remove(output);
  }
}

void Projection::insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
  RecordPtr new_output, old_output;
  bool new_ok = project(inserted, &new_output).IsOk();
  bool old_ok = project(removed, &old_output).IsOk();
  if (new_ok && old_ok) {
    emit_insert_remove(new_output, old_output);
  } else if (new_ok) {
    emit_insert(new_output);
  } else if (old_ok) {
    emit_remove(old_output);
  }
}

}  // namespace qp
}  // namespace streamql
