/*!
 * \file projection.h
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
#ifndef STREAMQL_QUERY_QUERY_PROCESSING_PROJECTION_H_
#define STREAMQL_QUERY_QUERY_PROCESSING_PROJECTION_H_

#include "streamql/common/status.h"
#include "streamql/query/field_resolver.h"
#include "streamql/query/stage_framework.h"

namespace streamql {
namespace qp {

/** Computes output records from the select list.
 * Output has the named fields in select list order, `*` copies every input
 * field at its position.
 */
struct Projection : Stage {
  ResolvedFields fields_;

  explicit Projection(const ResolvedFields& fields);

  common::Status project(const RecordPtr& record, RecordPtr* result) const;

  virtual void insert(const RecordPtr& record);

  virtual void remove(const RecordPtr& record);

  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed);

  virtual const char* name() const { return "projection"; }
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_QUERY_PROCESSING_PROJECTION_H_
