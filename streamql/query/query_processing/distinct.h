/*!
 * \file distinct.h
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
#ifndef STREAMQL_QUERY_QUERY_PROCESSING_DISTINCT_H_
#define STREAMQL_QUERY_QUERY_PROCESSING_DISTINCT_H_

#include "streamql/query/stage_framework.h"
#include "streamql/record/containers.h"

namespace streamql {
namespace qp {

/** Suppresses duplicate records.
 * Keeps a count per structurally distinct record: the insert is forwarded
 * when the count goes from 0 to 1, the remove when it drops back to 0.
 */
struct Distinct : Stage {
  RecordMap<u64> counts_;

  virtual void insert(const RecordPtr& record);

  virtual void remove(const RecordPtr& record);

  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed);

  virtual const char* name() const { return "distinct"; }

  //! Returns true if the count went from 0 to 1
  bool acquire(const RecordPtr& record);

  //! Returns true if the count dropped to 0
  bool release(const RecordPtr& record);
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_QUERY_PROCESSING_DISTINCT_H_
