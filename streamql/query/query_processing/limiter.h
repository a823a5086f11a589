/*!
 * \file limiter.h
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
#ifndef STREAMQL_QUERY_QUERY_PROCESSING_LIMITER_H_
#define STREAMQL_QUERY_QUERY_PROCESSING_LIMITER_H_

#include "streamql/query/stage_framework.h"
#include "streamql/record/containers.h"

namespace streamql {
namespace qp {

/** Forwards at most `limit` inserts over the stage lifetime.
 * Removes are forwarded only for records that were forwarded. A freed slot
 * is not reused.
 */
struct Limiter : Stage {
  u64            limit_;
  //! Inserts forwarded so far
  u64            counter_;
  //! Forwarded records that weren't removed yet
  RecordMap<u64> forwarded_;

  explicit Limiter(u64 limit);

  virtual void insert(const RecordPtr& record);

  virtual void remove(const RecordPtr& record);

  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed);

  virtual const char* name() const { return "limit"; }

 private:
  bool take_back(const RecordPtr& record);
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_QUERY_PROCESSING_LIMITER_H_
