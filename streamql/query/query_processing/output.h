/*!
 * \file output.h
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
#ifndef STREAMQL_QUERY_QUERY_PROCESSING_OUTPUT_H_
#define STREAMQL_QUERY_QUERY_PROCESSING_OUTPUT_H_

#include "streamql/query/stage_framework.h"

namespace streamql {
namespace qp {

//! Terminal stage, re-emits events as events of the owning query
struct Output : Stage {
  //! Owning query, reset when the owner is gone
  Stage* owner_;

  explicit Output(Stage* owner) : owner_(owner) { }

  virtual void insert(const RecordPtr& record) {
    if (owner_) {
      owner_->emit_insert(record);
    }
  }

  virtual void remove(const RecordPtr& record) {
    if (owner_) {
      owner_->emit_remove(record);
    }
  }

  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
    if (owner_) {
      owner_->emit_insert_remove(inserted, removed);
    }
  }

  virtual const char* name() const { return "output"; }
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_QUERY_PROCESSING_OUTPUT_H_
