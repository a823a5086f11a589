/*!
 * \file mock_stage.h
 * Test helper: stage that records every event it receives.
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
#ifndef STREAMQL_QUERY_QUERY_PROCESSING_MOCK_STAGE_H_
#define STREAMQL_QUERY_QUERY_PROCESSING_MOCK_STAGE_H_

#include <string>
#include <vector>

#include "streamql/query/stage_framework.h"
#include "streamql/record/containers.h"

namespace streamql {
namespace qp {

/** Events are logged as "+{json}" (insert), "-{json}" (remove) and
 * "~{new}/{old}" (insert_remove).
 */
struct MockStage : Stage {
  std::vector<std::string> events_;
  //! Net count per record, updates count as a remove and an insert
  RecordMap<i64>           net_;
  size_t                   inserts_;
  size_t                   removes_;
  size_t                   updates_;

  MockStage() : inserts_(0), removes_(0), updates_(0) { }

  virtual void insert(const RecordPtr& record) {
    events_.push_back("+" + record->to_json());
    net_[record]++;
    inserts_++;
  }

  virtual void remove(const RecordPtr& record) {
    events_.push_back("-" + record->to_json());
    net_[record]--;
    removes_++;
  }

  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
    events_.push_back("~" + inserted->to_json() + "/" + removed->to_json());
    net_[inserted]++;
    net_[removed]--;
    updates_++;
  }

  virtual const char* name() const { return "mock"; }

  //! Every record that was inserted was removed as many times
  bool balanced() const {
    for (const auto& kv: net_) {
      if (kv.second != 0) {
        return false;
      }
    }
    return true;
  }

  void clear() {
    events_.clear();
    net_.clear();
    inserts_ = removes_ = updates_ = 0;
  }
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_QUERY_PROCESSING_MOCK_STAGE_H_
