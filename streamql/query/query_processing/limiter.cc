/*!
 * \file limiter.cc
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
#include "streamql/query/query_processing/limiter.h"

namespace streamql {
namespace qp {

Limiter::Limiter(u64 limit)
    : limit_(limit)
      , counter_(0) { }

bool Limiter::take_back(const RecordPtr& record) {
  if (forwarded_.find(record) == forwarded_.end()) {
    return false;
  }
  if (--forwarded_[record] == 0) {
    forwarded_.erase(record);
  }
  return true;
}

void Limiter::insert(const RecordPtr& record) {
  if (counter_ >= limit_) {
    // stop forwarding
    return;
  }
  counter_++;
  forwarded_[record]++;
  emit_insert(record);
}

void Limiter::remove(const RecordPtr& record) {
  if (take_back(record)) {
    emit_remove(record);
  }
}

void Limiter::insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
  if (!take_back(removed)) {
    insert(inserted);
    return;
  }
  // update of a forwarded record keeps its slot
  forwarded_[inserted]++;
  emit_insert_remove(inserted, removed);
}

}  // namespace qp
}  // namespace streamql
