/*!
 * \file distinct.cc
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
#include "streamql/query/query_processing/distinct.h"

#include "streamql/common/logging.h"

namespace streamql {
namespace qp {

bool Distinct::acquire(const RecordPtr& record) {
  return ++counts_[record] == 1;
}

bool Distinct::release(const RecordPtr& record) {
  if (counts_.find(record) == counts_.end()) {
    LOG(WARNING) << "distinct: remove of unknown record " << *record;
    return false;
  }
  if (--counts_[record] != 0) {
    return false;
  }
  counts_.erase(record);
  return true;
}

void Distinct::insert(const RecordPtr& record) {
  if (acquire(record)) {
    emit_insert(record);
  }
}

void Distinct::remove(const RecordPtr& record) {
  if (release(record)) {
    emit_remove(record);
  }
}

void Distinct::insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
  if (*inserted == *removed) {
    return;
  }
  bool gone = release(removed);
  bool added = acquire(inserted);
  if (gone && added) {
    emit_insert_remove(inserted, removed);
  } else if (gone) {
    emit_remove(removed);
  } else if (added) {
    emit_insert(inserted);
  }
}

}  // namespace qp
}  // namespace streamql
