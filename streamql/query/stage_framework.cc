/*!
 * \file stage_framework.cc
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
#include "streamql/query/stage_framework.h"

#include "streamql/common/logging.h"

namespace streamql {
namespace qp {

void Stage::insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
  remove(removed);
  insert(inserted);
}

void Stage::stop() {
  for (auto& companion: companions_) {
    companion->stop();
  }
}

StagePtr Stage::pass(StagePtr next) {
  return on(EVENT_ALL, next);
}

StagePtr Stage::on(int mask, StagePtr next) {
  if (!next) {
    LOG(FATAL) << "bad pipeline, " << name() << " stage can't pass events to null stage";
  }
  listeners_.push_back(Listener{next, mask});
  return next;
}

void Stage::bind_lifetime(StagePtr companion) {
  companions_.push_back(companion);
}

void Stage::emit_insert(const RecordPtr& record) {
  for (auto& listener: listeners_) {
    if (listener.mask & EVENT_INSERT) {
      listener.stage->insert(record);
    }
  }
}

void Stage::emit_remove(const RecordPtr& record) {
  for (auto& listener: listeners_) {
    if (listener.mask & EVENT_REMOVE) {
      listener.stage->remove(record);
    }
  }
}

void Stage::emit_insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
  for (auto& listener: listeners_) {
    switch (listener.mask & EVENT_ALL) {
      case EVENT_ALL:
        listener.stage->insert_remove(inserted, removed);
        break;
      case EVENT_INSERT:
        listener.stage->insert(inserted);
        break;
      case EVENT_REMOVE:
        listener.stage->remove(removed);
        break;
    }
  }
}

}  // namespace qp
}  // namespace streamql
