/*!
 * \file stage_framework.h
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
#ifndef STREAMQL_QUERY_STAGE_FRAMEWORK_H_
#define STREAMQL_QUERY_STAGE_FRAMEWORK_H_

#include <memory>
#include <vector>

#include "streamql/common/types.h"
#include "streamql/record/value.h"

namespace streamql {
namespace qp {

//! Event kinds a listener can subscribe to
enum EventMask {
  EVENT_INSERT = 1,
  EVENT_REMOVE = 2,
  EVENT_ALL    = EVENT_INSERT | EVENT_REMOVE,
};

/** Processing stage.
 * Stages form a push-based pipeline: a stage receives insert/remove events,
 * transforms or gates them and emits the result to its listeners. Every call
 * runs to completion before it returns.
 */
struct Stage {
  struct Listener {
    std::shared_ptr<Stage> stage;
    int                    mask;
  };

  //! Downstream stages in registration order
  std::vector<Listener>               listeners_;
  //! Stages stopped together with this one
  std::vector<std::shared_ptr<Stage>> companions_;

  virtual ~Stage() = default;

  virtual void insert(const RecordPtr& record) = 0;

  virtual void remove(const RecordPtr& record) = 0;

  /** Atomic update: `removed` is replaced with `inserted`.
   * Default implementation is remove followed by insert.
   */
  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed);

  //! Release external resources, stops companions too
  virtual void stop();

  //! Stage kind, used in diagnostics
  virtual const char* name() const = 0;

  /** Send both insert and remove events to `next`.
   * @return next
   */
  std::shared_ptr<Stage> pass(std::shared_ptr<Stage> next);

  //! Send events selected by `mask` to `next`, returns next
  std::shared_ptr<Stage> on(int mask, std::shared_ptr<Stage> next);

  //! Stop `companion` whenever this stage is stopped, keeps it alive as well
  void bind_lifetime(std::shared_ptr<Stage> companion);

  void emit_insert(const RecordPtr& record);

  void emit_remove(const RecordPtr& record);

  void emit_insert_remove(const RecordPtr& inserted, const RecordPtr& removed);
};

typedef std::shared_ptr<Stage> StagePtr;

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_STAGE_FRAMEWORK_H_
