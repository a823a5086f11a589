/*!
 * \file repeater.h
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
#ifndef STREAMQL_QUERY_QUERY_PROCESSING_REPEATER_H_
#define STREAMQL_QUERY_QUERY_PROCESSING_REPEATER_H_

#include <deque>
#include <memory>
#include <utility>

#include "streamql/core/context.h"
#include "streamql/query/ast.h"
#include "streamql/query/stage_framework.h"

namespace streamql {
namespace qp {

/** Sliding window over the most recent `size` records.
 * Inserting a record that doesn't fit forwards the insert and then the
 * remove of the oldest record.
 */
struct LengthRepeater : Stage {
  u64                   size_;
  std::deque<RecordPtr> window_;

  explicit LengthRepeater(u64 size);

  virtual void insert(const RecordPtr& record);

  virtual void remove(const RecordPtr& record);

  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed);

  virtual const char* name() const { return "length-repeater"; }
};

/** Sliding window over the records younger than `duration`.
 * Expired records are removed from a context timer.
 */
struct TimeRepeater : std::enable_shared_from_this<TimeRepeater>, Stage {
  typedef std::pair<Timestamp, RecordPtr> Item;

  Context*         ctx_;
  Duration         duration_;
  //! Records with their expiration time, oldest first
  std::deque<Item> window_;
  TimerId          timer_;
  bool             armed_;

  TimeRepeater(Context& ctx, Duration duration);

  virtual ~TimeRepeater();

  virtual void insert(const RecordPtr& record);

  virtual void remove(const RecordPtr& record);

  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed);

  virtual void stop();

  virtual const char* name() const { return "time-repeater"; }

  //! Remove expired records, called from the timer
  void expire();

 private:
  void arm();
};

/** Create repeater for the window.
 * @throw QueryConfigError if window kind is NONE
 */
std::shared_ptr<Stage> make_repeater(Context& ctx, const WindowSpec& window);

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_QUERY_PROCESSING_REPEATER_H_
