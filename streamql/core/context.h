/*!
 * \file context.h
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
#ifndef STREAMQL_CORE_CONTEXT_H_
#define STREAMQL_CORE_CONTEXT_H_

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "streamql/common/types.h"
#include "streamql/common/config.h"
#include "streamql/common/datetime.h"
#include "streamql/query/functions.h"
#include "streamql/query/stage_framework.h"
#include "streamql/record/value.h"

namespace streamql {

typedef u64 SubscriptionId;
typedef u64 TimerId;

/** Named event streams.
 * Streams are created on first use. Subscribers are held weakly, a stage
 * that is gone simply stops receiving events.
 */
class StreamRegistry {
 public:
  StreamRegistry();
  StreamRegistry(const StreamRegistry&) = delete;
  StreamRegistry& operator = (const StreamRegistry&) = delete;

  SubscriptionId subscribe(const std::string& stream, std::weak_ptr<qp::Stage> stage);

  //! Unknown ids are ignored
  void unsubscribe(SubscriptionId id);

  void publish_insert(const std::string& stream, const RecordPtr& record);

  void publish_remove(const std::string& stream, const RecordPtr& record);

  void publish_insert_remove(const std::string& stream, const RecordPtr& inserted, const RecordPtr& removed);

  //! Number of live subscribers
  size_t subscribers(const std::string& stream) const;

  std::vector<std::string> list() const;

 private:
  struct Subscriber {
    SubscriptionId           id;
    std::weak_ptr<qp::Stage> stage;
  };

  void dispatch(const std::string& stream, const std::function<void(qp::Stage&)>& fn);

  std::map<std::string, std::vector<Subscriber>> streams_;
  std::map<SubscriptionId, std::string>          index_;
  SubscriptionId                                 next_id_;
};

struct Clock {
  virtual ~Clock() = default;
  virtual Timestamp now() const = 0;
};

//! System clock
struct WallClock : Clock {
  virtual Timestamp now() const;
};

//! Clock that moves only when told to, used for tests and replay
struct ManualClock : Clock {
  Timestamp now_;

  explicit ManualClock(Timestamp start = 0) : now_(start) { }

  virtual Timestamp now() const { return now_; }

  void set(Timestamp ts) { now_ = ts; }

  void advance(Duration delta) { now_ += delta; }
};

/** Shared services of the queries built in one engine instance.
 * Single-threaded: the owner of the event loop publishes events and calls
 * run_timers() from the same thread.
 */
class Context {
 public:
  explicit Context(EngineConfig config = EngineConfig(),
                   std::shared_ptr<Clock> clock = std::make_shared<WallClock>());
  Context(const Context&) = delete;
  Context& operator = (const Context&) = delete;

  StreamRegistry& streams() { return streams_; }

  qp::FunctionRegistry& functions() { return functions_; }
  const qp::FunctionRegistry& functions() const { return functions_; }

  const EngineConfig& config() const { return config_; }

  Clock& clock() { return *clock_; }

  Timestamp now() const { return clock_->now(); }

  //! Call `callback` from run_timers() once the clock reaches `deadline`
  TimerId schedule(Timestamp deadline, std::function<void()> callback);

  //! Unknown or already fired ids are ignored
  void cancel(TimerId id);

  /** Fire due timers in deadline order. Timers scheduled by a callback are
   * fired in the same call if they are already due.
   * @return number of fired timers
   */
  size_t run_timers();

  //! Number of pending timers
  size_t pending_timers() const { return timers_.size(); }

 private:
  typedef std::pair<Timestamp, TimerId> TimerKey;

  EngineConfig                             config_;
  std::shared_ptr<Clock>                   clock_;
  StreamRegistry                           streams_;
  qp::FunctionRegistry                     functions_;
  std::map<TimerKey, std::function<void()>> timers_;
  std::map<TimerId, Timestamp>             deadlines_;
  TimerId                                  next_timer_;
};

}  // namespace streamql

#endif  // STREAMQL_CORE_CONTEXT_H_
