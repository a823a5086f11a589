/*!
 * \file context.cc
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
#include "streamql/core/context.h"

#include <algorithm>
#include <chrono>

#include "streamql/common/logging.h"

namespace streamql {

StreamRegistry::StreamRegistry() : next_id_(1) { }

SubscriptionId StreamRegistry::subscribe(const std::string& stream, std::weak_ptr<qp::Stage> stage) {
  auto id = next_id_++;
  streams_[stream].push_back(Subscriber{id, stage});
  index_[id] = stream;
  return id;
}

void StreamRegistry::unsubscribe(SubscriptionId id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return;
  }
  auto& subscribers = streams_[it->second];
  subscribers.erase(std::remove_if(subscribers.begin(), subscribers.end(),
                                   [id](const Subscriber& s) { return s.id == id; }),
                    subscribers.end());
  index_.erase(it);
}

void StreamRegistry::dispatch(const std::string& stream, const std::function<void(qp::Stage&)>& fn) {
  auto it = streams_.find(stream);
  if (it == streams_.end()) {
    return;
  }
  // Subscribers may (un)subscribe while the event propagates
  auto subscribers = it->second;
  for (const auto& subscriber: subscribers) {
    if (auto stage = subscriber.stage.lock()) {
      fn(*stage);
    }
  }
}

void StreamRegistry::publish_insert(const std::string& stream, const RecordPtr& record) {
  dispatch(stream, [&record](qp::Stage& stage) { stage.insert(record); });
}

void StreamRegistry::publish_remove(const std::string& stream, const RecordPtr& record) {
  dispatch(stream, [&record](qp::Stage& stage) { stage.remove(record); });
}

void StreamRegistry::publish_insert_remove(const std::string& stream,
                                           const RecordPtr& inserted,
                                           const RecordPtr& removed) {
  dispatch(stream, [&](qp::Stage& stage) { stage.insert_remove(inserted, removed); });
}

size_t StreamRegistry::subscribers(const std::string& stream) const {
  auto it = streams_.find(stream);
  if (it == streams_.end()) {
    return 0;
  }
  size_t count = 0;
  for (const auto& subscriber: it->second) {
    if (!subscriber.stage.expired()) {
      count++;
    }
  }
  return count;
}

std::vector<std::string> StreamRegistry::list() const {
  std::vector<std::string> names;
  for (const auto& kv: streams_) {
    names.push_back(kv.first);
  }
  return names;
}

Timestamp WallClock::now() const {
  return DateTimeUtil::from_std_chrono(std::chrono::system_clock::now());
}

Context::Context(EngineConfig config, std::shared_ptr<Clock> clock)
    : config_(config)
      , clock_(clock)
      , next_timer_(1) {
  if (!clock_) {
    LOG(FATAL) << "context requires a clock";
  }
}

TimerId Context::schedule(Timestamp deadline, std::function<void()> callback) {
  auto id = next_timer_++;
  timers_[std::make_pair(deadline, id)] = std::move(callback);
  deadlines_[id] = deadline;
  return id;
}

void Context::cancel(TimerId id) {
  auto it = deadlines_.find(id);
  if (it == deadlines_.end()) {
    return;
  }
  timers_.erase(std::make_pair(it->second, id));
  deadlines_.erase(it);
}

size_t Context::run_timers() {
  size_t fired = 0;
  while (!timers_.empty()) {
    auto it = timers_.begin();
    if (it->first.first > clock_->now()) {
      break;
    }
    auto callback = std::move(it->second);
    deadlines_.erase(it->first.second);
    timers_.erase(it);
    callback();
    fired++;
  }
  return fired;
}

}  // namespace streamql
