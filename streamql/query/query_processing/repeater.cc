/*!
 * \file repeater.cc
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
#include "streamql/query/query_processing/repeater.h"

#include <algorithm>
#include <iterator>

#include "streamql/common/logging.h"
#include "streamql/query/errors.h"

namespace streamql {
namespace qp {

LengthRepeater::LengthRepeater(u64 size)
    : size_(size) {
  if (size_ == 0) {
    throw QueryConfigError("length window size must be positive");
  }
}

void LengthRepeater::insert(const RecordPtr& record) {
  window_.push_back(record);
  emit_insert(record);
  if (window_.size() > size_) {
    auto oldest = window_.front();
    window_.pop_front();
    emit_remove(oldest);
  }
}

template <class It, class Get>
static It find_record(It begin, It end, const RecordPtr& record, Get get) {
  typedef typename std::iterator_traits<It>::reference Ref;
  // Same snapshot first, then any structurally equal record
  auto it = std::find_if(begin, end, [&](Ref item) { return get(item) == record; });
  if (it != end) {
    return it;
  }
  return std::find_if(begin, end, [&](Ref item) { return *get(item) == *record; });
}

static const RecordPtr& self(const RecordPtr& record) {
  return record;
}

void LengthRepeater::remove(const RecordPtr& record) {
  auto it = find_record(window_.begin(), window_.end(), record, self);
  if (it == window_.end()) {
    // already left the window
    return;
  }
  auto removed = *it;
  window_.erase(it);
  emit_remove(removed);
}

void LengthRepeater::insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
  auto it = find_record(window_.begin(), window_.end(), removed, self);
  if (it == window_.end()) {
    insert(inserted);
    return;
  }
  auto old = *it;
  window_.erase(it);
  window_.push_back(inserted);
  emit_insert_remove(inserted, old);
}

static const RecordPtr& item_record(const TimeRepeater::Item& item) {
  return item.second;
}

TimeRepeater::TimeRepeater(Context& ctx, Duration duration)
    : ctx_(&ctx)
      , duration_(duration)
      , timer_(0)
      , armed_(false) {
  if (duration_ == 0) {
    throw QueryConfigError("time window duration must be positive");
  }
}

TimeRepeater::~TimeRepeater() {
  if (armed_) {
    ctx_->cancel(timer_);
  }
}

void TimeRepeater::arm() {
  if (armed_ || window_.empty()) {
    return;
  }
  std::weak_ptr<TimeRepeater> weak = shared_from_this();
  timer_ = ctx_->schedule(window_.front().first, [weak]() {
    if (auto repeater = weak.lock()) {
      repeater->expire();
    }
  });
  armed_ = true;
}

void TimeRepeater::expire() {
  armed_ = false;
  auto now = ctx_->now();
  while (!window_.empty() && window_.front().first <= now) {
    auto record = window_.front().second;
    window_.pop_front();
    emit_remove(record);
  }
  arm();
}

void TimeRepeater::insert(const RecordPtr& record) {
  window_.push_back(std::make_pair(ctx_->now() + duration_, record));
  emit_insert(record);
  arm();
}

void TimeRepeater::remove(const RecordPtr& record) {
  auto it = find_record(window_.begin(), window_.end(), record, item_record);
  if (it == window_.end()) {
    return;
  }
  auto removed = it->second;
  window_.erase(it);
  emit_remove(removed);
}

void TimeRepeater::insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
  auto it = find_record(window_.begin(), window_.end(), removed, item_record);
  if (it == window_.end()) {
    insert(inserted);
    return;
  }
  auto old = it->second;
  window_.erase(it);
  window_.push_back(std::make_pair(ctx_->now() + duration_, inserted));
  emit_insert_remove(inserted, old);
  arm();
}

void TimeRepeater::stop() {
  if (armed_) {
    ctx_->cancel(timer_);
    armed_ = false;
  }
  Stage::stop();
}

std::shared_ptr<Stage> make_repeater(Context& ctx, const WindowSpec& window) {
  switch (window.kind) {
    case WindowKind::LENGTH:
      LOG(INFO) << "length window, size " << window.size;
      return std::make_shared<LengthRepeater>(window.size);
    case WindowKind::TIME:
      LOG(INFO) << "time window, " << window.duration << "ns";
      return std::make_shared<TimeRepeater>(ctx, window.duration);
    case WindowKind::NONE:
      break;
  }
  throw QueryConfigError("unknown window kind");
}

}  // namespace qp
}  // namespace streamql
