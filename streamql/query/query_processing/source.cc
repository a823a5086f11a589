/*!
 * \file source.cc
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
#include "streamql/query/query_processing/source.h"

#include "streamql/common/logging.h"

namespace streamql {
namespace qp {

StreamSource::StreamSource(Context& ctx, const std::string& stream)
    : ctx_(&ctx)
      , stream_(stream)
      , id_(0)
      , subscribed_(false) { }

StreamSource::~StreamSource() {
  if (subscribed_) {
    ctx_->streams().unsubscribe(id_);
  }
}

void StreamSource::start() {
  if (subscribed_) {
    return;
  }
  id_ = ctx_->streams().subscribe(stream_, shared_from_this());
  subscribed_ = true;
  LOG(INFO) << "subscribed to stream `" << stream_ << "`";
}

void StreamSource::insert(const RecordPtr& record) {
  emit_insert(record);
}

void StreamSource::remove(const RecordPtr& record) {
  emit_remove(record);
}

void StreamSource::insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
  emit_insert_remove(inserted, removed);
}

void StreamSource::stop() {
  if (subscribed_) {
    ctx_->streams().unsubscribe(id_);
    subscribed_ = false;
    LOG(INFO) << "unsubscribed from stream `" << stream_ << "`";
  }
  Stage::stop();
}

}  // namespace qp
}  // namespace streamql
