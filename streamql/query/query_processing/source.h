/*!
 * \file source.h
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
#ifndef STREAMQL_QUERY_QUERY_PROCESSING_SOURCE_H_
#define STREAMQL_QUERY_QUERY_PROCESSING_SOURCE_H_

#include <memory>
#include <string>

#include "streamql/core/context.h"
#include "streamql/query/stage_framework.h"

namespace streamql {
namespace qp {

/** Re-emits events published to a named stream.
 * Receives nothing until start() is called, stop() ends the subscription.
 */
struct StreamSource : std::enable_shared_from_this<StreamSource>, Stage {
  Context*       ctx_;
  std::string    stream_;
  SubscriptionId id_;
  bool           subscribed_;

  StreamSource(Context& ctx, const std::string& stream);

  virtual ~StreamSource();

  void start();

  virtual void insert(const RecordPtr& record);

  virtual void remove(const RecordPtr& record);

  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed);

  virtual void stop();

  virtual const char* name() const { return "stream-source"; }
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_QUERY_PROCESSING_SOURCE_H_
