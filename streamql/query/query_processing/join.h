/*!
 * \file join.h
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
#ifndef STREAMQL_QUERY_QUERY_PROCESSING_JOIN_H_
#define STREAMQL_QUERY_QUERY_PROCESSING_JOIN_H_

#include <memory>
#include <string>
#include <vector>

#include "streamql/core/context.h"
#include "streamql/query/ast.h"
#include "streamql/query/expression.h"
#include "streamql/query/stage_framework.h"
#include "streamql/record/containers.h"

namespace streamql {
namespace qp {

struct Join;
struct StreamSource;

//! Receives events of the joined (right-hand) source
struct JoinInput : Stage {
  Join* owner_;

  explicit JoinInput(Join* owner) : owner_(owner) { }

  virtual void insert(const RecordPtr& record);

  virtual void remove(const RecordPtr& record);

  virtual const char* name() const { return "join-input"; }
};

/** Inner equi-join of the upstream records with a second source.
 * Both sides are indexed by their key expressions. An event on one side is
 * matched against the other side's index and every match produces one
 * combined record. Records with a null or failed key never match.
 */
struct Join : Stage {
  enum SideId {
    LEFT,
    RIGHT,
  };

  struct Side {
    std::vector<ExpressionPtr>       keys_;
    ValueMap<std::vector<RecordPtr>> index_;
  };

  Side                          left_;
  Side                          right_;
  //! Right record is nested under this name, empty to merge fields
  std::string                   alias_;
  /** Nearest to the query source. The first join's left side is the root
   * stream (or sub-query) itself, later joins see combined records. Only used
   * in diagnostics, matching doesn't depend on it.
   */
  bool                          first_;
  //! Right-hand source head, stopped together with the query root
  StagePtr                      source_;
  //! Set if the right-hand source is a named stream
  std::shared_ptr<StreamSource> stream_;
  std::shared_ptr<JoinInput>    input_;

  /** Build join stage and its right-hand source.
   * @param root is the query root, the right-hand source is bound to its lifetime
   * @throw QueryConfigError if the source or key expressions are invalid
   */
  Join(Context& ctx, const JoinNode& spec, StagePtr root, bool first);

  virtual ~Join();

  //! Start receiving right-hand events
  void start();

  virtual void insert(const RecordPtr& record);

  virtual void remove(const RecordPtr& record);

  virtual void stop();

  virtual const char* name() const { return "join"; }

  void insert_side(SideId side, const RecordPtr& record);

  void remove_side(SideId side, const RecordPtr& record);

  RecordPtr combine(const RecordPtr& left, const RecordPtr& right) const;

  //! Number of indexed records on one side
  size_t size(SideId side) const;

 private:
  bool key(const Side& side, const Record& record, Value* result) const;
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_QUERY_PROCESSING_JOIN_H_
