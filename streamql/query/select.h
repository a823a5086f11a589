/*!
 * \file select.h
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
#ifndef STREAMQL_QUERY_SELECT_H_
#define STREAMQL_QUERY_SELECT_H_

#include <memory>
#include <string>
#include <vector>

#include "streamql/core/context.h"
#include "streamql/query/ast.h"
#include "streamql/query/field_resolver.h"
#include "streamql/query/stage_framework.h"

namespace streamql {
namespace qp {

struct Join;
struct Output;
struct StreamSource;

/** Continuous query.
 * Builds the whole stage chain in the constructor:
 * source -> minifier -> [repeater] -> [join...] -> [filter] ->
 * aggregation | projection -> [distinct] -> [limit] -> output.
 * Union queries are built as separate selects that feed the same output.
 * Events sent to the select go to the chain root, events reaching the output
 * are emitted by the select itself.
 */
struct Select : Stage {
  Context*                             ctx_;
  QueryPtr                             query_;
  ResolvedFields                       fields_;
  const bool                           windowed_;
  const bool                           aggregation_;
  //! Head of the chain: stream source or nested select
  StagePtr                             root_;
  //! Set if the root is a named stream
  std::shared_ptr<StreamSource>        source_;
  //! Chain stages in order, root first
  std::vector<StagePtr>                stages_;
  std::vector<std::shared_ptr<Join>>   joins_;
  std::vector<std::shared_ptr<Select>> unions_;
  std::shared_ptr<Output>              output_;

  /** Build and start the query.
   * @throw QueryConfigError if the query can't be built, nothing keeps running in this case
   */
  Select(Context& ctx, QueryPtr query);

  virtual ~Select();

  Select(const Select&) = delete;
  Select& operator = (const Select&) = delete;

  //! Source is a named stream with a window
  bool is_windowed() const { return windowed_; }

  //! Select list calls an aggregate function
  bool has_aggregation() const { return aggregation_; }

  //! Stage names of the chain in order
  std::vector<std::string> describe() const;

  virtual void insert(const RecordPtr& record);

  virtual void remove(const RecordPtr& record);

  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed);

  //! Stop the source, joined sources and unions
  virtual void stop();

  virtual const char* name() const { return "select"; }

 private:
  StagePtr append(StagePtr tail, StagePtr next);
  StagePtr add_source();
  StagePtr add_minifier(StagePtr tail);
  StagePtr add_repeater(StagePtr tail);
  StagePtr add_joins(StagePtr tail);
  void add_unions();
  StagePtr add_filter(StagePtr tail);
  StagePtr add_aggregation(StagePtr tail);
  StagePtr add_projection(StagePtr tail);
  StagePtr add_distinct(StagePtr tail);
  StagePtr add_limit(StagePtr tail);
  void add_output(StagePtr tail);
  void start();
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_SELECT_H_
