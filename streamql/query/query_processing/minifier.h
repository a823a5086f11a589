/*!
 * \file minifier.h
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
#ifndef STREAMQL_QUERY_QUERY_PROCESSING_MINIFIER_H_
#define STREAMQL_QUERY_QUERY_PROCESSING_MINIFIER_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "streamql/query/ast.h"
#include "streamql/query/field_resolver.h"
#include "streamql/query/stage_framework.h"

namespace streamql {
namespace qp {

/** Prunes records down to the property paths the rest of the query reads.
 * Paths are collected from the select list, `where`, group fields, `having`
 * and the left-hand join keys. If the select list has `*` the stage passes
 * records through unchanged.
 */
struct Minifier : Stage {
  //! Node of the selector tree, a leaf keeps the whole value
  struct Selector {
    bool                                                       leaf_;
    std::vector<std::pair<std::string, std::unique_ptr<Selector>>> children_;

    Selector() : leaf_(false) { }

    Selector* child(const std::string& name);
  };

  bool                      star_;
  std::vector<PropertyPath> paths_;
  Selector                  root_;

  /** Build minifier for a query.
   * @throw QueryConfigError if one of the expressions can't be compiled
   */
  Minifier(const ResolvedFields& fields, const Query& query, const FunctionRegistry& udfs);

  //! Build minifier that keeps exactly `paths`
  explicit Minifier(const std::vector<PropertyPath>& paths);

  //! Ordered, deduplicated selector paths (empty if pass-through)
  const std::vector<PropertyPath>& selectors() const { return paths_; }

  RecordPtr minify(const RecordPtr& record) const;

  virtual void insert(const RecordPtr& record);

  virtual void remove(const RecordPtr& record);

  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed);

  virtual const char* name() const { return "minifier"; }

 private:
  void add_path(const PropertyPath& path);
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_QUERY_PROCESSING_MINIFIER_H_
