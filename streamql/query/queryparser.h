/*!
 * \file queryparser.h
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
#ifndef STREAMQL_QUERY_QUERYPARSER_H_
#define STREAMQL_QUERY_QUERYPARSER_H_

#include <string>
#include <tuple>

#include <boost/property_tree/ptree.hpp>

#include "streamql/common/status.h"
#include "streamql/query/ast.h"

namespace streamql {
namespace qp {

using ErrorMsg = std::string;

/** Reads JSON query documents and produces the query AST.
 *
 * @code
 * { "select": ["*", {"expr": {"fn": "count", "args": [{"star": ""}]}, "as": "n"}],
 *   "from": {"stream": "orders", "window": {"fn": "length", "size": 10}},
 *   "join": [{"from": {"stream": "users"}, "on": [{"left": {"prop": "uid"}, "right": {"prop": "id"}}]}],
 *   "where": {"op": ">", "args": [{"prop": "price"}, {"num": 10}]},
 *   "group": {"by": [{"prop": "uid"}], "having": E},
 *   "union": [{"all": true, "query": {...}}],
 *   "distinct": true,
 *   "limit": 10 }
 * @endcode
 */
struct QueryParser {

  static std::tuple<common::Status, boost::property_tree::ptree, ErrorMsg> parse_json(const char* query);

  /** Parse query document.
   * @param ptree contains query
   * @returns status and query
   */
  static std::tuple<common::Status, QueryPtr, ErrorMsg> parse_query(boost::property_tree::ptree const& ptree);

  //! Parse JSON text and then the query document
  static std::tuple<common::Status, QueryPtr, ErrorMsg> parse_query(const char* query);

  /** Parse expression node.
   * @param ptree is an expression object ({"prop": "a.b"}, {"op": "+", "args": [...]}, ...)
   */
  static std::tuple<common::Status, ExprNodePtr, ErrorMsg> parse_expression(boost::property_tree::ptree const& ptree);
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_QUERYPARSER_H_
