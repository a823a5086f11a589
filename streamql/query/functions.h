/*!
 * \file functions.h
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
#ifndef STREAMQL_QUERY_FUNCTIONS_H_
#define STREAMQL_QUERY_FUNCTIONS_H_

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "streamql/record/value.h"

namespace streamql {
namespace qp {

//! User-defined scalar function, may throw std::exception to reject its input.
typedef std::function<Value(const std::vector<Value>&)> ScalarFunction;

/** User-defined scalar functions, names are case-insensitive.
 * Calls to these functions are never treated as aggregates, even if the name
 * matches an aggregate function.
 */
class FunctionRegistry {
 public:
  void register_function(const std::string& name, ScalarFunction fn);

  //! Returns nullptr if there is no such function
  const ScalarFunction* find(const std::string& name) const;

  std::vector<std::string> list() const;

 private:
  std::map<std::string, ScalarFunction> functions_;
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_FUNCTIONS_H_
