/*!
 * \file functions.cc
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
#include "streamql/query/functions.h"

#include <boost/algorithm/string.hpp>

namespace streamql {
namespace qp {

void FunctionRegistry::register_function(const std::string& name, ScalarFunction fn) {
  functions_[boost::algorithm::to_lower_copy(name)] = fn;
}

const ScalarFunction* FunctionRegistry::find(const std::string& name) const {
  auto it = functions_.find(boost::algorithm::to_lower_copy(name));
  if (it == functions_.end()) {
    return nullptr;
  }
  return &it->second;
}

std::vector<std::string> FunctionRegistry::list() const {
  std::vector<std::string> names;
  for (const auto& kv: functions_) {
    names.push_back(kv.first);
  }
  return names;
}

}  // namespace qp
}  // namespace streamql
