/*!
 * \file errors.h
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
#ifndef STREAMQL_QUERY_ERRORS_H_
#define STREAMQL_QUERY_ERRORS_H_

#include <stdexcept>
#include <string>

namespace streamql {
namespace qp {

/** Thrown while a query is being built: unsupported union, wrong
 * aggregate arity, unknown function or window kind.
 */
struct QueryConfigError : std::runtime_error {
  QueryConfigError(const char* msg) : std::runtime_error(msg) { }
  QueryConfigError(const std::string& msg) : std::runtime_error(msg) { }
};

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_ERRORS_H_
