/*!
 * \file aggregate_function.h
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
#ifndef STREAMQL_QUERY_QUERY_PROCESSING_AGGREGATE_FUNCTION_H_
#define STREAMQL_QUERY_QUERY_PROCESSING_AGGREGATE_FUNCTION_H_

#include <memory>
#include <string>
#include <vector>

#include "streamql/common/config.h"
#include "streamql/query/errors.h"
#include "streamql/query/expression.h"
#include "streamql/record/value.h"

namespace streamql {
namespace qp {

/** Incremental aggregate function.
 * Keeps one running value. `remove` must undo exactly what `insert` did for
 * the same record, so after every inserted record is removed the value is
 * back to the function's neutral element.
 */
struct AggregateFunction {
  virtual ~AggregateFunction() = default;

  //! Fold record in, return new value
  virtual Value insert(const Record& record) = 0;

  //! Fold record out, return new value
  virtual Value remove(const Record& record) = 0;

  virtual Value value() const = 0;
};

struct BaseAggregateFunctionToken;

void add_aggregate_token_to_registry(BaseAggregateFunctionToken const* ptr);

struct BaseAggregateFunctionToken {
  virtual ~BaseAggregateFunctionToken() = default;
  virtual std::unique_ptr<AggregateFunction> create(const AggregateCall& call, NanPolicy policy) const = 0;
  virtual std::string get_tag() const = 0;
};

/** Registers aggregate function class under the name given to constructor.
 * Class should have a constructor `Fn(const AggregateCall&, NanPolicy)`.
 */
template <class Fn>
struct AggregateFunctionToken : BaseAggregateFunctionToken {
  std::string tag;

  AggregateFunctionToken(const char* tag) : tag(tag) {
    add_aggregate_token_to_registry(this);
  }

  virtual std::string get_tag() const {
    return tag;
  }

  virtual std::unique_ptr<AggregateFunction> create(const AggregateCall& call, NanPolicy policy) const {
    return std::unique_ptr<AggregateFunction>(new Fn(call, policy));
  }
};

//! Lower-case names of the registered aggregate functions
std::vector<std::string> list_aggregate_functions();

bool is_aggregate_function(const std::string& name);

/** Create aggregate function instance.
 * @throw QueryConfigError if function is unknown or doesn't accept the arguments
 */
std::unique_ptr<AggregateFunction> create_aggregate_function(const AggregateCall& call, NanPolicy policy);

}  // namespace qp
}  // namespace streamql

#endif  // STREAMQL_QUERY_QUERY_PROCESSING_AGGREGATE_FUNCTION_H_
