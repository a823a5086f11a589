/*!
 * \file aggregate_function.cc
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
#include "streamql/query/query_processing/aggregate_function.h"

#include <cmath>
#include <limits>
#include <map>
#include <set>

#include <boost/algorithm/string.hpp>

#include "streamql/common/logging.h"

namespace streamql {
namespace qp {

struct AggregateRegistry {
  std::map<std::string, BaseAggregateFunctionToken const*> registry;
  static AggregateRegistry& get() {
    static AggregateRegistry inst;
    return inst;
  }
};

void add_aggregate_token_to_registry(BaseAggregateFunctionToken const* ptr) {
  AggregateRegistry::get().registry[ptr->get_tag()] = ptr;
}

std::vector<std::string> list_aggregate_functions() {
  std::vector<std::string> names;
  for (auto kv: AggregateRegistry::get().registry) {
    names.push_back(kv.first);
  }
  return names;
}

bool is_aggregate_function(const std::string& name) {
  auto& registry = AggregateRegistry::get().registry;
  return registry.count(boost::algorithm::to_lower_copy(name)) != 0;
}

std::unique_ptr<AggregateFunction> create_aggregate_function(const AggregateCall& call, NanPolicy policy) {
  auto& registry = AggregateRegistry::get().registry;
  auto it = registry.find(boost::algorithm::to_lower_copy(call.name));
  if (it == registry.end()) {
    throw QueryConfigError("unknown aggregate function `" + call.name + "`");
  }
  return it->second->create(call, policy);
}

//! Every aggregate takes exactly one argument, `*` only where allowed
static void check_arity(const AggregateCall& call, bool allow_star) {
  size_t nargs = call.args.size() + (call.star ? 1 : 0);
  if (nargs != 1) {
    throw QueryConfigError(call.name + " requires exactly one argument, " + std::to_string(nargs) + " given");
  }
  if (call.star && !allow_star) {
    throw QueryConfigError(call.name + " doesn't accept `*` argument");
  }
}

static Value eval_argument(const AggregateCall& call, const Record& record) {
  common::Status status;
  Value value;
  std::tie(status, value) = call.args.front()->eval(record);
  if (!status.IsOk()) {
    LOG(WARNING) << call.name << "(" << call.args.front()->to_string()
                 << ") argument can't be evaluated, " << status.ToString();
    return Value();
  }
  return value;
}

struct Count : AggregateFunction {
  AggregateCall call_;
  u64           count_;

  Count(const AggregateCall& call, NanPolicy)
      : call_(call)
        , count_(0) {
    check_arity(call, true);
  }

  bool counts(const Record& record) const {
    return call_.star || !eval_argument(call_, record).is_null();
  }

  virtual Value insert(const Record& record) {
    if (counts(record)) {
      count_++;
    }
    return value();
  }

  virtual Value remove(const Record& record) {
    if (counts(record)) {
      if (count_ == 0) {
        LOG(WARNING) << "count: remove without matching insert";
      } else {
        count_--;
      }
    }
    return value();
  }

  virtual Value value() const {
    return Value(count_);
  }
};

/** Base class of the numeric aggregates.
 * Null arguments never contribute. Arguments that don't coerce to a number
 * are handled according to NanPolicy.
 */
struct NumericAggregate : AggregateFunction {
  AggregateCall call_;
  NanPolicy     policy_;
  //! Outstanding non-numeric contributions (PROPAGATE only)
  u64           nan_count_;

  NumericAggregate(const AggregateCall& call, NanPolicy policy)
      : call_(call)
        , policy_(policy)
        , nan_count_(0) {
    check_arity(call, false);
  }

  virtual void add(double x) = 0;
  virtual void sub(double x) = 0;
  virtual Value current() const = 0;

  enum Contribution {
    NONE,
    NUMBER,
    NOT_A_NUMBER,
  };

  Contribution coerce(const Record& record, double* x) const {
    auto arg = eval_argument(call_, record);
    if (arg.is_null()) {
      return NONE;
    }
    *x = arg.to_number();
    if (!std::isnan(*x)) {
      return NUMBER;
    }
    switch (policy_) {
      case NanPolicy::ZERO:
        *x = 0.0;
        return NUMBER;
      case NanPolicy::PROPAGATE:
        return NOT_A_NUMBER;
      case NanPolicy::SKIP:
        break;
    }
    return NONE;
  }

  virtual Value insert(const Record& record) {
    double x = 0;
    switch (coerce(record, &x)) {
      case NUMBER:
        add(x);
        break;
      case NOT_A_NUMBER:
        nan_count_++;
        break;
      case NONE:
        break;
    }
    return value();
  }

  virtual Value remove(const Record& record) {
    double x = 0;
    switch (coerce(record, &x)) {
      case NUMBER:
        sub(x);
        break;
      case NOT_A_NUMBER:
        if (nan_count_ == 0) {
          LOG(WARNING) << call_.name << ": remove without matching insert";
        } else {
          nan_count_--;
        }
        break;
      case NONE:
        break;
    }
    return value();
  }

  virtual Value value() const {
    if (nan_count_ != 0) {
      return Value(std::numeric_limits<double>::quiet_NaN());
    }
    return current();
  }
};

//! Running sum, the value is 0 when nothing contributes
struct Sum : NumericAggregate {
  double sum_;
  u64    count_;

  Sum(const AggregateCall& call, NanPolicy policy)
      : NumericAggregate(call, policy)
        , sum_(0)
        , count_(0) { }

  virtual void add(double x) {
    sum_ += x;
    count_++;
  }

  virtual void sub(double x) {
    if (count_ == 0) {
      LOG(WARNING) << call_.name << ": remove without matching insert";
      return;
    }
    count_--;
    // rounding errors shouldn't outlive the last contribution
    sum_ = count_ == 0 ? 0.0 : sum_ - x;
  }

  virtual Value current() const {
    return Value(sum_);
  }
};

struct Avg : Sum {
  Avg(const AggregateCall& call, NanPolicy policy)
      : Sum(call, policy) { }

  virtual Value current() const {
    if (count_ == 0) {
      return Value();
    }
    return Value(sum_ / static_cast<double>(count_));
  }
};

template <bool IsMax>
struct Extremum : NumericAggregate {
  std::multiset<double> values_;

  Extremum(const AggregateCall& call, NanPolicy policy)
      : NumericAggregate(call, policy) { }

  virtual void add(double x) {
    values_.insert(x);
  }

  virtual void sub(double x) {
    auto it = values_.find(x);
    if (it == values_.end()) {
      LOG(WARNING) << call_.name << ": remove without matching insert";
      return;
    }
    values_.erase(it);
  }

  virtual Value current() const {
    if (values_.empty()) {
      return Value();
    }
    return Value(IsMax ? *values_.rbegin() : *values_.begin());
  }
};

static AggregateFunctionToken<Count>           count_token("count");
static AggregateFunctionToken<Sum>             sum_token("sum");
static AggregateFunctionToken<Avg>             avg_token("avg");
static AggregateFunctionToken<Extremum<false>> min_token("min");
static AggregateFunctionToken<Extremum<true>>  max_token("max");

}  // namespace qp
}  // namespace streamql
