/*!
 * \file config.h
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
#ifndef STREAMQL_COMMON_CONFIG_H_
#define STREAMQL_COMMON_CONFIG_H_

#include <string>
#include <tuple>

#include <boost/property_tree/ptree.hpp>

#include "streamql/common/logging.h"
#include "streamql/common/status.h"

namespace streamql {

//! What numeric aggregates do with a value that doesn't coerce to a number.
enum class NanPolicy {
  SKIP,       //! value doesn't contribute
  ZERO,       //! value contributes 0
  PROPAGATE,  //! aggregate reports NaN while such value is outstanding
};

/**
 * Engine configuration.
 */
struct EngineConfig {
  //! Numeric coercion failure policy of the aggregate functions
  NanPolicy nan_policy;

  //! Minimum log severity
  common::LogSeverity log_level;

  EngineConfig();

  /** Read config from property tree, missing keys keep defaults.
   * @code
   * { "aggregate": { "nan_policy": "skip" }, "log": { "level": "info" } }
   * @endcode
   */
  static std::tuple<common::Status, EngineConfig> from_ptree(boost::property_tree::ptree const& ptree);

  static std::tuple<common::Status, EngineConfig> from_json(const std::string& json);
};

const char* to_string(NanPolicy policy);

}  // namespace streamql

#endif  // STREAMQL_COMMON_CONFIG_H_
