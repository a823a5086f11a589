/*!
 * \file config.cc
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
#include "streamql/common/config.h"

#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/json_parser.hpp>

namespace streamql {

EngineConfig::EngineConfig()
    : nan_policy(NanPolicy::SKIP)
      , log_level(common::LOG_SEVERITY_INFO) { }

std::tuple<common::Status, EngineConfig> EngineConfig::from_ptree(boost::property_tree::ptree const& ptree) {
  EngineConfig config;
  auto policy = ptree.get_optional<std::string>("aggregate.nan_policy");
  if (policy) {
    auto name = boost::algorithm::to_lower_copy(*policy);
    if (name == "skip") {
      config.nan_policy = NanPolicy::SKIP;
    } else if (name == "zero") {
      config.nan_policy = NanPolicy::ZERO;
    } else if (name == "propagate") {
      config.nan_policy = NanPolicy::PROPAGATE;
    } else {
      return std::make_tuple(common::Status::BadArg("unknown nan_policy: " + *policy), config);
    }
  }
  auto level = ptree.get_optional<std::string>("log.level");
  if (level) {
    auto name = boost::algorithm::to_lower_copy(*level);
    if (name == "info") {
      config.log_level = common::LOG_SEVERITY_INFO;
    } else if (name == "warning") {
      config.log_level = common::LOG_SEVERITY_WARNING;
    } else if (name == "error") {
      config.log_level = common::LOG_SEVERITY_ERROR;
    } else {
      return std::make_tuple(common::Status::BadArg("unknown log level: " + *level), config);
    }
  }
  return std::make_tuple(common::Status::Ok(), config);
}

std::tuple<common::Status, EngineConfig> EngineConfig::from_json(const std::string& json) {
  boost::property_tree::ptree ptree;
  std::stringstream stream(json);
  try {
    boost::property_tree::json_parser::read_json(stream, ptree);
  } catch (const boost::property_tree::json_parser_error& e) {
    return std::make_tuple(common::Status::BadArg(e.what()), EngineConfig());
  }
  return from_ptree(ptree);
}

const char* to_string(NanPolicy policy) {
  switch (policy) {
    case NanPolicy::SKIP:
      return "skip";
    case NanPolicy::ZERO:
      return "zero";
    case NanPolicy::PROPAGATE:
      return "propagate";
  }
  return "unknown";
}

}  // namespace streamql
