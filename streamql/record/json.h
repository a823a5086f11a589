/*!
 * \file json.h
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
#ifndef STREAMQL_RECORD_JSON_H_
#define STREAMQL_RECORD_JSON_H_

#include <string>
#include <tuple>

#include <boost/json.hpp>

#include "streamql/common/status.h"
#include "streamql/record/value.h"

namespace streamql {

//! Convert parsed JSON to value, JSON types map one to one
Value value_from_json(boost::json::value const& json);

RecordPtr record_from_json(boost::json::object const& object);

/** Convert value to JSON.
 * NaN and infinities aren't representable in JSON and become null.
 */
boost::json::value value_to_json(const Value& value);

boost::json::object record_to_json(const Record& record);

//! Parse JSON object text into a record
std::tuple<common::Status, RecordPtr> parse_record_json(const std::string& json);

}  // namespace streamql

#endif  // STREAMQL_RECORD_JSON_H_
