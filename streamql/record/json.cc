/*!
 * \file json.cc
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
#include "streamql/record/json.h"

#include <cmath>

namespace streamql {

Value value_from_json(boost::json::value const& json) {
  switch (json.kind()) {
    case boost::json::kind::null:
      return Value();
    case boost::json::kind::bool_:
      return Value(json.get_bool());
    case boost::json::kind::int64:
      return Value(static_cast<i64>(json.get_int64()));
    case boost::json::kind::uint64:
      return Value(static_cast<u64>(json.get_uint64()));
    case boost::json::kind::double_:
      return Value(json.get_double());
    case boost::json::kind::string:
      return Value(std::string(json.get_string().data(), json.get_string().size()));
    case boost::json::kind::array: {
      Array array;
      for (const auto& item: json.get_array()) {
        array.push_back(value_from_json(item));
      }
      return Value(std::move(array));
    }
    case boost::json::kind::object:
      return Value(record_from_json(json.get_object()));
  }
  return Value();
}

RecordPtr record_from_json(boost::json::object const& object) {
  Record record;
  for (const auto& kv: object) {
    auto key = kv.key();
    record.set(std::string(key.data(), key.size()), value_from_json(kv.value()));
  }
  return make_record(std::move(record));
}

boost::json::value value_to_json(const Value& value) {
  switch (value.type()) {
    case Value::Type::NIL:
      return nullptr;
    case Value::Type::BOOL:
      return value.as_bool();
    case Value::Type::NUMBER: {
      double number = value.as_number();
      if (std::isnan(number) || std::isinf(number)) {
        return nullptr;
      }
      return number;
    }
    case Value::Type::STRING:
      return boost::json::string(value.as_string());
    case Value::Type::RECORD:
      return record_to_json(*value.as_record());
    case Value::Type::ARRAY: {
      boost::json::array array;
      for (const auto& item: value.as_array()) {
        array.push_back(value_to_json(item));
      }
      return array;
    }
  }
  return nullptr;
}

boost::json::object record_to_json(const Record& record) {
  boost::json::object object;
  for (const auto& field: record) {
    object[field.first] = value_to_json(field.second);
  }
  return object;
}

std::tuple<common::Status, RecordPtr> parse_record_json(const std::string& json) {
  boost::json::error_code ec;
  auto parsed = boost::json::parse(json, ec);
  if (ec) {
    return std::make_tuple(common::Status::BadData(ec.message()), RecordPtr());
  }
  if (!parsed.is_object()) {
    return std::make_tuple(common::Status::BadData("JSON object expected"), RecordPtr());
  }
  return std::make_tuple(common::Status::Ok(), record_from_json(parsed.as_object()));
}

}  // namespace streamql
