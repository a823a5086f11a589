/*!
 * \file value.cc
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
#include "streamql/record/value.h"

#include <stdio.h>
#include <stdlib.h>

#include <cmath>
#include <limits>
#include <ostream>
#include <sstream>

#include "streamql/common/hash.h"

namespace streamql {

PropertyPath split_path(const std::string& path) {
  PropertyPath result;
  std::string::size_type begin = 0;
  while (begin <= path.size()) {
    auto end = path.find('.', begin);
    if (end == std::string::npos) {
      end = path.size();
    }
    if (end > begin) {
      result.push_back(path.substr(begin, end - begin));
    }
    begin = end + 1;
  }
  return result;
}

std::string join_path(const PropertyPath& path) {
  std::string result;
  for (const auto& item: path) {
    if (!result.empty()) {
      result += '.';
    }
    result += item;
  }
  return result;
}

// ------------ Value ------------ //

Value::Value()
    : type_(Type::NIL), bool_(false), number_(0) { }

Value::Value(bool value)
    : type_(Type::BOOL), bool_(value), number_(0) { }

Value::Value(int value)
    : type_(Type::NUMBER), bool_(false), number_(value) { }

Value::Value(i64 value)
    : type_(Type::NUMBER), bool_(false), number_(static_cast<double>(value)) { }

Value::Value(u64 value)
    : type_(Type::NUMBER), bool_(false), number_(static_cast<double>(value)) { }

Value::Value(double value)
    : type_(Type::NUMBER), bool_(false), number_(value) { }

Value::Value(const char* value)
    : type_(Type::STRING), bool_(false), number_(0), string_(value) { }

Value::Value(std::string value)
    : type_(Type::STRING), bool_(false), number_(0), string_(std::move(value)) { }

Value::Value(RecordPtr value)
    : type_(value ? Type::RECORD : Type::NIL), bool_(false), number_(0), record_(std::move(value)) { }

Value::Value(Array value)
    : type_(Type::ARRAY), bool_(false), number_(0), array_(std::make_shared<const Array>(std::move(value))) { }

bool Value::as_bool() const {
  return bool_;
}

double Value::as_number() const {
  return number_;
}

const std::string& Value::as_string() const {
  return string_;
}

const RecordPtr& Value::as_record() const {
  return record_;
}

const Array& Value::as_array() const {
  static const Array EMPTY;
  return array_ ? *array_ : EMPTY;
}

double Value::to_number() const {
  switch (type_) {
    case Type::NUMBER:
      return number_;
    case Type::BOOL:
      return bool_ ? 1.0 : 0.0;
    case Type::STRING: {
      const char* begin = string_.c_str();
      while (*begin == ' ' || *begin == '\t') {
        begin++;
      }
      if (*begin == '\0') {
        break;
      }
      char* end = nullptr;
      double result = strtod(begin, &end);
      while (*end == ' ' || *end == '\t') {
        end++;
      }
      if (*end != '\0') {
        break;
      }
      return result;
    }
    case Type::NIL:
    case Type::RECORD:
    case Type::ARRAY:
      break;
  }
  return std::numeric_limits<double>::quiet_NaN();
}

bool Value::truthy() const {
  switch (type_) {
    case Type::NIL:
      return false;
    case Type::BOOL:
      return bool_;
    case Type::NUMBER:
      return number_ != 0 && !std::isnan(number_);
    case Type::STRING:
      return !string_.empty();
    case Type::RECORD:
    case Type::ARRAY:
      return true;
  }
  return false;
}

bool Value::operator == (const Value& other) const {
  if (type_ != other.type_) {
    return false;
  }
  switch (type_) {
    case Type::NIL:
      return true;
    case Type::BOOL:
      return bool_ == other.bool_;
    case Type::NUMBER:
      return number_ == other.number_ || (std::isnan(number_) && std::isnan(other.number_));
    case Type::STRING:
      return string_ == other.string_;
    case Type::RECORD:
      return record_ == other.record_ || *record_ == *other.record_;
    case Type::ARRAY:
      return array_ == other.array_ || *array_ == *other.array_;
  }
  return false;
}

u64 Value::hash() const {
  u64 seed = static_cast<u64>(type_) + 1;
  switch (type_) {
    case Type::NIL:
      return seed;
    case Type::BOOL:
      return common::HashCombine(seed, bool_ ? 1 : 0);
    case Type::NUMBER: {
      double normalized = number_;
      if (normalized == 0) {
        normalized = 0;  // -0.0 and 0.0 are equal
      } else if (std::isnan(normalized)) {
        normalized = std::numeric_limits<double>::quiet_NaN();
      }
      return common::MurmurHash64A(reinterpret_cast<const char*>(&normalized), sizeof(normalized), seed);
    }
    case Type::STRING:
      return common::MurmurHash64A(string_.data(), string_.size(), seed);
    case Type::RECORD:
      return common::HashCombine(seed, record_->hash());
    case Type::ARRAY:
      for (const auto& item: *array_) {
        seed = common::HashCombine(seed, item.hash());
      }
      return seed;
  }
  return seed;
}

static void write_json_string(std::ostream& os, const std::string& str) {
  os << '"';
  for (char c: str) {
    switch (c) {
      case '"':
        os << "\\\"";
        break;
      case '\\':
        os << "\\\\";
        break;
      case '\n':
        os << "\\n";
        break;
      case '\r':
        os << "\\r";
        break;
      case '\t':
        os << "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          os << buf;
        } else {
          os << c;
        }
    }
  }
  os << '"';
}

static void write_json_number(std::ostream& os, double value) {
  if (std::isnan(value) || std::isinf(value)) {
    // not representable in JSON
    os << "null";
    return;
  }
  char buf[32];
  if (value == std::floor(value) && std::fabs(value) < 1e15) {
    snprintf(buf, sizeof(buf), "%.0f", value);
  } else {
    snprintf(buf, sizeof(buf), "%.17g", value);
  }
  os << buf;
}

std::string Value::to_json() const {
  std::stringstream str;
  str << *this;
  return str.str();
}

std::ostream& operator << (std::ostream& os, const Value& value) {
  switch (value.type()) {
    case Value::Type::NIL:
      os << "null";
      break;
    case Value::Type::BOOL:
      os << (value.as_bool() ? "true" : "false");
      break;
    case Value::Type::NUMBER:
      write_json_number(os, value.as_number());
      break;
    case Value::Type::STRING:
      write_json_string(os, value.as_string());
      break;
    case Value::Type::RECORD:
      os << *value.as_record();
      break;
    case Value::Type::ARRAY: {
      os << '[';
      bool first = true;
      for (const auto& item: value.as_array()) {
        if (!first) {
          os << ',';
        }
        first = false;
        os << item;
      }
      os << ']';
      break;
    }
  }
  return os;
}

// ------------ Record ------------ //

Record::Record(std::initializer_list<Field> fields) {
  for (const auto& field: fields) {
    set(field.first, field.second);
  }
}

const Value* Record::find(const std::string& name) const {
  for (const auto& field: fields_) {
    if (field.first == name) {
      return &field.second;
    }
  }
  return nullptr;
}

const Value* Record::find_path(const PropertyPath& path) const {
  const Record* current = this;
  const Value* value = nullptr;
  for (size_t i = 0; i < path.size(); i++) {
    value = current->find(path[i]);
    if (value == nullptr) {
      return nullptr;
    }
    if (i + 1 < path.size()) {
      if (!value->is_record()) {
        return nullptr;
      }
      current = value->as_record().get();
    }
  }
  return value;
}

Value Record::get(const std::string& name) const {
  auto value = find(name);
  return value ? *value : Value();
}

void Record::set(const std::string& name, Value value) {
  for (auto& field: fields_) {
    if (field.first == name) {
      field.second = std::move(value);
      return;
    }
  }
  fields_.emplace_back(name, std::move(value));
}

bool Record::operator == (const Record& other) const {
  return fields_ == other.fields_;
}

u64 Record::hash() const {
  u64 seed = 0x5851f42d4c957f2dull;
  for (const auto& field: fields_) {
    seed = common::MurmurHash64A(field.first.data(), field.first.size(), seed);
    seed = common::HashCombine(seed, field.second.hash());
  }
  return seed;
}

std::string Record::to_json() const {
  std::stringstream str;
  str << *this;
  return str.str();
}

std::ostream& operator << (std::ostream& os, const Record& record) {
  os << '{';
  bool first = true;
  for (const auto& field: record) {
    if (!first) {
      os << ',';
    }
    first = false;
    write_json_string(os, field.first);
    os << ':' << field.second;
  }
  os << '}';
  return os;
}

RecordPtr make_record(std::initializer_list<Record::Field> fields) {
  return std::make_shared<const Record>(fields);
}

RecordPtr make_record(Record&& record) {
  return std::make_shared<const Record>(std::move(record));
}

}  // namespace streamql
