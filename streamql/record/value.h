/*!
 * \file value.h
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
#ifndef STREAMQL_RECORD_VALUE_H_
#define STREAMQL_RECORD_VALUE_H_

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "streamql/common/types.h"

namespace streamql {

class Record;
class Value;

//! Records are immutable snapshots once published.
typedef std::shared_ptr<const Record> RecordPtr;

typedef std::vector<Value> Array;

//! Field names from the top level record down, "a.b.c" -> {a, b, c}
typedef std::vector<std::string> PropertyPath;

PropertyPath split_path(const std::string& path);

std::string join_path(const PropertyPath& path);

/** Dynamically typed field value.
 * Nested records and arrays are shared, copying a value never copies them.
 */
class Value {
 public:
  enum class Type {
    NIL,
    BOOL,
    NUMBER,
    STRING,
    RECORD,
    ARRAY,
  };

  Value();
  Value(bool value);
  Value(int value);
  Value(i64 value);
  Value(u64 value);
  Value(double value);
  Value(const char* value);
  Value(std::string value);
  Value(RecordPtr value);
  Value(Array value);

  Type type() const { return type_; }

  bool is_null()   const { return type_ == Type::NIL; }
  bool is_bool()   const { return type_ == Type::BOOL; }
  bool is_number() const { return type_ == Type::NUMBER; }
  bool is_string() const { return type_ == Type::STRING; }
  bool is_record() const { return type_ == Type::RECORD; }
  bool is_array()  const { return type_ == Type::ARRAY; }

  bool               as_bool() const;
  double             as_number() const;
  const std::string& as_string() const;
  const RecordPtr&   as_record() const;
  const Array&       as_array() const;

  /** Best-effort numeric coercion.
   * null -> NaN, bool -> 0/1, numeric string -> its value, everything else -> NaN.
   */
  double to_number() const;

  //! null and false are false, numbers are true if non-zero and not NaN
  bool truthy() const;

  //! Structural equality, NaN is equal to NaN
  bool operator == (const Value& other) const;
  bool operator != (const Value& other) const { return !(*this == other); }

  u64 hash() const;

  //! JSON rendering
  std::string to_json() const;

 private:
  Type                         type_;
  bool                         bool_;
  double                       number_;
  std::string                  string_;
  RecordPtr                    record_;
  std::shared_ptr<const Array> array_;
};

/** Ordered mapping from field name to value.
 */
class Record {
 public:
  typedef std::pair<std::string, Value> Field;
  typedef std::vector<Field>::const_iterator const_iterator;

  Record() = default;
  Record(std::initializer_list<Field> fields);

  size_t size() const { return fields_.size(); }
  bool empty() const { return fields_.empty(); }

  const_iterator begin() const { return fields_.begin(); }
  const_iterator end() const { return fields_.end(); }

  //! Returns nullptr if field is not present
  const Value* find(const std::string& name) const;

  //! Returns nullptr if any path component is missing or is not a record
  const Value* find_path(const PropertyPath& path) const;

  //! Returns null value if field is not present
  Value get(const std::string& name) const;

  bool has(const std::string& name) const { return find(name) != nullptr; }

  //! Replace value in place or append new field
  void set(const std::string& name, Value value);

  //! Ordered structural equality
  bool operator == (const Record& other) const;
  bool operator != (const Record& other) const { return !(*this == other); }

  u64 hash() const;

  std::string to_json() const;

 private:
  std::vector<Field> fields_;
};

RecordPtr make_record(std::initializer_list<Record::Field> fields);

RecordPtr make_record(Record&& record);

struct ValueHash {
  std::size_t operator()(const Value& value) const noexcept {
    return static_cast<std::size_t>(value.hash());
  }
};

struct ValueEqual {
  bool operator()(const Value& lhs, const Value& rhs) const {
    return lhs == rhs;
  }
};

//! Hash/equality of the pointed-to records, not of the pointers
struct RecordPtrHash {
  std::size_t operator()(const RecordPtr& record) const noexcept {
    return static_cast<std::size_t>(record->hash());
  }
};

struct RecordPtrEqual {
  bool operator()(const RecordPtr& lhs, const RecordPtr& rhs) const {
    return lhs == rhs || *lhs == *rhs;
  }
};

std::ostream& operator << (std::ostream& os, const Value& value);
std::ostream& operator << (std::ostream& os, const Record& record);

}  // namespace streamql

#endif  // STREAMQL_RECORD_VALUE_H_
