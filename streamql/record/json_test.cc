/*!
 * \file json_test.cc
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

#include "gtest/gtest.h"

namespace streamql {

TEST(TestJson, ScalarsKeepTheirType) {
  common::Status status;
  RecordPtr record;
  std::tie(status, record) = parse_record_json(R"(
  {"a": 1, "b": "x", "c": null, "d": true, "e": [1, "two"], "f": {"g": 2.5}, "neg": -3,
   "zip": "007", "hex": "0x10", "word": "null", "inf": "inf", "obj": {}, "arr": []})");
  ASSERT_TRUE(status.IsOk());
  EXPECT_EQ(R"({"a":1,"b":"x","c":null,"d":true,"e":[1,"two"],"f":{"g":2.5},"neg":-3,)"
            R"("zip":"007","hex":"0x10","word":"null","inf":"inf","obj":{},"arr":[]})",
            record->to_json());
  EXPECT_TRUE(record->get("zip").is_string());
  EXPECT_TRUE(record->get("word").is_string());
  EXPECT_TRUE(record->get("obj").is_record());
  EXPECT_TRUE(record->get("arr").is_array());
  EXPECT_TRUE(record->find_path({"f", "g"})->is_number());
  // string and number keys never collide
  EXPECT_NE(Value(7), record->get("zip"));
}

TEST(TestJson, BadJson) {
  common::Status status;
  RecordPtr record;
  std::tie(status, record) = parse_record_json(R"({"a": )");
  EXPECT_EQ(common::Status::kBadData, status.Code());
  EXPECT_FALSE(record);
  std::tie(status, record) = parse_record_json("[1, 2]");
  EXPECT_EQ(common::Status::kBadData, status.Code());
}

TEST(TestJson, RecordToJson) {
  auto record = make_record({
    {"id", 7},
    {"name", "ann"},
    {"none", Value()},
    {"nan", std::nan("")},
    {"tags", Array{Value("a"), Value("b")}},
    {"addr", make_record({{"zip", "007"}})},
  });
  auto object = record_to_json(*record);
  EXPECT_EQ(7.0, object.at("id").as_double());
  EXPECT_EQ("ann", object.at("name").as_string());
  EXPECT_TRUE(object.at("none").is_null());
  EXPECT_TRUE(object.at("nan").is_null());
  EXPECT_EQ(2u, object.at("tags").as_array().size());
  EXPECT_EQ("007", object.at("addr").as_object().at("zip").as_string());
  auto back = record_from_json(object);
  EXPECT_EQ(R"({"id":7,"name":"ann","none":null,"nan":null,"tags":["a","b"],"addr":{"zip":"007"}})",
            back->to_json());
}

}  // namespace streamql
