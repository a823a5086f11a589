/*!
 * \file streamql_run.cc
 * Runs one query over JSON event lines read from stdin.
 *
 * Usage: streamql_run QUERY.json [CONFIG.json]
 *
 * Input line: {"op": "insert"|"remove", "stream": "s", "record": {...}, "time": "20240101T000000"}
 * Output line: {"op": "insert"|"remove", "record": {...}}, updates are
 * written as {"op": "update", "record": {...}, "old": {...}}.
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
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <boost/json.hpp>

#include "streamql/common/config.h"
#include "streamql/common/datetime.h"
#include "streamql/common/logging.h"
#include "streamql/core/context.h"
#include "streamql/query/errors.h"
#include "streamql/query/queryparser.h"
#include "streamql/query/select.h"
#include "streamql/record/json.h"

namespace streamql {

//! Writes query output to stdout
struct Printer : qp::Stage {
  std::ostream& out_;

  explicit Printer(std::ostream& out) : out_(out) { }

  virtual void insert(const RecordPtr& record) {
    out_ << R"({"op":"insert","record":)" << record->to_json() << "}" << std::endl;
  }

  virtual void remove(const RecordPtr& record) {
    out_ << R"({"op":"remove","record":)" << record->to_json() << "}" << std::endl;
  }

  virtual void insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
    out_ << R"({"op":"update","record":)" << inserted->to_json()
         << R"(,"old":)" << removed->to_json() << "}" << std::endl;
  }

  virtual const char* name() const { return "printer"; }
};

static bool read_file(const char* path, std::string* content) {
  std::ifstream input(path);
  if (!input) {
    return false;
  }
  std::stringstream str;
  str << input.rdbuf();
  *content = str.str();
  return true;
}

static std::string text_field(boost::json::object const& event, const char* name) {
  auto it = event.find(name);
  if (it == event.end() || !it->value().is_string()) {
    return std::string();
  }
  const auto& text = it->value().get_string();
  return std::string(text.data(), text.size());
}

static common::Status apply_event(Context& ctx, ManualClock& clock, const std::string& line) {
  boost::json::error_code ec;
  auto parsed = boost::json::parse(line, ec);
  if (ec) {
    return common::Status::BadData("bad json: " + ec.message());
  }
  if (!parsed.is_object()) {
    return common::Status::BadData("event must be a JSON object");
  }
  const auto& event = parsed.get_object();
  auto time = text_field(event, "time");
  if (!time.empty()) {
    Timestamp ts;
    try {
      ts = DateTimeUtil::from_iso_string(time.c_str());
    } catch (const BadDateTimeFormat& e) {
      return common::Status::BadData(std::string("bad time: ") + e.what());
    }
    if (ts > clock.now()) {
      clock.set(ts);
    }
    ctx.run_timers();
  }
  auto name = text_field(event, "stream");
  if (name.empty()) {
    return common::Status::BadData("`stream` is missing");
  }
  auto body = event.find("record");
  if (body == event.end() || !body->value().is_object()) {
    return common::Status::BadData("`record` is missing");
  }
  auto record = record_from_json(body->value().get_object());
  auto op = text_field(event, "op");
  if (op.empty() || op == "insert") {
    ctx.streams().publish_insert(name, record);
  } else if (op == "remove") {
    ctx.streams().publish_remove(name, record);
  } else {
    return common::Status::BadData("unknown op `" + op + "`");
  }
  return common::Status::Ok();
}

static int run(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    std::cerr << "usage: " << argv[0] << " QUERY.json [CONFIG.json]" << std::endl;
    return 1;
  }
  EngineConfig config;
  if (argc == 3) {
    std::string text;
    if (!read_file(argv[2], &text)) {
      LOG(ERROR) << "can't read config " << argv[2];
      return 1;
    }
    common::Status status;
    std::tie(status, config) = EngineConfig::from_json(text);
    if (!status.IsOk()) {
      LOG(ERROR) << "bad config " << argv[2] << ", " << status.ToString();
      return 1;
    }
  }
  common::set_min_log_level(config.log_level);

  std::string text;
  if (!read_file(argv[1], &text)) {
    LOG(ERROR) << "can't read query " << argv[1];
    return 1;
  }
  common::Status status;
  qp::QueryPtr query;
  qp::ErrorMsg error_msg;
  std::tie(status, query, error_msg) = qp::QueryParser::parse_query(text.c_str());
  if (!status.IsOk()) {
    LOG(ERROR) << "bad query " << argv[1] << ", " << error_msg;
    return 1;
  }

  auto clock = std::make_shared<ManualClock>(WallClock().now());
  Context ctx(config, clock);
  std::shared_ptr<qp::Select> select;
  try {
    select = std::make_shared<qp::Select>(ctx, query);
  } catch (const qp::QueryConfigError& e) {
    LOG(ERROR) << "query can't be built, " << e.what();
    return 1;
  }
  select->pass(std::make_shared<Printer>(std::cout));

  std::string line;
  u64 lineno = 0;
  while (std::getline(std::cin, line)) {
    lineno++;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    auto result = apply_event(ctx, *clock, line);
    if (!result.IsOk()) {
      LOG(WARNING) << "line " << lineno << " skipped, " << result.ToString();
    }
  }
  select->stop();
  return 0;
}

}  // namespace streamql

int main(int argc, char** argv) {
  return streamql::run(argc, argv);
}
