/*!
 * \file logging.cc
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
#include "streamql/common/logging.h"

#include <stdlib.h>
#include <string.h>

#include <iostream>

namespace streamql {
namespace common {

namespace {

struct LogState {
  LogSeverity min_level = LOG_SEVERITY_INFO;
  LogSink     sink;

  static LogState& get() {
    static LogState inst;
    return inst;
  }
};

const char* basename_of(const char* path) {
  const char* slash = strrchr(path, '/');
  return slash ? slash + 1 : path;
}

}  // namespace

void set_min_log_level(LogSeverity level) {
  LogState::get().min_level = level;
}

LogSeverity get_min_log_level() {
  return LogState::get().min_level;
}

void set_log_sink(LogSink sink) {
  LogState::get().sink = sink;
}

const char* severity_name(LogSeverity severity) {
  switch (severity) {
    case LOG_SEVERITY_INFO:
      return "INFO";
    case LOG_SEVERITY_WARNING:
      return "WARNING";
    case LOG_SEVERITY_ERROR:
      return "ERROR";
    case LOG_SEVERITY_FATAL:
      return "FATAL";
  }
  return "UNKNOWN";
}

LogMessage::LogMessage(const char* file, int line, LogSeverity severity)
    : severity_(severity) {
  stream_ << severity_name(severity)[0] << " " << basename_of(file) << ":" << line << "] ";
}

LogMessage::~LogMessage() {
  auto& state = LogState::get();
  if (severity_ >= state.min_level || severity_ == LOG_SEVERITY_FATAL) {
    if (state.sink) {
      state.sink(severity_, stream_.str());
    } else {
      std::cerr << stream_.str() << std::endl;
    }
  }
  if (severity_ == LOG_SEVERITY_FATAL) {
    std::cerr.flush();
    abort();
  }
}

}  // namespace common
}  // namespace streamql
