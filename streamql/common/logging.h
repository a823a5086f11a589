/*!
 * \file logging.h
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
#ifndef STREAMQL_COMMON_LOGGING_H_
#define STREAMQL_COMMON_LOGGING_H_

#include <functional>
#include <sstream>
#include <string>

namespace streamql {
namespace common {

enum LogSeverity {
  LOG_SEVERITY_INFO = 0,
  LOG_SEVERITY_WARNING,
  LOG_SEVERITY_ERROR,
  LOG_SEVERITY_FATAL,
};

//! Receives every formatted line at or above the minimum severity.
typedef std::function<void(LogSeverity, const std::string&)> LogSink;

//! Set minimum severity, messages below it are dropped. FATAL is never dropped.
void set_min_log_level(LogSeverity level);

LogSeverity get_min_log_level();

//! Replace the sink (stderr by default). Empty sink restores the default.
void set_log_sink(LogSink sink);

const char* severity_name(LogSeverity severity);

class LogMessage {
 public:
  LogMessage(const char* file, int line, LogSeverity severity);
  ~LogMessage();

  LogMessage(const LogMessage&) = delete;
  LogMessage& operator = (const LogMessage&) = delete;

  std::ostream& stream() { return stream_; }

 private:
  LogSeverity        severity_;
  std::ostringstream stream_;
};

}  // namespace common
}  // namespace streamql

#define LOG(severity)                                                     \
  ::streamql::common::LogMessage(__FILE__, __LINE__,                      \
                                 ::streamql::common::LOG_SEVERITY_##severity).stream()

#endif  // STREAMQL_COMMON_LOGGING_H_
