/**
 * \file datetime.h
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
#ifndef STREAMQL_COMMON_DATETIME_H_
#define STREAMQL_COMMON_DATETIME_H_

#include <chrono>
#include <stdexcept>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "streamql/common/types.h"

namespace streamql {

using Duration = Timestamp;

/**
 * Timestamp stores number of nanoseconds since epoch so it fits u64 and
 * doesn't suffer from the year 2038 problem.
 */

//! Timestamp parsing error
struct BadDateTimeFormat : std::runtime_error {
  BadDateTimeFormat(const char* str) : std::runtime_error(str) { }
};

//! Static utility class for date-time utility functions
struct DateTimeUtil {
  static Timestamp from_std_chrono(std::chrono::system_clock::time_point timestamp);

  static Timestamp from_boost_ptime(boost::posix_time::ptime timestamp);

  static boost::posix_time::ptime to_boost_ptime(Timestamp timestamp);

  /**
   * Convert ISO formatted timestamp to Timestamp value.
   * Only the basic format is supported ("20060102T150405" with optional
   * fraction of up to nine digits), the value is treated as UTC.
   * @throw BadDateTimeFormat on error
   */
  static Timestamp from_iso_string(const char* iso_str);

  /**
   * Convert timestamp to string.
   * @return number of bytes written including the terminating zero or
   *         negated required size if buffer is too small
   */
  static int to_iso_string(Timestamp ts, char* buffer, size_t buffer_size);
  static std::string to_iso_string(Timestamp ts);

  /**
   * Parse time-duration from string ("10s", "250ms", "5m", "111").
   * Number without suffix is treated as nanoseconds.
   * @throw BadDateTimeFormat on error
   */
  static Duration parse_duration(const char* str, size_t size);
};

}  // namespace streamql

#endif  // STREAMQL_COMMON_DATETIME_H_
