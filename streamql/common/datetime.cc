/**
 * \file datetime.cc
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
#include "streamql/common/datetime.h"

#include <stdio.h>
#include <string.h>

#include <string>

namespace streamql {

static const boost::posix_time::ptime EPOCH = boost::posix_time::from_time_t(0);

static const u64 NANOS_PER_SEC = 1000000000ull;

Timestamp DateTimeUtil::from_std_chrono(std::chrono::system_clock::time_point timestamp) {
  auto duration = timestamp.time_since_epoch();
  return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count());
}

Timestamp DateTimeUtil::from_boost_ptime(boost::posix_time::ptime timestamp) {
  boost::posix_time::time_duration duration = timestamp - EPOCH;
  return static_cast<Timestamp>(duration.total_nanoseconds());
}

boost::posix_time::ptime DateTimeUtil::to_boost_ptime(Timestamp timestamp) {
  auto secs = static_cast<long>(timestamp / NANOS_PER_SEC);
  auto micros = static_cast<long>((timestamp % NANOS_PER_SEC) / 1000);
  return EPOCH + boost::posix_time::seconds(secs) + boost::posix_time::microseconds(micros);
}

Timestamp DateTimeUtil::from_iso_string(const char* iso_str) {
  std::string str(iso_str);
  std::string fraction;
  auto dot = str.find('.');
  if (dot != std::string::npos) {
    fraction = str.substr(dot + 1);
    str.resize(dot);
  }
  if (str.size() != 15 || str[8] != 'T') {
    throw BadDateTimeFormat("bad timestamp format, expected YYYYMMDDThhmmss");
  }
  if (fraction.size() > 9) {
    throw BadDateTimeFormat("bad timestamp format, fraction is too long");
  }
  boost::posix_time::ptime pt;
  try {
    pt = boost::posix_time::from_iso_string(str);
  } catch (const std::exception&) {
    throw BadDateTimeFormat("bad timestamp format");
  }
  if (pt.is_special()) {
    throw BadDateTimeFormat("bad timestamp format");
  }
  u64 nanos = 0;
  for (size_t i = 0; i < 9; i++) {
    nanos *= 10;
    if (i < fraction.size()) {
      char c = fraction[i];
      if (c < '0' || c > '9') {
        throw BadDateTimeFormat("bad timestamp format, invalid fraction");
      }
      nanos += static_cast<u64>(c - '0');
    }
  }
  return from_boost_ptime(pt) + nanos;
}

int DateTimeUtil::to_iso_string(Timestamp ts, char* buffer, size_t buffer_size) {
  auto secs = static_cast<long>(ts / NANOS_PER_SEC);
  auto nanos = ts % NANOS_PER_SEC;
  boost::posix_time::ptime pt = EPOCH + boost::posix_time::seconds(secs);
  std::string prefix = boost::posix_time::to_iso_string(pt);
  char fraction[16];
  snprintf(fraction, sizeof(fraction), ".%09llu", static_cast<unsigned long long>(nanos));
  std::string result = prefix + fraction;
  int required = static_cast<int>(result.size() + 1);
  if (buffer_size < result.size() + 1) {
    return -required;
  }
  memcpy(buffer, result.c_str(), result.size() + 1);
  return required;
}

std::string DateTimeUtil::to_iso_string(Timestamp ts) {
  char buffer[64];
  int len = to_iso_string(ts, buffer, sizeof(buffer));
  if (len <= 0) {
    return std::string();
  }
  return std::string(buffer);
}

Duration DateTimeUtil::parse_duration(const char* str, size_t size) {
  size_t pos = 0;
  u64 value = 0;
  while (pos < size && str[pos] >= '0' && str[pos] <= '9') {
    value = value * 10 + static_cast<u64>(str[pos] - '0');
    pos++;
  }
  if (pos == 0) {
    throw BadDateTimeFormat("bad duration format, number expected");
  }
  std::string suffix(str + pos, size - pos);
  u64 mult;
  if (suffix.empty() || suffix == "n" || suffix == "ns") {
    mult = 1;
  } else if (suffix == "us") {
    mult = 1000ull;
  } else if (suffix == "ms") {
    mult = 1000000ull;
  } else if (suffix == "s" || suffix == "sec") {
    mult = NANOS_PER_SEC;
  } else if (suffix == "m" || suffix == "min") {
    mult = 60 * NANOS_PER_SEC;
  } else if (suffix == "h") {
    mult = 3600 * NANOS_PER_SEC;
  } else if (suffix == "d") {
    mult = 24 * 3600 * NANOS_PER_SEC;
  } else {
    throw BadDateTimeFormat("bad duration format, unknown unit");
  }
  return value * mult;
}

}  // namespace streamql
