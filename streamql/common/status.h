/*!
 * \file status.h
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
#ifndef STREAMQL_COMMON_STATUS_H_
#define STREAMQL_COMMON_STATUS_H_

#include <memory>
#include <string>
#include <algorithm>

#include "streamql/common/thread_local.h"

namespace streamql {
namespace common {

class Status {
 public:
  // Detail message is kept per thread, status objects can not cross threads.
  typedef ThreadLocalStore<std::string> ErrorDetailString;

  enum ErrorCode {
    kOk = 0,
    kBadArg,
    kBadData,
    kNotFound,
    kQueryParsingError,
    kInternal
  };

  Status() : code_(kOk) { }
  ~Status() { }

  Status(ErrorCode code) : code_(code) { }
  Status(ErrorCode code, const std::string& msg) : Status(code) { }

  Status(const Status& s) : code_(s.code_) { }
  void operator=(const Status& s) {
    this->code_ = s.code_;
  }

  Status(Status&& s) : code_(s.code_) { }
  void operator=(Status&& s) { this->code_ = s.code_; }

  bool IsOk() const { return code_ == kOk; }

  ErrorCode Code() const {
    return code_;
  }

  bool operator==(const Status& x) const {
    return x.code_ == this->code_;
  }
  bool operator!=(const Status& x) const {
    return !(*this == x);
  }

  std::string ToString() const {
    std::string error_msg;
    switch (code_) {
      case kOk:
        return "OK";

      case kBadArg:
        error_msg = "Bad argument";
        break;
      case kBadData:
        error_msg = "Bad data";
        break;
      case kNotFound:
        error_msg = "Not found";
        break;
      case kQueryParsingError:
        error_msg = "Query Parsing Error";
        break;
      case kInternal:
      default:
        error_msg = "Internal error";
        break;
    }
    return error_msg + " " + *ErrorDetailString::Get();
  }

  static Status Ok() { return Status(); }

#define ADD_UTILITY(name, code)                   \
  static Status name(const std::string& msg) {    \
    ErrorDetailString::Get()->assign(msg);        \
    return Status(code, msg);                     \
  }                                               \
  static Status name() {                          \
    ErrorDetailString::Get()->clear();            \
    return Status(code);                          \
  }

  ADD_UTILITY(BadArg,            kBadArg           )
  ADD_UTILITY(BadData,           kBadData          )
  ADD_UTILITY(NotFound,          kNotFound         )
  ADD_UTILITY(QueryParsingError, kQueryParsingError)
  ADD_UTILITY(Internal,          kInternal         )

#undef ADD_UTILITY

 private:
  ErrorCode code_;
};

}  // namespace common
}  // namespace streamql

#define CHECK_STATUS(STATUS)                           \
  do {                                                 \
    streamql::common::Status __st__ = STATUS;          \
    if (!__st__.IsOk()) {                              \
      return __st__;                                   \
    }                                                  \
  } while (0)

#endif  // STREAMQL_COMMON_STATUS_H_
