/*!
 * \file thread_local.h
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
#ifndef STREAMQL_COMMON_THREAD_LOCAL_H_
#define STREAMQL_COMMON_THREAD_LOCAL_H_

namespace streamql {
namespace common {

//! One instance of T per thread, created on first access.
template <typename T>
class ThreadLocalStore {
 public:
  static T* Get() {
    static thread_local T inst;
    return &inst;
  }

 private:
  ThreadLocalStore() { }
};

}  // namespace common
}  // namespace streamql

#endif  // STREAMQL_COMMON_THREAD_LOCAL_H_
