/*!
 * \file containers.h
 * Hash containers keyed by values and records.
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
#ifndef STREAMQL_RECORD_CONTAINERS_H_
#define STREAMQL_RECORD_CONTAINERS_H_

#include <unordered_map>

#include <tsl/robin_map.h>

#include "streamql/record/value.h"

namespace streamql {

#ifdef USE_STD_HASHMAP
#define MapClass std::unordered_map
#else
#define MapClass tsl::robin_map
#endif

//! Map keyed by structural value equality
template <class T>
using ValueMap = MapClass<Value, T, ValueHash, ValueEqual>;

//! Map keyed by structural record equality, pointers are not compared
template <class T>
using RecordMap = MapClass<RecordPtr, T, RecordPtrHash, RecordPtrEqual>;

}  // namespace streamql

#endif  // STREAMQL_RECORD_CONTAINERS_H_
