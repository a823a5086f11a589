/*!
 * \file minifier.cc
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
#include "streamql/query/query_processing/minifier.h"

#include "streamql/common/logging.h"

namespace streamql {
namespace qp {

Minifier::Selector* Minifier::Selector::child(const std::string& name) {
  for (auto& kv: children_) {
    if (kv.first == name) {
      return kv.second.get();
    }
  }
  children_.push_back(std::make_pair(name, std::unique_ptr<Selector>(new Selector())));
  return children_.back().second.get();
}

Minifier::Minifier(const ResolvedFields& fields, const Query& query, const FunctionRegistry& udfs)
    : star_(fields.star_) {
  if (star_) {
    LOG(INFO) << "minifier: `*` is selected, records pass through";
    return;
  }
  std::vector<PropertyPath> paths = fields.used_properties();
  auto collect = [&](const ExprNodePtr& node) {
    if (node) {
      merge_properties(&paths, Expression::compile(node, udfs)->used_properties());
    }
  };
  collect(query.where);
  if (query.group) {
    for (const auto& field: query.group->fields) {
      collect(field);
    }
    collect(query.group->having);
  }
  for (const auto& join: query.joins) {
    for (const auto& key: join.on) {
      collect(key.left);
    }
  }
  for (const auto& path: paths) {
    add_path(path);
  }
}

Minifier::Minifier(const std::vector<PropertyPath>& paths)
    : star_(false) {
  for (const auto& path: paths) {
    add_path(path);
  }
}

void Minifier::add_path(const PropertyPath& path) {
  if (path.empty()) {
    return;
  }
  merge_properties(&paths_, std::vector<PropertyPath>{path});
  Selector* node = &root_;
  for (const auto& name: path) {
    node = node->child(name);
    if (node->leaf_) {
      // shorter path already keeps the whole value
      return;
    }
  }
  node->leaf_ = true;
  node->children_.clear();
}

static Record minify_record(const Record& record, const Minifier::Selector& selector) {
  Record result;
  for (const auto& kv: selector.children_) {
    const Value* value = record.find(kv.first);
    if (value == nullptr) {
      continue;
    }
    if (kv.second->leaf_) {
      result.set(kv.first, *value);
    } else if (value->is_record()) {
      auto nested = minify_record(*value->as_record(), *kv.second);
      if (!nested.empty()) {
        result.set(kv.first, Value(make_record(std::move(nested))));
      }
    }
  }
  return result;
}

RecordPtr Minifier::minify(const RecordPtr& record) const {
  if (star_) {
    return record;
  }
  return make_record(minify_record(*record, root_));
}

void Minifier::insert(const RecordPtr& record) {
  emit_insert(minify(record));
}

void Minifier::remove(const RecordPtr& record) {
  emit_remove(minify(record));
}

void Minifier::insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
  emit_insert_remove(minify(inserted), minify(removed));
}

}  // namespace qp
}  // namespace streamql
