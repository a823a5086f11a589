/*!
 * \file select.cc
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
#include "streamql/query/select.h"

#include "streamql/common/logging.h"
#include "streamql/query/errors.h"
#include "streamql/query/query_processing/aggregation.h"
#include "streamql/query/query_processing/distinct.h"
#include "streamql/query/query_processing/filter.h"
#include "streamql/query/query_processing/join.h"
#include "streamql/query/query_processing/limiter.h"
#include "streamql/query/query_processing/minifier.h"
#include "streamql/query/query_processing/output.h"
#include "streamql/query/query_processing/projection.h"
#include "streamql/query/query_processing/repeater.h"
#include "streamql/query/query_processing/source.h"

namespace streamql {
namespace qp {

static const Query& checked(const QueryPtr& query) {
  if (!query) {
    throw QueryConfigError("empty query");
  }
  return *query;
}

static bool windowed(const Query& query) {
  return !query.source.is_subquery() && query.source.window.kind != WindowKind::NONE;
}

Select::Select(Context& ctx, QueryPtr query)
    : ctx_(&ctx)
      , query_(query)
      , fields_(resolve_fields(checked(query), ctx.functions()))
      , windowed_(windowed(*query))
      , aggregation_(fields_.aggregate_) {
  auto tail = add_source();
  tail = add_minifier(tail);
  if (windowed_) {
    tail = add_repeater(tail);
  } else if (query_->source.window.kind != WindowKind::NONE) {
    LOG(WARNING) << "window of a sub-query source is ignored";
  }
  tail = add_joins(tail);
  output_ = std::make_shared<Output>(this);
  add_unions();
  if (query_->where) {
    tail = add_filter(tail);
  }
  tail = aggregation_ ? add_aggregation(tail) : add_projection(tail);
  if (query_->distinct) {
    tail = add_distinct(tail);
  }
  if (query_->has_limit) {
    tail = add_limit(tail);
  }
  add_output(tail);
  start();
}

Select::~Select() {
  if (output_) {
    output_->owner_ = nullptr;
  }
  stop();
}

StagePtr Select::append(StagePtr tail, StagePtr next) {
  stages_.push_back(next);
  return tail->pass(next);
}

StagePtr Select::add_source() {
  const auto& source = query_->source;
  if (source.is_subquery()) {
    root_ = std::make_shared<Select>(*ctx_, source.query);
  } else {
    source_ = std::make_shared<StreamSource>(*ctx_, source.stream);
    root_ = source_;
  }
  stages_.push_back(root_);
  return root_;
}

StagePtr Select::add_minifier(StagePtr tail) {
  return append(tail, std::make_shared<Minifier>(fields_, *query_, ctx_->functions()));
}

StagePtr Select::add_repeater(StagePtr tail) {
  return append(tail, make_repeater(*ctx_, query_->source.window));
}

StagePtr Select::add_joins(StagePtr tail) {
  for (const auto& spec: query_->joins) {
    auto join = std::make_shared<Join>(*ctx_, spec, root_, joins_.empty());
    joins_.push_back(join);
    tail = append(tail, join);
  }
  return tail;
}

void Select::add_unions() {
  for (const auto& item: query_->unions) {
    if (!item.all) {
      throw QueryConfigError("only UNION ALL is supported");
    }
    auto select = std::make_shared<Select>(*ctx_, item.query);
    select->pass(output_);
    unions_.push_back(select);
  }
}

StagePtr Select::add_filter(StagePtr tail) {
  auto condition = Expression::compile(query_->where, ctx_->functions());
  return append(tail, std::make_shared<Filter>(condition));
}

StagePtr Select::add_aggregation(StagePtr tail) {
  return append(tail, std::make_shared<Aggregation>(fields_, query_->group, ctx_->functions(),
                                                    ctx_->config().nan_policy));
}

StagePtr Select::add_projection(StagePtr tail) {
  if (query_->group) {
    if (query_->group->having) {
      throw QueryConfigError("having requires an aggregate function in the select list");
    }
    LOG(INFO) << "group by without aggregate functions, rows are projected";
  }
  return append(tail, std::make_shared<Projection>(fields_));
}

StagePtr Select::add_distinct(StagePtr tail) {
  return append(tail, std::make_shared<Distinct>());
}

StagePtr Select::add_limit(StagePtr tail) {
  return append(tail, std::make_shared<Limiter>(query_->limit));
}

void Select::add_output(StagePtr tail) {
  append(tail, output_);
}

void Select::start() {
  if (source_) {
    source_->start();
  }
  for (auto& join: joins_) {
    join->start();
  }
}

std::vector<std::string> Select::describe() const {
  std::vector<std::string> names;
  for (const auto& stage: stages_) {
    names.push_back(stage->name());
  }
  return names;
}

void Select::insert(const RecordPtr& record) {
  root_->insert(record);
}

void Select::remove(const RecordPtr& record) {
  root_->remove(record);
}

void Select::insert_remove(const RecordPtr& inserted, const RecordPtr& removed) {
  root_->insert_remove(inserted, removed);
}

void Select::stop() {
  if (root_) {
    root_->stop();
  }
  for (auto& select: unions_) {
    select->stop();
  }
  Stage::stop();
}

}  // namespace qp
}  // namespace streamql
