/**
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef __CONSOLE_AGGREGATOR_CURSOR_HPP__
#define __CONSOLE_AGGREGATOR_CURSOR_HPP__

#include <stdint.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <console/console.hpp>

#include <process/time.hpp>

#include <stout/hashmap.hpp>
#include <stout/hashset.hpp>
#include <stout/option.hpp>

#include "aggregator/metadata.hpp"
#include "aggregator/registry.hpp"
#include "aggregator/stats.hpp"

namespace console {
namespace internal {
namespace aggregator {

// Everything a task subscriber has not been told yet.
struct TaskDelta
{
  TaskDelta() : tick(0) {}

  bool empty() const
  {
    return tasks.empty() &&
      metadata.empty() &&
      stats.empty() &&
      completed.empty();
  }

  // The earliest tick whose changes are part of this delta.
  uint64_t tick;

  // The instant the stats are measured against.
  process::Time now;

  // Newly announced tasks, in spawn order.
  std::vector<std::shared_ptr<const tasks::Task>> tasks;

  std::vector<MetadataEntry> metadata;

  // Task id -> current stats, for live tasks that changed.
  hashmap<uint64_t, TaskStats> stats;

  // Previously announced tasks that completed. These are not sent;
  // their absence from every later update tells the subscriber.
  std::vector<uint64_t> completed;
};


// Folds 'from', computed after 'into', into 'into' so that sending the
// result is equivalent to sending both in order.
void merge(TaskDelta* into, const TaskDelta& from);


// What one task subscriber was sent so far.
class TaskCursor
{
public:
  // Computes the changes since the previous call and records them as
  // sent. The first call reports every live task as new.
  TaskDelta diff(
      uint64_t tick,
      const std::vector<TaskSnapshot>& snapshots,
      const MetadataRegistry& registry,
      const process::Time& now);

  // Whether the task with the given id was announced and has not
  // been reported as completed.
  bool announced(uint64_t id) const { return tasks.contains(id); }

private:
  struct Sent
  {
    Sent(uint64_t _generation, uint64_t _version)
      : generation(_generation), version(_version) {}

    uint64_t generation;
    uint64_t version;
  };

  hashmap<uint64_t, Sent> tasks;
  hashset<uint64_t> metadata;
};


struct DetailsDelta
{
  DetailsDelta() : taskId(0), last(false) {}

  uint64_t taskId;
  process::Time now;

  // Encoded histogram, only when it changed.
  Option<std::string> histogram;

  // The task completed; nothing follows this delta.
  bool last;
};


void merge(DetailsDelta* into, const DetailsDelta& from);


// What one details subscriber was sent so far.
class DetailsCursor
{
public:
  explicit DetailsCursor(const TaskKey& _key) : key(_key) {}

  // Returns None once the task is no longer in the registry.
  Option<DetailsDelta> diff(
      const TaskRegistry& registry,
      const process::Time& now);

  const TaskKey key;

private:
  // Histogram version last sent.
  Option<uint64_t> sent;
};

} // namespace aggregator {
} // namespace internal {
} // namespace console {

#endif // __CONSOLE_AGGREGATOR_CURSOR_HPP__
