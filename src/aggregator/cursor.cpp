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

#include <algorithm>
#include <memory>
#include <vector>

#include <stout/foreach.hpp>

#include <glog/logging.h>

#include "aggregator/cursor.hpp"

using namespace process;

using std::shared_ptr;
using std::vector;

namespace console {
namespace internal {
namespace aggregator {

void merge(TaskDelta* into, const TaskDelta& from)
{
  CHECK_NOTNULL(into);

  into->now = from.now;

  into->metadata.insert(
      into->metadata.end(),
      from.metadata.begin(),
      from.metadata.end());

  foreach (uint64_t id, from.completed) {
    into->stats.erase(id);

    // A task that was announced and completed while nothing could be
    // delivered is never seen by the subscriber at all.
    vector<shared_ptr<const tasks::Task>>::iterator task = std::find_if(
        into->tasks.begin(),
        into->tasks.end(),
        [=](const shared_ptr<const tasks::Task>& task) {
          return task->id().id() == id;
        });

    if (task != into->tasks.end()) {
      into->tasks.erase(task);
    } else {
      into->completed.push_back(id);
    }
  }

  into->tasks.insert(into->tasks.end(), from.tasks.begin(), from.tasks.end());

  foreachpair (uint64_t id, const TaskStats& stats, from.stats) {
    into->stats.put(id, stats);
  }
}


TaskDelta TaskCursor::diff(
    uint64_t tick,
    const vector<TaskSnapshot>& snapshots,
    const MetadataRegistry& registry,
    const Time& now)
{
  TaskDelta delta;
  delta.tick = tick;
  delta.now = now;
  delta.metadata = registry.drain(&metadata);

  // Number of entries of 'tasks' matched by a snapshot.
  size_t matched = 0;

  foreach (const TaskSnapshot& snapshot, snapshots) {
    const uint64_t id = snapshot.key.id;

    Option<Sent> sent = tasks.get(id);

    // The task we announced under this id was released and the id was
    // reused before we observed the completion.
    if (sent.isSome() && sent.get().generation != snapshot.key.generation) {
      delta.completed.push_back(id);
      tasks.erase(id);
      sent = None();
    }

    if (snapshot.completedAt.isSome()) {
      if (sent.isSome()) {
        delta.completed.push_back(id);
        tasks.erase(id);
      }
      continue;
    }

    matched++;

    if (sent.isSome() && sent.get().version == snapshot.version) {
      continue;
    }

    if (sent.isNone()) {
      delta.tasks.push_back(snapshot.task);
    }

    delta.stats.put(id, snapshot.stats);
    tasks.put(id, Sent(snapshot.key.generation, snapshot.version));
  }

  // Anything left over was released without us seeing it complete.
  if (tasks.size() > matched) {
    hashset<uint64_t> live;
    foreach (const TaskSnapshot& snapshot, snapshots) {
      if (snapshot.completedAt.isNone()) {
        live.insert(snapshot.key.id);
      }
    }

    foreach (uint64_t id, tasks.keys()) {
      if (!live.contains(id)) {
        delta.completed.push_back(id);
        tasks.erase(id);
      }
    }
  }

  return delta;
}


void merge(DetailsDelta* into, const DetailsDelta& from)
{
  CHECK_NOTNULL(into);
  CHECK_EQ(into->taskId, from.taskId);

  into->now = from.now;

  if (from.histogram.isSome()) {
    into->histogram = from.histogram;
  }

  into->last = into->last || from.last;
}


Option<DetailsDelta> DetailsCursor::diff(
    const TaskRegistry& registry,
    const Time& now)
{
  Option<DetailsSnapshot> details = registry.details(key, sent);
  if (details.isNone()) {
    return None();
  }

  DetailsDelta delta;
  delta.taskId = key.id;
  delta.now = now;
  delta.last = details.get().completed;

  if (details.get().histogram.isSome()) {
    delta.histogram = details.get().histogram.get().encode();
    sent = details.get().histogramVersion;
  }

  return delta;
}

} // namespace aggregator {
} // namespace internal {
} // namespace console {
