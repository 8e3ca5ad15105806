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

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>
#include <stout/unreachable.hpp>

#include <glog/logging.h>

#include "aggregator/registry.hpp"

using namespace process;

using std::shared_ptr;
using std::vector;

namespace console {
namespace internal {
namespace aggregator {

const size_t TaskRegistry::SHARDS;


void TaskState::finishPoll(const Time& at, const Histogram& prototype)
{
  CHECK(polling);
  CHECK_SOME(stats.lastPollStarted);

  Duration elapsed = at - stats.lastPollStarted.get();

  stats.lastPollEnded = at;
  stats.busy += elapsed;
  polling = false;

  if (histogram.get() == NULL) {
    histogram = Owned<Histogram>(new Histogram(prototype));
  }

  histogram->record(elapsed.ns());

  ++histogramVersion;
  ++version;
}


Try<Owned<TaskRegistry>> TaskRegistry::create(const Flags& flags)
{
  Try<Histogram> histogram = Histogram::create(
      flags.histogram_max.ns(),
      flags.histogram_significant_figures);

  if (histogram.isError()) {
    return Error("Invalid poll time histogram: " + histogram.error());
  }

  return Owned<TaskRegistry>(new TaskRegistry(histogram.get()));
}


TaskRegistry::TaskRegistry(const Histogram& _prototype)
  : prototype(_prototype),
    nextId(1),
    nextSequence(0) {}


Try<TaskKey> TaskRegistry::spawn(
    uint64_t metadata,
    tasks::Task::Kind kind,
    const vector<common::Field>& fields,
    const vector<uint64_t>& parents,
    const Time& at)
{
  if (!metadata_.contains(metadata)) {
    return Error("Unknown metadata " + stringify(metadata));
  }

  TaskKey key;
  uint64_t sequence;

  synchronized (allocation) {
    if (!released.empty()) {
      key = released.front();
      released.pop_front();
      key.generation++;
    } else {
      key = TaskKey(nextId++, 0);
    }

    sequence = nextSequence++;
  }

  tasks::Task* task = new tasks::Task();
  task->mutable_id()->set_id(key.id);
  task->mutable_metadata()->set_id(metadata);
  task->set_kind(kind);

  foreach (const common::Field& field, fields) {
    task->add_fields()->CopyFrom(field);
  }

  foreach (uint64_t parent, parents) {
    task->add_parents()->set_id(parent);
  }

  shared_ptr<TaskState> state(
      new TaskState(key, sequence, shared_ptr<const tasks::Task>(task), at));

  Shard& s = shard(key.id);

  synchronized (s.mutex) {
    if (s.tasks.contains(key.id)) {
      return Error("Duplicate task id " + stringify(key.id));
    }

    s.tasks[key.id] = state;
  }

  VLOG(2) << "Spawned task " << key;

  return key;
}


Try<Nothing> TaskRegistry::complete(const TaskKey& key, const Time& at)
{
  Try<shared_ptr<TaskState>> state = lookup(key);
  if (state.isError()) {
    LOG(WARNING) << "Dropping completion: " << state.error();
    return Error(state.error());
  }

  Option<Error> error;

  synchronized (state.get()->mutex) {
    const TaskStats& stats = state.get()->stats;

    if (state.get()->completedAt.isSome()) {
      error = Error("Task " + stringify(key) + " has already completed");
    } else if (at < stats.createdAt) {
      error = Error(
          "Task " + stringify(key) + " completed before it was spawned");
    } else if (stats.lastPollEnded.isSome() && at < stats.lastPollEnded.get()) {
      error = Error(
          "Task " + stringify(key) + " completed before its last poll ended");
    } else if (state.get()->polling && at < stats.lastPollStarted.get()) {
      error = Error(
          "Task " + stringify(key) + " completed before its poll started");
    } else {
      if (state.get()->polling) {
        VLOG(1) << "Task " << key << " completed while being polled";
        state.get()->finishPoll(at, prototype);
      }

      state.get()->completedAt = at;
      ++state.get()->version;
    }
  }

  if (error.isSome()) {
    LOG(WARNING) << "Dropping completion: " << error.get().message;
    return error.get();
  }

  VLOG(2) << "Completed task " << key;

  return Nothing();
}


Option<TaskKey> TaskRegistry::find(uint64_t id) const
{
  shared_ptr<TaskState> state;

  Shard& s = shard(id);
  synchronized (s.mutex) {
    Option<shared_ptr<TaskState>> found = s.tasks.get(id);
    if (found.isNone()) {
      return None();
    }

    state = found.get();
  }

  synchronized (state->mutex) {
    if (state->completedAt.isSome()) {
      return None();
    }
  }

  return state->key;
}


Try<shared_ptr<TaskState>> TaskRegistry::lookup(const TaskKey& key) const
{
  Shard& s = shard(key.id);

  synchronized (s.mutex) {
    Option<shared_ptr<TaskState>> state = s.tasks.get(key.id);
    if (state.isNone()) {
      return Error("Unknown task " + stringify(key.id));
    }

    if (state.get()->key.generation != key.generation) {
      return Error(
          "Stale task " + stringify(key) + ", the id now belongs to " +
          stringify(state.get()->key));
    }

    return state.get();
  }

  UNREACHABLE();
}


vector<TaskSnapshot> TaskRegistry::snapshot() const
{
  vector<shared_ptr<TaskState>> states;

  for (size_t i = 0; i < SHARDS; i++) {
    synchronized (shards[i].mutex) {
      foreachvalue (const shared_ptr<TaskState>& state, shards[i].tasks) {
        states.push_back(state);
      }
    }
  }

  vector<TaskSnapshot> snapshots;
  snapshots.reserve(states.size());

  foreach (const shared_ptr<TaskState>& state, states) {
    TaskSnapshot snapshot;
    snapshot.key = state->key;
    snapshot.sequence = state->sequence;
    snapshot.task = state->task;

    synchronized (state->mutex) {
      snapshot.stats = state->stats;
      snapshot.version = state->version;
      snapshot.completedAt = state->completedAt;
    }

    snapshots.push_back(snapshot);
  }

  std::sort(
      snapshots.begin(),
      snapshots.end(),
      [](const TaskSnapshot& left, const TaskSnapshot& right) {
        return left.sequence < right.sequence;
      });

  return snapshots;
}


Option<DetailsSnapshot> TaskRegistry::details(
    const TaskKey& key,
    const Option<uint64_t>& since) const
{
  Try<shared_ptr<TaskState>> state = lookup(key);
  if (state.isError()) {
    return None();
  }

  DetailsSnapshot details;

  synchronized (state.get()->mutex) {
    details.completed = state.get()->completedAt.isSome();
    details.histogramVersion = state.get()->histogramVersion;

    if (state.get()->histogram.get() != NULL &&
        (since.isNone() || since.get() != details.histogramVersion)) {
      details.histogram = *state.get()->histogram;
    }
  }

  return details;
}


Try<Nothing> TaskRegistry::release(const TaskKey& key)
{
  Shard& s = shard(key.id);

  synchronized (s.mutex) {
    Option<shared_ptr<TaskState>> state = s.tasks.get(key.id);
    if (state.isNone() || state.get()->key.generation != key.generation) {
      return Error("Unknown task " + stringify(key));
    }

    synchronized (state.get()->mutex) {
      if (state.get()->completedAt.isNone()) {
        return Error("Task " + stringify(key) + " has not completed");
      }
    }

    s.tasks.erase(key.id);
  }

  synchronized (allocation) {
    released.push_back(key);
  }

  VLOG(2) << "Released task " << key;

  return Nothing();
}


size_t TaskRegistry::size() const
{
  size_t size = 0;

  for (size_t i = 0; i < SHARDS; i++) {
    synchronized (shards[i].mutex) {
      size += shards[i].tasks.size();
    }
  }

  return size;
}

} // namespace aggregator {
} // namespace internal {
} // namespace console {
