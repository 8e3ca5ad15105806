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

#ifndef __CONSOLE_AGGREGATOR_REGISTRY_HPP__
#define __CONSOLE_AGGREGATOR_REGISTRY_HPP__

#include <stdint.h>

#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include <console/console.hpp>

#include <process/owned.hpp>
#include <process/time.hpp>

#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "aggregator/flags.hpp"
#include "aggregator/histogram.hpp"
#include "aggregator/metadata.hpp"
#include "aggregator/stats.hpp"

namespace console {
namespace internal {
namespace aggregator {

// The state of one live (or completed but retained) task. The spawn
// record is immutable; everything else is guarded by 'mutex'.
struct TaskState
{
  TaskState(
      const TaskKey& _key,
      uint64_t _sequence,
      const std::shared_ptr<const tasks::Task>& _task,
      const process::Time& createdAt)
    : key(_key),
      sequence(_sequence),
      task(_task),
      polling(false),
      version(0),
      histogramVersion(0)
  {
    stats.createdAt = createdAt;
  }

  // Ends the poll in progress at 'at', accounting its duration to the
  // busy time and the histogram (created from 'prototype' on the first
  // completed poll). Must be called with 'mutex' held.
  void finishPoll(const process::Time& at, const Histogram& prototype);

  const TaskKey key;
  const uint64_t sequence;
  const std::shared_ptr<const tasks::Task> task;

  std::mutex mutex;

  TaskStats stats;
  bool polling;
  uint64_t version;

  process::Owned<Histogram> histogram;
  uint64_t histogramVersion;

  Option<process::Time> completedAt;
};


// Owns every task the runtime spawned and has not yet been released,
// together with the metadata registry. Producers on any thread spawn,
// complete and (through the 'Recorder') update tasks concurrently; the
// registry is sharded by task id and every task has its own lock, so
// no operation serializes on a global lock except id allocation.
class TaskRegistry
{
public:
  static Try<process::Owned<TaskRegistry>> create(const Flags& flags);

  // Registers a new task created at 'at'. Fails if 'metadata' was not
  // interned in 'metadata()'.
  Try<TaskKey> spawn(
      uint64_t metadata,
      tasks::Task::Kind kind,
      const std::vector<common::Field>& fields,
      const std::vector<uint64_t>& parents,
      const process::Time& at);

  // Marks the task completed; its stats are final from now on. A poll
  // still in progress ends at 'at'.
  Try<Nothing> complete(const TaskKey& key, const process::Time& at);

  // Returns the key of the live task with the given wire id.
  Option<TaskKey> find(uint64_t id) const;

  Try<std::shared_ptr<TaskState>> lookup(const TaskKey& key) const;

  // Copies the stats of every task, taking each task's lock in turn.
  // Sorted by spawn order.
  std::vector<TaskSnapshot> snapshot() const;

  Option<DetailsSnapshot> details(
      const TaskKey& key,
      const Option<uint64_t>& since) const;

  // Forgets a completed task. Its id is handed out again, with the
  // next generation, by a later 'spawn'.
  Try<Nothing> release(const TaskKey& key);

  size_t size() const;

  MetadataRegistry& metadata() { return metadata_; }

  // An empty histogram with the configured precision.
  const Histogram& histogram() const { return prototype; }

private:
  static const size_t SHARDS = 16;

  struct Shard
  {
    std::mutex mutex;
    hashmap<uint64_t, std::shared_ptr<TaskState>> tasks;
  };

  explicit TaskRegistry(const Histogram& prototype);

  TaskRegistry(const TaskRegistry&); // Not copyable.
  TaskRegistry& operator=(const TaskRegistry&); // Not assignable.

  Shard& shard(uint64_t id) const { return shards[id % SHARDS]; }

  MetadataRegistry metadata_;

  const Histogram prototype;

  mutable Shard shards[SHARDS];

  // Guards the id allocation state below.
  std::mutex allocation;
  uint64_t nextId;
  uint64_t nextSequence;
  std::deque<TaskKey> released;
};

} // namespace aggregator {
} // namespace internal {
} // namespace console {

#endif // __CONSOLE_AGGREGATOR_REGISTRY_HPP__
