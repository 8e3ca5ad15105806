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

#ifndef __CONSOLE_AGGREGATOR_STATS_HPP__
#define __CONSOLE_AGGREGATOR_STATS_HPP__

#include <stdint.h>

#include <memory>
#include <ostream>

#include <console/console.hpp>

#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/option.hpp>

#include "aggregator/histogram.hpp"

namespace console {
namespace internal {
namespace aggregator {

// Identifies one incarnation of a task. The wire only carries 'id';
// 'generation' is bumped every time the registry reuses an id so that
// events naming a released task can't touch its successor.
struct TaskKey
{
  TaskKey() : id(0), generation(0) {}

  TaskKey(uint64_t _id, uint64_t _generation)
    : id(_id), generation(_generation) {}

  bool operator == (const TaskKey& that) const
  {
    return id == that.id && generation == that.generation;
  }

  bool operator != (const TaskKey& that) const
  {
    return !(*this == that);
  }

  uint64_t id;
  uint64_t generation;
};


inline std::ostream& operator << (std::ostream& stream, const TaskKey& key)
{
  return stream << key.id << "/" << key.generation;
}


// Per task statistics. Timestamps that have not occurred yet are None;
// the total time is derived when the stats are serialized.
struct TaskStats
{
  TaskStats()
    : polls(0),
      busy(Duration::zero()),
      wakes(0),
      wakerClones(0),
      wakerDrops(0) {}

  uint64_t polls;
  process::Time createdAt;
  Option<process::Time> firstPoll;
  Option<process::Time> lastPollStarted;
  Option<process::Time> lastPollEnded;
  Duration busy;
  uint64_t wakes;
  uint64_t wakerClones;
  uint64_t wakerDrops;
  Option<process::Time> lastWake;
};


// A consistent copy of one task taken by 'TaskRegistry::snapshot'.
struct TaskSnapshot
{
  TaskSnapshot() : sequence(0), version(0) {}

  TaskKey key;

  // Spawn order.
  uint64_t sequence;

  std::shared_ptr<const tasks::Task> task;
  TaskStats stats;

  // Bumped on every mutation of 'stats'.
  uint64_t version;

  Option<process::Time> completedAt;
};


struct DetailsSnapshot
{
  DetailsSnapshot() : completed(false), histogramVersion(0) {}

  bool completed;
  uint64_t histogramVersion;

  // Only set if the histogram exists and changed since the version the
  // caller asked about.
  Option<Histogram> histogram;
};

} // namespace aggregator {
} // namespace internal {
} // namespace console {

#endif // __CONSOLE_AGGREGATOR_STATS_HPP__
