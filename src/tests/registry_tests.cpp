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

#include <stdint.h>

#include <memory>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <console/console.hpp>

#include <process/clock.hpp>
#include <process/gtest.hpp>
#include <process/owned.hpp>
#include <process/time.hpp>

#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/hashset.hpp>

#include "aggregator/flags.hpp"
#include "aggregator/histogram.hpp"
#include "aggregator/metadata.hpp"
#include "aggregator/recorder.hpp"
#include "aggregator/registry.hpp"

using process::Clock;
using process::Owned;
using process::Time;

using std::shared_ptr;
using std::vector;

namespace console {
namespace internal {
namespace tests {

using aggregator::DetailsSnapshot;
using aggregator::Histogram;
using aggregator::MetadataRegistry;
using aggregator::Recorder;
using aggregator::TaskKey;
using aggregator::TaskRegistry;
using aggregator::TaskSnapshot;


static common::Metadata createMetadata(const std::string& name)
{
  common::Metadata metadata;
  metadata.set_name(name);
  metadata.set_target("tests");
  metadata.set_kind(common::Metadata::SPAN);
  metadata.set_level(common::Metadata::TRACE);
  return metadata;
}


TEST(MetadataRegistryTest, Intern)
{
  MetadataRegistry registry;

  EXPECT_FALSE(registry.contains(0));
  EXPECT_FALSE(registry.contains(1));

  uint64_t spawn = registry.intern(createMetadata("spawn"));
  uint64_t blocking = registry.intern(createMetadata("blocking"));

  EXPECT_EQ(1u, spawn);
  EXPECT_EQ(2u, blocking);

  // Equivalent descriptors share an id.
  EXPECT_EQ(spawn, registry.intern(createMetadata("spawn")));
  EXPECT_EQ(2u, registry.size());

  EXPECT_TRUE(registry.contains(spawn));
  EXPECT_TRUE(registry.contains(blocking));
  EXPECT_FALSE(registry.contains(3));
}


TEST(MetadataRegistryTest, Drain)
{
  MetadataRegistry registry;

  registry.intern(createMetadata("a"));
  registry.intern(createMetadata("b"));

  hashset<uint64_t> sent;

  vector<aggregator::MetadataEntry> drained = registry.drain(&sent);

  ASSERT_EQ(2u, drained.size());
  EXPECT_EQ(1u, drained[0].first);
  EXPECT_EQ("a", drained[0].second.name());
  EXPECT_EQ(2u, drained[1].first);
  EXPECT_EQ("b", drained[1].second.name());

  // Nothing is announced twice.
  EXPECT_TRUE(registry.drain(&sent).empty());

  registry.intern(createMetadata("c"));

  drained = registry.drain(&sent);
  ASSERT_EQ(1u, drained.size());
  EXPECT_EQ(3u, drained[0].first);

  // Another subscriber gets everything.
  hashset<uint64_t> other;
  EXPECT_EQ(3u, registry.drain(&other).size());
}


class TaskRegistryTest : public ::testing::Test
{
protected:
  virtual void SetUp()
  {
    Try<Owned<TaskRegistry>> create = TaskRegistry::create(flags);
    ASSERT_SOME(create);

    registry = create.get();
    metadata = registry->metadata().intern(createMetadata("spawn"));
  }

  Try<TaskKey> spawn(const Time& at = Clock::now())
  {
    return registry->spawn(
        metadata,
        tasks::Task::SPAWN,
        vector<common::Field>(),
        vector<uint64_t>(),
        at);
  }

  TaskSnapshot snapshot(const TaskKey& key)
  {
    foreach (const TaskSnapshot& snapshot, registry->snapshot()) {
      if (snapshot.key == key) {
        return snapshot;
      }
    }

    ADD_FAILURE() << "No snapshot of task " << key;
    return TaskSnapshot();
  }

  aggregator::Flags flags;
  Owned<TaskRegistry> registry;
  uint64_t metadata;
};


TEST_F(TaskRegistryTest, InvalidFlags)
{
  aggregator::Flags invalid;
  invalid.histogram_significant_figures = 7;

  EXPECT_ERROR(TaskRegistry::create(invalid));
}


TEST_F(TaskRegistryTest, Spawn)
{
  common::Field field;
  field.set_str_name("name");
  field.set_str_val("worker");

  Try<TaskKey> key = registry->spawn(
      metadata,
      tasks::Task::BLOCKING,
      vector<common::Field>(1, field),
      vector<uint64_t>(1, 17),
      Clock::now());

  ASSERT_SOME(key);
  EXPECT_EQ(TaskKey(1, 0), key.get());
  EXPECT_EQ(1u, registry->size());

  TaskSnapshot snapshot = this->snapshot(key.get());
  ASSERT_TRUE(snapshot.task.get() != NULL);

  EXPECT_EQ(1u, snapshot.task->id().id());
  EXPECT_EQ(metadata, snapshot.task->metadata().id());
  EXPECT_EQ(tasks::Task::BLOCKING, snapshot.task->kind());
  ASSERT_EQ(1, snapshot.task->fields_size());
  EXPECT_EQ("worker", snapshot.task->fields(0).str_val());
  ASSERT_EQ(1, snapshot.task->parents_size());
  EXPECT_EQ(17u, snapshot.task->parents(0).id());

  EXPECT_EQ(0u, snapshot.stats.polls);
  EXPECT_NONE(snapshot.stats.firstPoll);
  EXPECT_NONE(snapshot.completedAt);

  EXPECT_SOME_EQ(key.get(), registry->find(1));
  EXPECT_NONE(registry->find(2));
}


TEST_F(TaskRegistryTest, SpawnUnknownMetadata)
{
  EXPECT_ERROR(registry->spawn(
      metadata + 1,
      tasks::Task::SPAWN,
      vector<common::Field>(),
      vector<uint64_t>(),
      Clock::now()));

  EXPECT_EQ(0u, registry->size());
}


TEST_F(TaskRegistryTest, SnapshotOrder)
{
  vector<TaskKey> keys;
  for (int i = 0; i < 40; i++) {
    Try<TaskKey> key = spawn();
    ASSERT_SOME(key);
    keys.push_back(key.get());
  }

  vector<TaskSnapshot> snapshots = registry->snapshot();
  ASSERT_EQ(keys.size(), snapshots.size());

  for (size_t i = 0; i < keys.size(); i++) {
    EXPECT_EQ(keys[i], snapshots[i].key);
  }
}


TEST_F(TaskRegistryTest, Complete)
{
  Clock::pause();

  Try<TaskKey> key = spawn();
  ASSERT_SOME(key);

  Clock::advance(Seconds(1));

  Time completed = Clock::now();
  ASSERT_SOME(registry->complete(key.get(), completed));

  EXPECT_SOME_EQ(completed, snapshot(key.get()).completedAt);

  // Completed tasks can't be watched or completed again.
  EXPECT_NONE(registry->find(key.get().id));
  EXPECT_ERROR(registry->complete(key.get(), Clock::now()));

  EXPECT_EQ(1u, registry->size());
}


TEST_F(TaskRegistryTest, CompleteWhilePolling)
{
  Clock::pause();

  Try<TaskKey> key = spawn();
  ASSERT_SOME(key);

  Recorder recorder(registry.get());

  Time started = Clock::now();
  ASSERT_SOME(recorder.pollStart(key.get(), started));

  EXPECT_ERROR(registry->complete(key.get(), started - Milliseconds(1)));

  Clock::advance(Milliseconds(3));
  ASSERT_SOME(registry->complete(key.get(), Clock::now()));

  TaskSnapshot snapshot = this->snapshot(key.get());
  EXPECT_EQ(1u, snapshot.stats.polls);
  EXPECT_SOME_EQ(Clock::now(), snapshot.stats.lastPollEnded);
  EXPECT_EQ(Milliseconds(3), snapshot.stats.busy);
}


TEST_F(TaskRegistryTest, ReleaseReusesId)
{
  Try<TaskKey> first = spawn();
  ASSERT_SOME(first);

  Try<TaskKey> second = spawn();
  ASSERT_SOME(second);

  // Only completed tasks are released.
  EXPECT_ERROR(registry->release(first.get()));

  ASSERT_SOME(registry->complete(first.get(), Clock::now()));
  ASSERT_SOME(registry->release(first.get()));

  EXPECT_EQ(1u, registry->size());
  EXPECT_ERROR(registry->lookup(first.get()));
  EXPECT_ERROR(registry->release(first.get()));

  Try<TaskKey> third = spawn();
  ASSERT_SOME(third);

  EXPECT_EQ(first.get().id, third.get().id);
  EXPECT_EQ(first.get().generation + 1, third.get().generation);

  // Events naming the released incarnation don't reach its successor.
  EXPECT_ERROR(registry->lookup(first.get()));
  EXPECT_SOME(registry->lookup(third.get()));

  Recorder recorder(registry.get());
  EXPECT_ERROR(recorder.wake(first.get(), Clock::now()));
  EXPECT_EQ(0u, snapshot(third.get()).stats.wakes);

  // Spawned after 'second', so announced after it.
  vector<TaskSnapshot> snapshots = registry->snapshot();
  ASSERT_EQ(2u, snapshots.size());
  EXPECT_EQ(second.get(), snapshots[0].key);
  EXPECT_EQ(third.get(), snapshots[1].key);
}


TEST_F(TaskRegistryTest, Details)
{
  Clock::pause();

  Try<TaskKey> key = spawn();
  ASSERT_SOME(key);

  // No histogram before the first completed poll.
  Option<DetailsSnapshot> details = registry->details(key.get(), None());
  ASSERT_SOME(details);
  EXPECT_FALSE(details.get().completed);
  EXPECT_NONE(details.get().histogram);

  Recorder recorder(registry.get());

  ASSERT_SOME(recorder.pollStart(key.get(), Clock::now()));
  Clock::advance(Microseconds(150));
  ASSERT_SOME(recorder.pollEnd(key.get(), Clock::now()));

  details = registry->details(key.get(), None());
  ASSERT_SOME(details);
  ASSERT_SOME(details.get().histogram);
  EXPECT_EQ(1, details.get().histogram.get().count());
  EXPECT_EQ(registry->histogram().highest(),
            details.get().histogram.get().highest());

  // Unchanged since the version we have.
  const uint64_t version = details.get().histogramVersion;

  details = registry->details(key.get(), version);
  ASSERT_SOME(details);
  EXPECT_NONE(details.get().histogram);

  ASSERT_SOME(registry->complete(key.get(), Clock::now()));

  details = registry->details(key.get(), version);
  ASSERT_SOME(details);
  EXPECT_TRUE(details.get().completed);

  ASSERT_SOME(registry->release(key.get()));
  EXPECT_NONE(registry->details(key.get(), None()));
}


TEST_F(TaskRegistryTest, Recorder)
{
  Clock::pause();

  Try<TaskKey> key = spawn();
  ASSERT_SOME(key);

  const uint64_t version = snapshot(key.get()).version;

  Recorder recorder(registry.get());

  Time t1 = Clock::now();
  ASSERT_SOME(recorder.wakerClone(key.get()));
  ASSERT_SOME(recorder.wake(key.get(), t1));
  ASSERT_SOME(recorder.pollStart(key.get(), t1));

  Clock::advance(Milliseconds(2));

  Time t2 = Clock::now();
  ASSERT_SOME(recorder.pollEnd(key.get(), t2));
  ASSERT_SOME(recorder.wakerDrop(key.get()));

  Clock::advance(Milliseconds(5));

  Time t3 = Clock::now();
  ASSERT_SOME(recorder.pollStart(key.get(), t3));
  Clock::advance(Milliseconds(1));
  ASSERT_SOME(recorder.pollEnd(key.get(), Clock::now()));

  TaskSnapshot snapshot = this->snapshot(key.get());

  EXPECT_LT(version, snapshot.version);
  EXPECT_EQ(2u, snapshot.stats.polls);
  EXPECT_SOME_EQ(t1, snapshot.stats.firstPoll);
  EXPECT_SOME_EQ(t3, snapshot.stats.lastPollStarted);
  EXPECT_SOME_EQ(Clock::now(), snapshot.stats.lastPollEnded);
  EXPECT_EQ(Milliseconds(3), snapshot.stats.busy);
  EXPECT_EQ(1u, snapshot.stats.wakes);
  EXPECT_SOME_EQ(t1, snapshot.stats.lastWake);
  EXPECT_EQ(1u, snapshot.stats.wakerClones);
  EXPECT_EQ(1u, snapshot.stats.wakerDrops);

  Option<DetailsSnapshot> details = registry->details(key.get(), None());
  ASSERT_SOME(details);
  ASSERT_SOME(details.get().histogram);
  EXPECT_EQ(2, details.get().histogram.get().count());
}


TEST_F(TaskRegistryTest, RecorderContract)
{
  Clock::pause();

  Try<TaskKey> key = spawn();
  ASSERT_SOME(key);

  Recorder recorder(registry.get());

  // Unbalanced polls.
  EXPECT_ERROR(recorder.pollEnd(key.get(), Clock::now()));

  Time started = Clock::now();
  ASSERT_SOME(recorder.pollStart(key.get(), started));
  EXPECT_ERROR(recorder.pollStart(key.get(), started));
  EXPECT_ERROR(recorder.pollEnd(key.get(), started - Milliseconds(1)));

  const TaskSnapshot before = snapshot(key.get());

  // Unknown tasks.
  EXPECT_ERROR(recorder.wake(TaskKey(42, 0), Clock::now()));
  EXPECT_ERROR(recorder.wakerClone(TaskKey(key.get().id, 1)));

  ASSERT_SOME(registry->complete(key.get(), Clock::now()));

  // Nothing after completion.
  EXPECT_ERROR(recorder.wake(key.get(), Clock::now()));
  EXPECT_ERROR(recorder.pollStart(key.get(), Clock::now()));
  EXPECT_ERROR(recorder.wakerDrop(key.get()));

  const TaskSnapshot after = snapshot(key.get());

  // Only the completion, which ended the poll, changed the stats.
  EXPECT_LT(before.version, after.version);
  EXPECT_SOME(after.stats.lastPollEnded);
  EXPECT_EQ(1u, after.stats.polls);
  EXPECT_EQ(0u, after.stats.wakes);
  EXPECT_EQ(0u, after.stats.wakerDrops);
}


// Events can't precede the spawn or the end of the previous poll, so
// 'created_at <= first_poll <= last_poll_started <= last_poll_ended'
// and 'busy_time <= total_time' hold for every task.
TEST_F(TaskRegistryTest, RecorderTimestampOrdering)
{
  const Time created = Time::epoch() + Seconds(10);

  Try<TaskKey> key = spawn(created);
  ASSERT_SOME(key);

  Recorder recorder(registry.get());

  EXPECT_ERROR(recorder.pollStart(key.get(), created - Seconds(5)));

  TaskSnapshot snapshot = this->snapshot(key.get());
  EXPECT_EQ(0u, snapshot.stats.polls);
  EXPECT_NONE(snapshot.stats.firstPoll);

  ASSERT_SOME(recorder.pollStart(key.get(), created + Seconds(2)));
  ASSERT_SOME(recorder.pollEnd(key.get(), created + Seconds(4)));

  // Overlaps the previous poll.
  EXPECT_ERROR(recorder.pollStart(key.get(), created + Seconds(3)));

  // Before the last poll ended.
  EXPECT_ERROR(registry->complete(key.get(), created + Seconds(1)));

  snapshot = this->snapshot(key.get());
  EXPECT_EQ(1u, snapshot.stats.polls);
  EXPECT_SOME_EQ(created + Seconds(2), snapshot.stats.lastPollStarted);
  EXPECT_NONE(snapshot.completedAt);

  ASSERT_SOME(registry->complete(key.get(), created + Seconds(5)));

  snapshot = this->snapshot(key.get());
  ASSERT_SOME(snapshot.stats.firstPoll);
  EXPECT_LE(snapshot.stats.createdAt, snapshot.stats.firstPoll.get());
  EXPECT_LE(snapshot.stats.firstPoll.get(),
            snapshot.stats.lastPollStarted.get());
  EXPECT_LE(snapshot.stats.lastPollStarted.get(),
            snapshot.stats.lastPollEnded.get());
  EXPECT_LE(snapshot.stats.busy,
            snapshot.completedAt.get() - snapshot.stats.createdAt);

  // Completing before the spawn is rejected too.
  Try<TaskKey> other = spawn(created);
  ASSERT_SOME(other);

  EXPECT_ERROR(registry->complete(other.get(), created - Seconds(1)));
  EXPECT_NONE(this->snapshot(other.get()).completedAt);
}


// Producers on several threads spawn, poll and complete their own
// tasks while the registry is snapshotted.
TEST_F(TaskRegistryTest, Concurrent)
{
  const int THREADS = 8;
  const int TASKS = 50;

  Recorder recorder(registry.get());

  vector<std::thread> threads;
  for (int i = 0; i < THREADS; i++) {
    threads.emplace_back([&]() {
      for (int j = 0; j < TASKS; j++) {
        Try<TaskKey> key = spawn(Time::epoch());
        ASSERT_SOME(key);

        for (int k = 0; k < 3; k++) {
          Time at = Time::epoch() + Milliseconds(k);
          ASSERT_SOME(recorder.pollStart(key.get(), at));
          ASSERT_SOME(recorder.pollEnd(key.get(), at + Microseconds(10)));
          ASSERT_SOME(recorder.wake(key.get(), at));
        }

        if (j % 2 == 0) {
          ASSERT_SOME(registry->complete(
              key.get(), Time::epoch() + Milliseconds(3)));
        }
      }
    });
  }

  for (int i = 0; i < 10; i++) {
    foreach (const TaskSnapshot& snapshot, registry->snapshot()) {
      EXPECT_LE(snapshot.stats.busy, Microseconds(30));
    }
  }

  for (size_t i = 0; i < threads.size(); i++) {
    threads[i].join();
  }

  vector<TaskSnapshot> snapshots = registry->snapshot();
  ASSERT_EQ(size_t(THREADS * TASKS), snapshots.size());

  hashset<uint64_t> ids;
  size_t completed = 0;

  foreach (const TaskSnapshot& snapshot, snapshots) {
    ids.insert(snapshot.key.id);

    EXPECT_EQ(3u, snapshot.stats.polls);
    EXPECT_EQ(3u, snapshot.stats.wakes);
    EXPECT_EQ(Microseconds(30), snapshot.stats.busy);

    if (snapshot.completedAt.isSome()) {
      completed++;
    }
  }

  EXPECT_EQ(size_t(THREADS * TASKS), ids.size());
  EXPECT_EQ(size_t(THREADS * TASKS / 2), completed);
}

} // namespace tests {
} // namespace internal {
} // namespace console {
