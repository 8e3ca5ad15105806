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

#include <memory>
#include <utility>

#include <google/protobuf/util/time_util.h>

#include <stout/foreach.hpp>

#include "common/protobuf_utils.hpp"

using google::protobuf::util::TimeUtil;

using std::shared_ptr;

namespace console {
namespace internal {
namespace protobuf {

google::protobuf::Timestamp createTimestamp(const process::Time& time)
{
  return TimeUtil::NanosecondsToTimestamp(time.duration().ns());
}


google::protobuf::Duration createDuration(const Duration& duration)
{
  return TimeUtil::NanosecondsToDuration(duration.ns());
}


tasks::Stats createStats(
    const aggregator::TaskStats& stats,
    const process::Time& now)
{
  tasks::Stats result;

  result.set_polls(stats.polls);
  result.mutable_created_at()->CopyFrom(createTimestamp(stats.createdAt));

  if (stats.firstPoll.isSome()) {
    result.mutable_first_poll()->CopyFrom(
        createTimestamp(stats.firstPoll.get()));
  }

  if (stats.lastPollStarted.isSome()) {
    result.mutable_last_poll_started()->CopyFrom(
        createTimestamp(stats.lastPollStarted.get()));
  }

  if (stats.lastPollEnded.isSome()) {
    result.mutable_last_poll_ended()->CopyFrom(
        createTimestamp(stats.lastPollEnded.get()));
  }

  result.mutable_busy_time()->CopyFrom(createDuration(stats.busy));

  Duration total = Duration::zero();
  if (stats.createdAt < now) {
    total = now - stats.createdAt;
  }

  result.mutable_total_time()->CopyFrom(createDuration(total));

  result.set_wakes(stats.wakes);
  result.set_waker_clones(stats.wakerClones);
  result.set_waker_drops(stats.wakerDrops);

  if (stats.lastWake.isSome()) {
    result.mutable_last_wake()->CopyFrom(createTimestamp(stats.lastWake.get()));
  }

  return result;
}


tasks::TaskUpdate createTaskUpdate(const aggregator::TaskDelta& delta)
{
  tasks::TaskUpdate update;

  foreach (const shared_ptr<const tasks::Task>& task, delta.tasks) {
    update.add_new_tasks()->CopyFrom(*task);
  }

  if (!delta.metadata.empty()) {
    common::RegisterMetadata* metadata = update.mutable_new_metadata();

    foreach (const aggregator::MetadataEntry& entry, delta.metadata) {
      common::RegisterMetadata::NewMetadata* registered =
        metadata->add_metadata();

      registered->mutable_id()->set_id(entry.first);
      registered->mutable_metadata()->CopyFrom(entry.second);
    }
  }

  foreachpair (uint64_t id, const aggregator::TaskStats& stats, delta.stats) {
    (*update.mutable_stats_update())[id] = createStats(stats, delta.now);
  }

  update.mutable_now()->CopyFrom(createTimestamp(delta.now));

  return update;
}


tasks::TaskDetails createTaskDetails(const aggregator::DetailsDelta& delta)
{
  tasks::TaskDetails details;

  details.mutable_task_id()->set_id(delta.taskId);
  details.mutable_now()->CopyFrom(createTimestamp(delta.now));

  if (delta.histogram.isSome()) {
    details.set_poll_times_histogram(delta.histogram.get());
  }

  return details;
}

} // namespace protobuf {
} // namespace internal {
} // namespace console {
