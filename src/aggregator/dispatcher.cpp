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
#include <vector>

#include <process/defer.hpp>
#include <process/delay.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>

#include <process/metrics/metrics.hpp>

#include <stout/foreach.hpp>
#include <stout/lambda.hpp>
#include <stout/stringify.hpp>

#include <glog/logging.h>

#include "aggregator/dispatcher.hpp"

#include "common/protobuf_utils.hpp"

using namespace process;

using std::vector;

namespace console {
namespace internal {
namespace aggregator {

Try<Owned<Dispatcher>> Dispatcher::create(
    const Flags& flags,
    TaskRegistry* registry)
{
  if (registry == NULL) {
    return Error("A task registry is required");
  }

  if (flags.publish_interval <= Duration::zero()) {
    return Error(
        "Invalid publish interval " + stringify(flags.publish_interval) +
        ": must be positive");
  }

  if (flags.retention < Duration::zero()) {
    return Error(
        "Invalid retention " + stringify(flags.retention) +
        ": must not be negative");
  }

  Owned<DispatcherProcess> process(new DispatcherProcess(flags, registry));

  return Owned<Dispatcher>(new Dispatcher(process));
}


Dispatcher::Dispatcher(Owned<DispatcherProcess> _process)
  : process(_process)
{
  process::spawn(CHECK_NOTNULL(process.get()));
}


Dispatcher::~Dispatcher()
{
  process::terminate(process.get());
  process::wait(process.get());
}


Future<uint64_t> Dispatcher::watchTasks(
    const tasks::TasksRequest& request,
    const Owned<Writer<tasks::TaskUpdate>>& writer)
{
  return dispatch(
      process.get(),
      &DispatcherProcess::watchTasks,
      request,
      writer);
}


Future<uint64_t> Dispatcher::watchTaskDetails(
    const tasks::DetailsRequest& request,
    const Owned<Writer<tasks::TaskDetails>>& writer)
{
  return dispatch(
      process.get(),
      &DispatcherProcess::watchTaskDetails,
      request,
      writer);
}


Future<Nothing> Dispatcher::unwatch(uint64_t subscriber)
{
  return dispatch(process.get(), &DispatcherProcess::unwatch, subscriber);
}


DispatcherProcess::DispatcherProcess(
    const Flags& _flags,
    TaskRegistry* _registry)
  : ProcessBase(ID::generate("dispatcher")),
    flags(_flags),
    registry(_registry),
    ticks(0),
    nextSubscriberId(1),
    metrics(*this) {}


void DispatcherProcess::initialize()
{
  LOG(INFO) << "Publishing task updates every " << flags.publish_interval;

  delay(flags.publish_interval, self(), &Self::tick);
}


void DispatcherProcess::finalize()
{
  foreachvalue (const Owned<TaskSubscriber>& subscriber, subscribers) {
    subscriber->writer->close();
  }

  foreachvalue (const Owned<DetailsSubscriber>& watcher, watchers) {
    watcher->writer->close();
  }

  subscribers.clear();
  watchers.clear();
}


Future<uint64_t> DispatcherProcess::watchTasks(
    const tasks::TasksRequest&,
    const Owned<Writer<tasks::TaskUpdate>>& writer)
{
  const uint64_t id = nextSubscriberId++;

  subscribers.put(id, Owned<TaskSubscriber>(new TaskSubscriber(writer)));

  LOG(INFO) << "Attached task subscriber " << id;

  return id;
}


Future<uint64_t> DispatcherProcess::watchTaskDetails(
    const tasks::DetailsRequest& request,
    const Owned<Writer<tasks::TaskDetails>>& writer)
{
  const uint64_t taskId = request.id().id();

  Option<TaskKey> key = registry->find(taskId);
  if (key.isNone()) {
    LOG(INFO) << "Rejecting details subscriber for unknown or completed task "
              << taskId;

    writer->close();
    return Failure("Unknown task " + stringify(taskId));
  }

  const uint64_t id = nextSubscriberId++;

  watchers.put(
      id,
      Owned<DetailsSubscriber>(new DetailsSubscriber(writer, key.get())));

  LOG(INFO) << "Attached details subscriber " << id
            << " for task " << key.get();

  return id;
}


Future<Nothing> DispatcherProcess::unwatch(uint64_t id)
{
  if (!subscribers.contains(id) && !watchers.contains(id)) {
    return Failure("Unknown subscriber " + stringify(id));
  }

  detach(id);

  return Nothing();
}


void DispatcherProcess::tick()
{
  ++ticks;

  const vector<TaskSnapshot> snapshots = registry->snapshot();

  // Taken after the snapshot so that no recorded event is later than
  // the instant the update is measured against.
  const Time now = Clock::now();

  foreach (const TaskSnapshot& snapshot, snapshots) {
    if (snapshot.completedAt.isSome() &&
        !completions.contains(snapshot.key.id)) {
      completions.put(
          snapshot.key.id,
          Completion(snapshot.key, ticks, snapshot.completedAt.get()));
    }
  }

  foreachpair (uint64_t id,
               const Owned<TaskSubscriber>& subscriber,
               subscribers) {
    TaskDelta delta = subscriber->cursor.diff(
        ticks,
        snapshots,
        registry->metadata(),
        now);

    // Idle streams produce no traffic.
    if (!delta.empty()) {
      publish(id, delta);
    }
  }

  foreach (uint64_t id, watchers.keys()) {
    Owned<DetailsSubscriber> watcher = watchers.get(id).get();
    if (watcher->done) {
      continue;
    }

    Option<DetailsDelta> delta = watcher->cursor.diff(*registry, now);
    if (delta.isNone()) {
      LOG(INFO) << "Detaching details subscriber " << id << " since task "
                << watcher->cursor.key << " is gone";
      detach(id);
      continue;
    }

    publishDetails(id, delta.get());
  }

  release(now);

  VLOG(1) << "Published tick " << ticks << " for " << snapshots.size()
          << " tasks to " << subscribers.size() << " task subscribers and "
          << watchers.size() << " details subscribers";

  delay(flags.publish_interval, self(), &Self::tick);
}


void DispatcherProcess::publish(uint64_t id, const TaskDelta& delta)
{
  Owned<TaskSubscriber> subscriber = subscribers.get(id).get();

  if (subscriber->writing.isNone()) {
    write(id, delta);
    return;
  }

  if (subscriber->pending.isNone()) {
    subscriber->pending = delta;
    return;
  }

  TaskDelta pending = subscriber->pending.get();
  merge(&pending, delta);
  subscriber->pending = pending;

  VLOG(2) << "Merged tick " << delta.tick << " into the pending update"
          << " of slow task subscriber " << id;
}


void DispatcherProcess::write(uint64_t id, const TaskDelta& delta)
{
  Owned<TaskSubscriber> subscriber = subscribers.get(id).get();

  subscriber->writing = delta.tick;

  ++metrics.updates;

  subscriber->writer->write(protobuf::createTaskUpdate(delta))
    .onAny(defer(self(), &Self::_write, id, lambda::_1));
}


void DispatcherProcess::_write(uint64_t id, const Future<Nothing>& future)
{
  Option<Owned<TaskSubscriber>> subscriber = subscribers.get(id);
  if (subscriber.isNone()) {
    return; // Detached while the update was being written.
  }

  if (!future.isReady()) {
    LOG(WARNING) << "Detaching task subscriber " << id
                 << " after failing to write an update: "
                 << (future.isFailed() ? future.failure() : "discarded");

    ++metrics.failed_writes;
    detach(id);
    return;
  }

  subscriber.get()->writing = None();

  if (subscriber.get()->pending.isSome()) {
    TaskDelta pending = subscriber.get()->pending.get();
    subscriber.get()->pending = None();
    write(id, pending);
  }
}


void DispatcherProcess::publishDetails(uint64_t id, const DetailsDelta& delta)
{
  Owned<DetailsSubscriber> watcher = watchers.get(id).get();

  if (delta.last) {
    watcher->done = true;
  }

  if (!watcher->writing) {
    writeDetails(id, delta);
    return;
  }

  if (watcher->pending.isNone()) {
    watcher->pending = delta;
    return;
  }

  DetailsDelta pending = watcher->pending.get();
  merge(&pending, delta);
  watcher->pending = pending;
}


void DispatcherProcess::writeDetails(uint64_t id, const DetailsDelta& delta)
{
  Owned<DetailsSubscriber> watcher = watchers.get(id).get();

  watcher->writing = true;

  watcher->writer->write(protobuf::createTaskDetails(delta))
    .onAny(defer(self(), &Self::_writeDetails, id, lambda::_1));
}


void DispatcherProcess::_writeDetails(
    uint64_t id,
    const Future<Nothing>& future)
{
  Option<Owned<DetailsSubscriber>> watcher = watchers.get(id);
  if (watcher.isNone()) {
    return;
  }

  if (!future.isReady()) {
    LOG(WARNING) << "Detaching details subscriber " << id
                 << " after failing to write an update: "
                 << (future.isFailed() ? future.failure() : "discarded");

    ++metrics.failed_writes;
    detach(id);
    return;
  }

  watcher.get()->writing = false;

  if (watcher.get()->pending.isSome()) {
    DetailsDelta pending = watcher.get()->pending.get();
    watcher.get()->pending = None();
    writeDetails(id, pending);
    return;
  }

  if (watcher.get()->done) {
    LOG(INFO) << "Task " << watcher.get()->cursor.key << " completed,"
              << " ending the stream of details subscriber " << id;
    detach(id);
  }
}


void DispatcherProcess::release(const Time& now)
{
  // Every completion observed up to this tick reached all subscribers.
  uint64_t delivered = ticks;

  foreachvalue (const Owned<TaskSubscriber>& subscriber, subscribers) {
    if (subscriber->writing.isSome()) {
      delivered = std::min(delivered, subscriber->writing.get() - 1);
    }
  }

  foreach (uint64_t id, completions.keys()) {
    const Completion completion = completions.get(id).get();

    if (completion.tick > delivered) {
      if (now - completion.at < flags.retention) {
        continue;
      }

      LOG(WARNING) << "Releasing task " << completion.key << " which completed"
                   << " more than " << flags.retention << " ago although"
                   << " not every subscriber received its completion";

      ++metrics.expired_tasks;
    }

    Try<Nothing> released = registry->release(completion.key);
    if (released.isError()) {
      LOG(WARNING) << "Failed to release task " << completion.key << ": "
                   << released.error();
    } else {
      ++metrics.released_tasks;
    }

    completions.erase(id);
  }
}


void DispatcherProcess::detach(uint64_t id)
{
  Option<Owned<TaskSubscriber>> subscriber = subscribers.get(id);
  if (subscriber.isSome()) {
    subscriber.get()->writer->close();
    subscribers.erase(id);

    LOG(INFO) << "Detached task subscriber " << id;
    return;
  }

  Option<Owned<DetailsSubscriber>> watcher = watchers.get(id);
  if (watcher.isSome()) {
    watcher.get()->writer->close();
    watchers.erase(id);

    LOG(INFO) << "Detached details subscriber " << id;
  }
}


// Metrics are namespaced by the process id so that several dispatchers
// can coexist.
DispatcherProcess::Metrics::Metrics(const DispatcherProcess& process)
  : subscribers(
        "console/" + process.self().id + "/subscribers",
        defer(process, &DispatcherProcess::_subscribers)),
    updates("console/" + process.self().id + "/updates"),
    failed_writes("console/" + process.self().id + "/failed_writes"),
    released_tasks("console/" + process.self().id + "/released_tasks"),
    expired_tasks("console/" + process.self().id + "/expired_tasks")
{
  process::metrics::add(subscribers);
  process::metrics::add(updates);
  process::metrics::add(failed_writes);
  process::metrics::add(released_tasks);
  process::metrics::add(expired_tasks);
}


DispatcherProcess::Metrics::~Metrics()
{
  process::metrics::remove(subscribers);
  process::metrics::remove(updates);
  process::metrics::remove(failed_writes);
  process::metrics::remove(released_tasks);
  process::metrics::remove(expired_tasks);
}

} // namespace aggregator {
} // namespace internal {
} // namespace console {
