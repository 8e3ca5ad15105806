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

#ifndef __CONSOLE_AGGREGATOR_DISPATCHER_HPP__
#define __CONSOLE_AGGREGATOR_DISPATCHER_HPP__

#include <stdint.h>

#include <console/console.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/process.hpp>
#include <process/time.hpp>

#include <process/metrics/counter.hpp>
#include <process/metrics/gauge.hpp>

#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "aggregator/cursor.hpp"
#include "aggregator/flags.hpp"
#include "aggregator/registry.hpp"
#include "aggregator/writer.hpp"

namespace console {
namespace internal {
namespace aggregator {

// Forward declaration.
class DispatcherProcess;

// Streams the state of a task registry to any number of subscribers.
// Every 'publish_interval' the dispatcher computes, for each attached
// subscriber, what changed since the last update it was sent and hands
// the result to the subscriber's writer.
class Dispatcher
{
public:
  static Try<process::Owned<Dispatcher>> create(
      const Flags& flags,
      TaskRegistry* registry);

  ~Dispatcher();

  // Attaches a subscriber to the task update stream. Returns the id of
  // the subscription. The first update sent to it announces every live
  // task.
  process::Future<uint64_t> watchTasks(
      const tasks::TasksRequest& request,
      const process::Owned<Writer<tasks::TaskUpdate>>& writer);

  // Attaches a subscriber to the details of one task. The stream ends
  // when the task completes. Fails, after closing the writer, if the
  // task is unknown or already completed.
  process::Future<uint64_t> watchTaskDetails(
      const tasks::DetailsRequest& request,
      const process::Owned<Writer<tasks::TaskDetails>>& writer);

  // Detaches a subscriber. Changes not yet written are discarded.
  process::Future<Nothing> unwatch(uint64_t subscriber);

private:
  explicit Dispatcher(process::Owned<DispatcherProcess> process);

  Dispatcher(const Dispatcher&); // Not copyable.
  Dispatcher& operator=(const Dispatcher&); // Not assignable.

  process::Owned<DispatcherProcess> process;
};


class DispatcherProcess : public process::Process<DispatcherProcess>
{
public:
  DispatcherProcess(const Flags& flags, TaskRegistry* registry);

  virtual ~DispatcherProcess() {}

  process::Future<uint64_t> watchTasks(
      const tasks::TasksRequest& request,
      const process::Owned<Writer<tasks::TaskUpdate>>& writer);

  process::Future<uint64_t> watchTaskDetails(
      const tasks::DetailsRequest& request,
      const process::Owned<Writer<tasks::TaskDetails>>& writer);

  process::Future<Nothing> unwatch(uint64_t subscriber);

protected:
  virtual void initialize();
  virtual void finalize();

private:
  struct TaskSubscriber
  {
    explicit TaskSubscriber(
        const process::Owned<Writer<tasks::TaskUpdate>>& _writer)
      : writer(_writer) {}

    process::Owned<Writer<tasks::TaskUpdate>> writer;
    TaskCursor cursor;

    // Earliest tick of the update being written, if any.
    Option<uint64_t> writing;

    // Changes computed while an update was being written. At most one
    // pending delta is kept; later changes are merged into it.
    Option<TaskDelta> pending;
  };

  struct DetailsSubscriber
  {
    DetailsSubscriber(
        const process::Owned<Writer<tasks::TaskDetails>>& _writer,
        const TaskKey& key)
      : writer(_writer),
        cursor(key),
        writing(false),
        done(false) {}

    process::Owned<Writer<tasks::TaskDetails>> writer;
    DetailsCursor cursor;
    bool writing;
    Option<DetailsDelta> pending;

    // The last delta was computed; the stream ends once it's written.
    bool done;
  };

  // A task observed as completed that is still in the registry.
  struct Completion
  {
    Completion(const TaskKey& _key, uint64_t _tick, const process::Time& _at)
      : key(_key), tick(_tick), at(_at) {}

    TaskKey key;

    // Tick that first observed the completion.
    uint64_t tick;

    process::Time at;
  };

  void tick();

  void publish(uint64_t id, const TaskDelta& delta);
  void write(uint64_t id, const TaskDelta& delta);
  void _write(uint64_t id, const process::Future<Nothing>& future);

  void publishDetails(uint64_t id, const DetailsDelta& delta);
  void writeDetails(uint64_t id, const DetailsDelta& delta);
  void _writeDetails(uint64_t id, const process::Future<Nothing>& future);

  // Releases the completed tasks every task subscriber was told about,
  // and those completed longer than 'retention' ago.
  void release(const process::Time& now);

  void detach(uint64_t id);

  process::Future<double> _subscribers()
  {
    return static_cast<double>(subscribers.size() + watchers.size());
  }

  const Flags flags;

  TaskRegistry* registry;

  uint64_t ticks;
  uint64_t nextSubscriberId;

  hashmap<uint64_t, process::Owned<TaskSubscriber>> subscribers;
  hashmap<uint64_t, process::Owned<DetailsSubscriber>> watchers;

  // Task id -> completion.
  hashmap<uint64_t, Completion> completions;

  struct Metrics
  {
    explicit Metrics(const DispatcherProcess& process);
    ~Metrics();

    process::metrics::Gauge subscribers;

    process::metrics::Counter updates;
    process::metrics::Counter failed_writes;
    process::metrics::Counter released_tasks;
    process::metrics::Counter expired_tasks;
  } metrics;
};

} // namespace aggregator {
} // namespace internal {
} // namespace console {

#endif // __CONSOLE_AGGREGATOR_DISPATCHER_HPP__
