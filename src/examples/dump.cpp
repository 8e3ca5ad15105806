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

#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <console/console.hpp>

#include <process/clock.hpp>
#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/process.hpp>

#include <stout/duration.hpp>
#include <stout/flags.hpp>
#include <stout/none.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>
#include <stout/try.hpp>

#include <glog/logging.h>

#include "aggregator/dispatcher.hpp"
#include "aggregator/flags.hpp"
#include "aggregator/histogram.hpp"
#include "aggregator/recorder.hpp"
#include "aggregator/registry.hpp"
#include "aggregator/writer.hpp"

#include "logging/flags.hpp"
#include "logging/logging.hpp"

using namespace console;

using console::internal::aggregator::Dispatcher;
using console::internal::aggregator::Histogram;
using console::internal::aggregator::Recorder;
using console::internal::aggregator::TaskKey;
using console::internal::aggregator::TaskRegistry;
using console::internal::aggregator::Writer;

using process::Clock;
using process::Future;
using process::Owned;

using std::cerr;
using std::cout;
using std::endl;
using std::string;
using std::vector;


string describe(const tasks::TaskUpdate& update)
{
  return update.DebugString();
}


// Summarizes the poll times instead of dumping the encoded histogram.
string describe(const tasks::TaskDetails& details)
{
  string result = "task " + stringify(details.task_id().id());

  if (!details.has_poll_times_histogram()) {
    return result + ", poll times unchanged";
  }

  Try<Histogram> histogram = Histogram::decode(details.poll_times_histogram());
  if (histogram.isError()) {
    return result + ", invalid poll times: " + histogram.error();
  }

  const Histogram& polls = histogram.get();

  return result +
    ", polls: " + stringify(polls.count()) +
    ", mean: " + stringify(Nanoseconds(static_cast<int64_t>(polls.mean()))) +
    ", p50: " + stringify(Nanoseconds(polls.percentile(50.0))) +
    ", p99: " + stringify(Nanoseconds(polls.percentile(99.0))) +
    ", max: " + stringify(Nanoseconds(polls.max()));
}


// Prints every message of a stream to stdout.
template <typename Message>
class PrintingWriter : public Writer<Message>
{
public:
  explicit PrintingWriter(const string& _label)
    : label(_label), count(0) {}

  virtual Future<Nothing> write(const Message& message)
  {
    synchronized (mutex) {
      cout << label << " " << ++count << ": " << describe(message) << endl;
    }

    return Nothing();
  }

  virtual void close()
  {
    synchronized (mutex) {
      cout << label << " stream closed after " << count << " messages"
           << endl;
    }
  }

private:
  const string label;
  std::mutex mutex;
  int count;
};


// Spawns 'count' tasks and drives each through a few polls, wakes and
// waker clones before completing it.
void workload(
    TaskRegistry* registry,
    Recorder* recorder,
    uint64_t metadata,
    int worker,
    int count,
    const Duration& poll)
{
  for (int i = 0; i < count; i++) {
    common::Field field;
    field.set_str_name("worker");
    field.set_u64_val(worker);

    Try<TaskKey> key = registry->spawn(
        metadata,
        tasks::Task::SPAWN,
        vector<common::Field>(1, field),
        vector<uint64_t>(),
        Clock::now());

    if (key.isError()) {
      LOG(ERROR) << "Failed to spawn a task: " << key.error();
      return;
    }

    const int polls = 1 + (worker + i) % 4;

    for (int j = 0; j < polls; j++) {
      // The recorder logs every rejected event.
      if (recorder->wakerClone(key.get()).isError() ||
          recorder->wake(key.get(), Clock::now()).isError() ||
          recorder->wakerDrop(key.get()).isError() ||
          recorder->pollStart(key.get(), Clock::now()).isError()) {
        return;
      }

      os::sleep(poll * (j + 1));

      if (recorder->pollEnd(key.get(), Clock::now()).isError()) {
        return;
      }

      os::sleep(poll);
    }

    Try<Nothing> complete = registry->complete(key.get(), Clock::now());
    if (complete.isError()) {
      LOG(ERROR) << "Failed to complete task " << key.get() << ": "
                 << complete.error();
    }
  }
}


void usage(const char* argv0, const flags::FlagsBase& flags)
{
  cerr << "Usage: " << os::basename(argv0).get() << " [...]" << endl
       << endl
       << "Supported options:" << endl
       << flags.usage();
}


class Flags
  : public internal::aggregator::Flags,
    public internal::logging::Flags
{
public:
  Flags()
  {
    add(&Flags::workers,
        "workers",
        "Number of threads spawning and polling tasks.",
        4);

    add(&Flags::tasks,
        "tasks",
        "Number of tasks each worker spawns, one after the other.",
        3);

    add(&Flags::poll,
        "poll",
        "Base duration of a synthetic poll.",
        Milliseconds(20));

    add(&Flags::details,
        "details",
        "Id of a task whose poll time histogram is streamed as well.");
  }

  int workers;
  int tasks;
  Duration poll;
  Option<uint64_t> details;
};


int main(int argc, char** argv)
{
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  Flags flags;

  bool help;
  flags.add(&help,
            "help",
            "Prints this help message",
            false);

  // Load flags from environment and command line.
  Try<Nothing> load = flags.load(string("CONSOLE_"), &argc, &argv);

  if (load.isError()) {
    cerr << load.error() << endl;
    usage(argv[0], flags);
    return -1;
  }

  internal::logging::initialize(argv[0], flags, true); // Catch signals.

  if (help) {
    usage(argv[0], flags);
    return -1;
  }

  if (flags.workers <= 0 || flags.tasks <= 0) {
    LOG(WARNING) << "Expected a positive number of workers and tasks";
    usage(argv[0], flags);
    return -1;
  }

  process::initialize();

  Try<Owned<TaskRegistry>> registry = TaskRegistry::create(flags);
  if (registry.isError()) {
    LOG(ERROR) << "Failed to create the task registry: " << registry.error();
    return -1;
  }

  Try<Owned<Dispatcher>> dispatcher =
    Dispatcher::create(flags, registry.get().get());

  if (dispatcher.isError()) {
    LOG(ERROR) << "Failed to create the dispatcher: " << dispatcher.error();
    return -1;
  }

  Recorder recorder(registry.get().get());

  common::Metadata metadata;
  metadata.set_name("runtime.spawn");
  metadata.set_target("console_dump");
  metadata.set_module_path("console_dump::workload");
  metadata.set_kind(common::Metadata::SPAN);
  metadata.set_level(common::Metadata::INFO);
  metadata.add_field_names("worker");

  const uint64_t metadataId = registry.get()->metadata().intern(metadata);

  Future<uint64_t> subscriber = dispatcher.get()->watchTasks(
      tasks::TasksRequest(),
      Owned<Writer<tasks::TaskUpdate>>(
          new PrintingWriter<tasks::TaskUpdate>("UPDATE")));

  vector<std::thread> threads;
  for (int worker = 0; worker < flags.workers; worker++) {
    threads.emplace_back(
        workload,
        registry.get().get(),
        &recorder,
        metadataId,
        worker,
        flags.tasks,
        flags.poll);
  }

  if (flags.details.isSome()) {
    // Let the workers spawn their first tasks.
    os::sleep(flags.poll);

    tasks::DetailsRequest request;
    request.mutable_id()->set_id(flags.details.get());

    Future<uint64_t> watcher = dispatcher.get()->watchTaskDetails(
        request,
        Owned<Writer<tasks::TaskDetails>>(
            new PrintingWriter<tasks::TaskDetails>("DETAILS")));

    watcher.await();

    if (!watcher.isReady()) {
      LOG(WARNING) << "Not watching the details of task "
                   << flags.details.get() << ": "
                   << (watcher.isFailed() ? watcher.failure() : "discarded");
    }
  }

  for (size_t i = 0; i < threads.size(); i++) {
    threads[i].join();
  }

  // Give the dispatcher a chance to publish the completions.
  os::sleep(flags.publish_interval * 2);

  subscriber.await();
  if (subscriber.isReady()) {
    dispatcher.get()->unwatch(subscriber.get()).await();
  }

  LOG(INFO) << registry.get()->size() << " tasks still registered";

  return 0;
}
