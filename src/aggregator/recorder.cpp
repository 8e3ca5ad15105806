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
#include <string>

#include <stout/error.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>

#include <glog/logging.h>

#include "aggregator/recorder.hpp"

using namespace process;

using std::shared_ptr;
using std::string;

namespace console {
namespace internal {
namespace aggregator {

Recorder::Recorder(TaskRegistry* _registry)
  : registry(CHECK_NOTNULL(_registry)) {}


Try<Nothing> Recorder::pollStart(const TaskKey& key, const Time& at)
{
  return apply(key, "poll start", [=](TaskState* state) -> Try<Nothing> {
    if (state->polling) {
      return Error("Task is already being polled");
    }

    if (at < state->stats.createdAt) {
      return Error("Poll started before the task was spawned");
    }

    if (state->stats.lastPollEnded.isSome() &&
        at < state->stats.lastPollEnded.get()) {
      return Error("Poll started before the previous poll ended");
    }

    if (state->stats.firstPoll.isNone()) {
      state->stats.firstPoll = at;
    }

    state->stats.lastPollStarted = at;
    state->stats.polls++;
    state->polling = true;

    return Nothing();
  });
}


Try<Nothing> Recorder::pollEnd(const TaskKey& key, const Time& at)
{
  const Histogram& prototype = registry->histogram();

  return apply(key, "poll end", [&](TaskState* state) -> Try<Nothing> {
    if (!state->polling) {
      return Error("Task is not being polled");
    }

    if (at < state->stats.lastPollStarted.get()) {
      return Error("Poll ended before it started");
    }

    // Bumps the stats version itself.
    state->finishPoll(at, prototype);

    return Nothing();
  });
}


Try<Nothing> Recorder::wake(const TaskKey& key, const Time& at)
{
  return apply(key, "wake", [=](TaskState* state) -> Try<Nothing> {
    state->stats.wakes++;
    state->stats.lastWake = at;
    return Nothing();
  });
}


Try<Nothing> Recorder::wakerClone(const TaskKey& key)
{
  return apply(key, "waker clone", [](TaskState* state) -> Try<Nothing> {
    state->stats.wakerClones++;
    return Nothing();
  });
}


Try<Nothing> Recorder::wakerDrop(const TaskKey& key)
{
  return apply(key, "waker drop", [](TaskState* state) -> Try<Nothing> {
    state->stats.wakerDrops++;
    return Nothing();
  });
}


Try<Nothing> Recorder::apply(
    const TaskKey& key,
    const string& event,
    const lambda::function<Try<Nothing>(TaskState*)>& f)
{
  Try<shared_ptr<TaskState>> state = registry->lookup(key);
  if (state.isError()) {
    LOG(WARNING) << "Dropping " << event << " event: " << state.error();
    return Error(state.error());
  }

  Try<Nothing> result = Nothing();

  synchronized (state.get()->mutex) {
    if (state.get()->completedAt.isSome()) {
      result = Error("Task has already completed");
    } else {
      uint64_t before = state.get()->version;
      result = f(state.get().get());

      // A successful event always changes the stats.
      if (result.isSome() && state.get()->version == before) {
        ++state.get()->version;
      }
    }
  }

  if (result.isError()) {
    LOG(WARNING) << "Dropping " << event << " event for task " << key
                 << ": " << result.error();
    return Error(result.error());
  }

  return Nothing();
}

} // namespace aggregator {
} // namespace internal {
} // namespace console {
