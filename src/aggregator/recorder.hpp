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

#ifndef __CONSOLE_AGGREGATOR_RECORDER_HPP__
#define __CONSOLE_AGGREGATOR_RECORDER_HPP__

#include <string>

#include <process/time.hpp>

#include <stout/lambda.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "aggregator/registry.hpp"
#include "aggregator/stats.hpp"

namespace console {
namespace internal {
namespace aggregator {

// Applies instrumentation events to the stats of the tasks in a
// registry. Called synchronously from the polling machinery of the
// observed runtime, on any number of threads; each event only takes the
// lock of the task it concerns.
//
// An event that breaks the instrumentation contract (unknown or stale
// task, event after completion, unbalanced poll) is logged and returned
// as an error. It never modifies the task.
class Recorder
{
public:
  explicit Recorder(TaskRegistry* registry);

  Try<Nothing> pollStart(const TaskKey& key, const process::Time& at);
  Try<Nothing> pollEnd(const TaskKey& key, const process::Time& at);
  Try<Nothing> wake(const TaskKey& key, const process::Time& at);
  Try<Nothing> wakerClone(const TaskKey& key);
  Try<Nothing> wakerDrop(const TaskKey& key);

private:
  Try<Nothing> apply(
      const TaskKey& key,
      const std::string& event,
      const lambda::function<Try<Nothing>(TaskState*)>& f);

  TaskRegistry* registry;
};

} // namespace aggregator {
} // namespace internal {
} // namespace console {

#endif // __CONSOLE_AGGREGATOR_RECORDER_HPP__
