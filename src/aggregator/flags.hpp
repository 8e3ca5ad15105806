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

#ifndef __CONSOLE_AGGREGATOR_FLAGS_HPP__
#define __CONSOLE_AGGREGATOR_FLAGS_HPP__

#include <stout/duration.hpp>
#include <stout/flags.hpp>

namespace console {
namespace internal {
namespace aggregator {

class Flags : public virtual flags::FlagsBase
{
public:
  Flags()
  {
    add(&Flags::publish_interval,
        "publish_interval",
        "How often task updates are computed and sent to subscribers.",
        Seconds(1));

    add(&Flags::retention,
        "retention",
        "How long a completed task is retained for subscribers that have\n"
        "not yet received its completion. The task's id may be reused\n"
        "once it is no longer retained.",
        Seconds(6));

    add(&Flags::histogram_max,
        "histogram_max",
        "Longest poll duration tracked by the per-task poll time\n"
        "histograms. Longer polls are recorded as this duration.",
        Seconds(1));

    add(&Flags::histogram_significant_figures,
        "histogram_significant_figures",
        "Number of significant decimal digits (1 to 5) the per-task poll\n"
        "time histograms preserve.",
        2);
  }

  Duration publish_interval;
  Duration retention;
  Duration histogram_max;
  int histogram_significant_figures;
};

} // namespace aggregator {
} // namespace internal {
} // namespace console {

#endif // __CONSOLE_AGGREGATOR_FLAGS_HPP__
