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

#ifndef __CONSOLE_PROTOBUF_UTILS_HPP__
#define __CONSOLE_PROTOBUF_UTILS_HPP__

#include <google/protobuf/duration.pb.h>
#include <google/protobuf/timestamp.pb.h>

#include <console/console.hpp>

#include <process/time.hpp>

#include <stout/duration.hpp>

#include "aggregator/cursor.hpp"
#include "aggregator/stats.hpp"

namespace console {
namespace internal {
namespace protobuf {

google::protobuf::Timestamp createTimestamp(const process::Time& time);


google::protobuf::Duration createDuration(const Duration& duration);


// Converts a stats snapshot; the total time is measured up to 'now'.
tasks::Stats createStats(
    const aggregator::TaskStats& stats,
    const process::Time& now);


tasks::TaskUpdate createTaskUpdate(const aggregator::TaskDelta& delta);


tasks::TaskDetails createTaskDetails(const aggregator::DetailsDelta& delta);

} // namespace protobuf {
} // namespace internal {
} // namespace console {

#endif // __CONSOLE_PROTOBUF_UTILS_HPP__
