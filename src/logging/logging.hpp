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

#ifndef __CONSOLE_LOGGING_LOGGING_HPP__
#define __CONSOLE_LOGGING_LOGGING_HPP__

#include <string>

#include <stout/try.hpp>

#include "logging/flags.hpp"

namespace console {
namespace internal {
namespace logging {

// Initializes glog from the given flags. Only the first call has an
// effect; later calls are ignored.
void initialize(
    const std::string& argv0,
    const Flags& flags,
    bool installFailureSignalHandler = false);


// Maps a level name ('INFO', 'WARNING' or 'ERROR') to its glog severity.
Try<int> severity(const std::string& level);

} // namespace logging {
} // namespace internal {
} // namespace console {

#endif // __CONSOLE_LOGGING_LOGGING_HPP__
