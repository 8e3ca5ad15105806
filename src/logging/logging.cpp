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

#include <mutex>
#include <string>

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/exit.hpp>
#include <stout/os.hpp>
#include <stout/strings.hpp>

#include "logging/logging.hpp"

using std::string;

namespace console {
namespace internal {
namespace logging {

// Program name handed to glog, which keeps a pointer to it.
static string* argv0 = NULL;


Try<int> severity(const string& level)
{
  const string upper = strings::upper(level);

  if (upper == "INFO") {
    return google::INFO;
  } else if (upper == "WARNING") {
    return google::WARNING;
  } else if (upper == "ERROR") {
    return google::ERROR;
  }

  return Error(
      "'" + level + "' is not a valid logging level."
      " Possible values for 'logging_level' are:"
      " 'INFO', 'WARNING', 'ERROR'");
}


void initialize(
    const string& _argv0,
    const Flags& flags,
    bool installFailureSignalHandler)
{
  static std::once_flag initialized;

  std::call_once(initialized, [&]() {
    Try<int> level = severity(flags.logging_level);
    if (level.isError()) {
      EXIT(EXIT_FAILURE) << level.error();
    }

    argv0 = new string(_argv0);

    // Log files, if any, receive everything at or above the level.
    FLAGS_minloglevel = level.get();

    if (flags.quiet) {
      FLAGS_stderrthreshold = google::FATAL;
    } else {
      FLAGS_stderrthreshold = level.get();
    }

    FLAGS_logbufsecs = flags.logbufsecs;

    if (flags.log_dir.isSome()) {
      Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
      if (mkdir.isError()) {
        EXIT(EXIT_FAILURE)
          << "Could not initialize logging: Failed to create directory "
          << flags.log_dir.get() << ": " << mkdir.error();
      }
      FLAGS_log_dir = flags.log_dir.get();
    } else {
      // Without a log directory stderr is the only destination, so
      // being quiet means only fatal messages get through.
      FLAGS_logtostderr = true;

      if (flags.quiet) {
        FLAGS_minloglevel = google::FATAL;
      }
    }

    google::InitGoogleLogging(argv0->c_str());

    if (installFailureSignalHandler) {
      google::InstallFailureSignalHandler();
    }

    VLOG(1) << "Logging to " <<
      (flags.log_dir.isSome() ? flags.log_dir.get() : "STDERR");
  });
}

} // namespace logging {
} // namespace internal {
} // namespace console {
