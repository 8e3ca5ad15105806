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

#ifndef __CONSOLE_TESTS_UTILS_HPP__
#define __CONSOLE_TESTS_UTILS_HPP__

#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include <gmock/gmock.h>

#include <console/console.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/nothing.hpp>
#include <stout/synchronized.hpp>
#include <stout/unreachable.hpp>

#include "aggregator/writer.hpp"

namespace console {
namespace internal {
namespace tests {

// Observable state of a 'TestWriter'. Outlives the writer, which the
// dispatcher owns and deletes once the subscriber is detached.
template <typename Message>
class Stream
{
public:
  Stream() : closed_(false), blocking(false) {}

  // While blocked, writes are only acknowledged by 'acknowledge'.
  void block()
  {
    synchronized (mutex) {
      blocking = true;
    }
  }

  // Acknowledges the oldest write still in flight; returns false if
  // none is.
  bool acknowledge()
  {
    process::Owned<process::Promise<Nothing>> promise;

    synchronized (mutex) {
      if (inflight.empty()) {
        return false;
      }

      promise = inflight.front();
      inflight.pop_front();
    }

    promise->set(Nothing());
    return true;
  }

  // Stops blocking and acknowledges every write in flight.
  void unblock()
  {
    synchronized (mutex) {
      blocking = false;
    }

    while (acknowledge()) {}
  }

  std::vector<Message> messages() const
  {
    synchronized (mutex) {
      return messages_;
    }

    UNREACHABLE();
  }

  bool closed() const
  {
    synchronized (mutex) {
      return closed_;
    }

    UNREACHABLE();
  }

  process::Future<Nothing> write(const Message& message)
  {
    synchronized (mutex) {
      messages_.push_back(message);

      if (blocking) {
        process::Owned<process::Promise<Nothing>> promise(
            new process::Promise<Nothing>());

        inflight.push_back(promise);
        return promise->future();
      }
    }

    return Nothing();
  }

  void close()
  {
    synchronized (mutex) {
      closed_ = true;
    }
  }

private:
  mutable std::mutex mutex;
  std::vector<Message> messages_;
  bool closed_;
  bool blocking;
  std::deque<process::Owned<process::Promise<Nothing>>> inflight;
};


// A writer that records everything written to it into a 'Stream'.
template <typename Message>
class TestWriter : public aggregator::Writer<Message>
{
public:
  explicit TestWriter(const std::shared_ptr<Stream<Message>>& _stream)
    : stream(_stream) {}

  virtual process::Future<Nothing> write(const Message& message)
  {
    return stream->write(message);
  }

  virtual void close()
  {
    stream->close();
  }

private:
  std::shared_ptr<Stream<Message>> stream;
};


// Returns a writer feeding 'stream', owned the way the dispatcher
// expects.
template <typename Message>
process::Owned<aggregator::Writer<Message>> writer(
    const std::shared_ptr<Stream<Message>>& stream)
{
  return process::Owned<aggregator::Writer<Message>>(
      new TestWriter<Message>(stream));
}


template <typename Message>
class MockWriter : public aggregator::Writer<Message>
{
public:
  MOCK_METHOD1_T(write, process::Future<Nothing>(const Message&));
  MOCK_METHOD0_T(close, void());
};

} // namespace tests {
} // namespace internal {
} // namespace console {

#endif // __CONSOLE_TESTS_UTILS_HPP__
