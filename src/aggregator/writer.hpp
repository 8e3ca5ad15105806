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

#ifndef __CONSOLE_AGGREGATOR_WRITER_HPP__
#define __CONSOLE_AGGREGATOR_WRITER_HPP__

#include <process/future.hpp>

#include <stout/nothing.hpp>

namespace console {
namespace internal {
namespace aggregator {

// The sending half of one subscriber stream, implemented by the
// transport. Messages written to the same writer must be delivered in
// order and reliably.
template <typename Message>
class Writer
{
public:
  virtual ~Writer() {}

  // The returned future is satisfied once the transport accepted the
  // message and is ready for the next one. A failed or discarded
  // future means the subscriber is gone.
  virtual process::Future<Nothing> write(const Message& message) = 0;

  // Ends the stream. No further writes follow.
  virtual void close() = 0;
};

} // namespace aggregator {
} // namespace internal {
} // namespace console {

#endif // __CONSOLE_AGGREGATOR_WRITER_HPP__
