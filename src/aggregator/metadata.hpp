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

#ifndef __CONSOLE_AGGREGATOR_METADATA_HPP__
#define __CONSOLE_AGGREGATOR_METADATA_HPP__

#include <stdint.h>

#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <console/console.hpp>

#include <stout/hashmap.hpp>
#include <stout/hashset.hpp>

namespace console {
namespace internal {
namespace aggregator {

// An interned descriptor and its id.
typedef std::pair<uint64_t, common::Metadata> MetadataEntry;


// Interns the metadata of instrumentation sites. Every distinct
// descriptor gets a numeric id that is never reused or removed, and is
// announced exactly once to every subscriber that drains the registry.
// Thread safe.
class MetadataRegistry
{
public:
  MetadataRegistry();

  // Returns the id of an equivalent descriptor if one was already
  // interned, otherwise registers 'metadata' under a new id.
  uint64_t intern(const common::Metadata& metadata);

  bool contains(uint64_t id) const;

  size_t size() const;

  // Returns, in registration order, every descriptor whose id is not
  // in 'sent' and adds those ids to 'sent'.
  std::vector<MetadataEntry> drain(
      hashset<uint64_t>* sent) const;

private:
  MetadataRegistry(const MetadataRegistry&); // Not copyable.
  MetadataRegistry& operator=(const MetadataRegistry&); // Not assignable.

  mutable std::mutex mutex;

  // Serialized descriptor -> id.
  hashmap<std::string, uint64_t> ids;

  // Registration order.
  std::vector<MetadataEntry> entries;

  uint64_t nextId;
};

} // namespace aggregator {
} // namespace internal {
} // namespace console {

#endif // __CONSOLE_AGGREGATOR_METADATA_HPP__
