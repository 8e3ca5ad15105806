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

#include <string>
#include <utility>
#include <vector>

#include <stout/foreach.hpp>
#include <stout/option.hpp>
#include <stout/synchronized.hpp>
#include <stout/unreachable.hpp>

#include <glog/logging.h>

#include "aggregator/metadata.hpp"

using std::string;
using std::vector;

namespace console {
namespace internal {
namespace aggregator {

MetadataRegistry::MetadataRegistry()
  : nextId(1) {}


uint64_t MetadataRegistry::intern(const common::Metadata& metadata)
{
  // Equivalent descriptors serialize to the same bytes since the
  // message has no map fields.
  const string key = metadata.SerializeAsString();

  synchronized (mutex) {
    Option<uint64_t> id = ids.get(key);
    if (id.isSome()) {
      return id.get();
    }

    uint64_t allocated = nextId++;
    ids[key] = allocated;
    entries.push_back(MetadataEntry(allocated, metadata));

    VLOG(1) << "Registered metadata " << allocated << " for '"
            << metadata.target() << "::" << metadata.name() << "'";

    return allocated;
  }

  UNREACHABLE();
}


bool MetadataRegistry::contains(uint64_t id) const
{
  synchronized (mutex) {
    // Ids are allocated densely starting at 1.
    return id > 0 && id < nextId;
  }

  UNREACHABLE();
}


size_t MetadataRegistry::size() const
{
  synchronized (mutex) {
    return entries.size();
  }

  UNREACHABLE();
}


vector<MetadataEntry> MetadataRegistry::drain(
    hashset<uint64_t>* sent) const
{
  CHECK_NOTNULL(sent);

  vector<MetadataEntry> pending;

  synchronized (mutex) {
    // Nothing to announce when every registered id was already sent.
    if (sent->size() == entries.size()) {
      return pending;
    }

    foreach (const MetadataEntry& entry, entries) {
      if (!sent->contains(entry.first)) {
        sent->insert(entry.first);
        pending.push_back(entry);
      }
    }
  }

  return pending;
}

} // namespace aggregator {
} // namespace internal {
} // namespace console {
