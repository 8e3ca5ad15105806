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

#ifndef __CONSOLE_AGGREGATOR_HISTOGRAM_HPP__
#define __CONSOLE_AGGREGATOR_HISTOGRAM_HPP__

#include <stdint.h>

#include <string>
#include <vector>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace console {
namespace internal {
namespace aggregator {

// A fixed precision histogram of non-negative integer values (poll
// durations in nanoseconds) using the HdrHistogram bucket layout: a
// series of power of two buckets, each split into linear sub-buckets,
// so that every value is tracked with a bounded relative error given
// by the number of significant figures. The number of counters depends
// only on the configuration, never on the number of recorded values.
//
// Values larger than the highest trackable value are recorded as the
// highest trackable value.
class Histogram
{
public:
  // Cookie of the uncompressed HdrHistogram V2 encoding.
  static const int32_t V2_ENCODING_COOKIE = 0x1c849303;

  static Try<Histogram> create(int64_t highest, int significantFigures);

  // Decodes a histogram produced by 'encode'.
  static Try<Histogram> decode(const std::string& data);

  void record(int64_t value, int64_t count = 1);

  // Records every value of 'other' into this histogram. The two
  // histograms do not need to share a configuration.
  void add(const Histogram& other);

  int64_t count() const { return total; }
  int64_t min() const;
  int64_t max() const;
  double mean() const;

  // Returns the value at the given percentile in [0, 100]; the value is
  // reported as the highest value equivalent to the selected bucket.
  int64_t percentile(double percentile) const;

  int64_t highest() const { return highestTrackable; }
  int significantFigures() const { return significantFigures_; }

  // Returns true if the two histograms have the same configuration and
  // identical counts.
  bool operator == (const Histogram& that) const;
  bool operator != (const Histogram& that) const { return !(*this == that); }

  // Serializes into the V2 binary format (big-endian header followed
  // by zig-zag LEB128 encoded counts, runs of zeros collapsed).
  std::string encode() const;

private:
  Histogram(int64_t highest, int significantFigures);

  size_t index(int64_t value) const;
  int64_t valueAt(size_t index) const;
  int64_t lowestEquivalent(int64_t value) const;
  int64_t highestEquivalent(int64_t value) const;
  int bucketIndex(int64_t value) const;
  int subBucketIndex(int64_t value, int bucketIndex) const;

  int64_t highestTrackable;
  int significantFigures_;

  int subBucketHalfCountMagnitude;
  int64_t subBucketCount;
  int64_t subBucketHalfCount;
  int64_t subBucketMask;
  int bucketCount;

  std::vector<int64_t> counts;
  int64_t total;
};

} // namespace aggregator {
} // namespace internal {
} // namespace console {

#endif // __CONSOLE_AGGREGATOR_HISTOGRAM_HPP__
