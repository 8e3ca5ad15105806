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

#include <string.h>

#include <limits>
#include <string>

#include <stout/error.hpp>
#include <stout/stringify.hpp>

#include <glog/logging.h>

#include "aggregator/histogram.hpp"

using std::string;

namespace console {
namespace internal {
namespace aggregator {

const int32_t Histogram::V2_ENCODING_COOKIE;


// Size of the V2 header: cookie, payload length, normalizing index
// offset, significant figures (4 bytes each), lowest discernible value,
// highest trackable value and the integer to double conversion ratio
// (8 bytes each).
static const size_t V2_HEADER_SIZE = 40;


namespace {

void putInt32(string* out, int32_t value)
{
  uint32_t bits = static_cast<uint32_t>(value);
  for (int shift = 24; shift >= 0; shift -= 8) {
    out->push_back(static_cast<char>((bits >> shift) & 0xff));
  }
}


void putInt64(string* out, int64_t value)
{
  uint64_t bits = static_cast<uint64_t>(value);
  for (int shift = 56; shift >= 0; shift -= 8) {
    out->push_back(static_cast<char>((bits >> shift) & 0xff));
  }
}


uint64_t getBits(const string& data, size_t offset, size_t width)
{
  uint64_t bits = 0;
  for (size_t i = 0; i < width; i++) {
    bits = (bits << 8) | static_cast<uint8_t>(data[offset + i]);
  }
  return bits;
}


// HdrHistogram flavor of LEB128: up to eight 7-bit groups, then a
// ninth byte carrying the remaining 8 bits.
void putVarint(string* out, int64_t value)
{
  uint64_t bits =
    (static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63);

  for (int i = 0; i < 8; i++) {
    if ((bits >> 7) == 0) {
      out->push_back(static_cast<char>(bits));
      return;
    }

    out->push_back(static_cast<char>((bits & 0x7f) | 0x80));
    bits >>= 7;
  }

  out->push_back(static_cast<char>(bits & 0xff));
}


Try<int64_t> getVarint(const string& data, size_t* offset, size_t end)
{
  uint64_t bits = 0;

  for (int i = 0; i < 9; i++) {
    if (*offset >= end) {
      return Error("Truncated varint in histogram payload");
    }

    uint8_t byte = static_cast<uint8_t>(data[(*offset)++]);

    if (i == 8) {
      bits |= static_cast<uint64_t>(byte) << 56;
      break;
    }

    bits |= static_cast<uint64_t>(byte & 0x7f) << (7 * i);

    if ((byte & 0x80) == 0) {
      break;
    }
  }

  return static_cast<int64_t>((bits >> 1) ^ (~(bits & 1) + 1));
}

} // namespace {


Try<Histogram> Histogram::create(int64_t highest, int significantFigures)
{
  if (significantFigures < 1 || significantFigures > 5) {
    return Error(
        "Significant figures must be between 1 and 5, got " +
        stringify(significantFigures));
  }

  if (highest < 2) {
    return Error(
        "Highest trackable value must be at least 2, got " +
        stringify(highest));
  }

  return Histogram(highest, significantFigures);
}


Histogram::Histogram(int64_t highest, int _significantFigures)
  : highestTrackable(highest),
    significantFigures_(_significantFigures),
    total(0)
{
  int64_t largestValueWithSingleUnitResolution = 2;
  for (int i = 0; i < significantFigures_; i++) {
    largestValueWithSingleUnitResolution *= 10;
  }

  int subBucketCountMagnitude = 0;
  while ((int64_t(1) << subBucketCountMagnitude) <
         largestValueWithSingleUnitResolution) {
    subBucketCountMagnitude++;
  }

  subBucketHalfCountMagnitude =
    (subBucketCountMagnitude > 1 ? subBucketCountMagnitude : 1) - 1;
  subBucketCount = int64_t(1) << (subBucketHalfCountMagnitude + 1);
  subBucketHalfCount = subBucketCount / 2;
  subBucketMask = subBucketCount - 1;

  int64_t smallestUntrackable = subBucketCount;
  bucketCount = 1;
  while (smallestUntrackable <= highestTrackable) {
    if (smallestUntrackable > std::numeric_limits<int64_t>::max() / 2) {
      bucketCount++;
      break;
    }
    smallestUntrackable <<= 1;
    bucketCount++;
  }

  counts.assign((bucketCount + 1) * subBucketHalfCount, 0);
}


int Histogram::bucketIndex(int64_t value) const
{
  int pow2ceiling = 64 - __builtin_clzll(
      static_cast<uint64_t>(value | subBucketMask));

  return pow2ceiling - (subBucketHalfCountMagnitude + 1);
}


int Histogram::subBucketIndex(int64_t value, int bucketIndex) const
{
  return static_cast<int>(value >> bucketIndex);
}


size_t Histogram::index(int64_t value) const
{
  int bucket = bucketIndex(value);
  int subBucket = subBucketIndex(value, bucket);

  int64_t base = int64_t(bucket + 1) << subBucketHalfCountMagnitude;

  return static_cast<size_t>(base + (subBucket - subBucketHalfCount));
}


int64_t Histogram::valueAt(size_t index) const
{
  int64_t bucket = (int64_t(index) >> subBucketHalfCountMagnitude) - 1;
  int64_t subBucket =
    (int64_t(index) & (subBucketHalfCount - 1)) + subBucketHalfCount;

  if (bucket < 0) {
    subBucket -= subBucketHalfCount;
    bucket = 0;
  }

  return subBucket << bucket;
}


int64_t Histogram::lowestEquivalent(int64_t value) const
{
  int bucket = bucketIndex(value);
  return int64_t(subBucketIndex(value, bucket)) << bucket;
}


int64_t Histogram::highestEquivalent(int64_t value) const
{
  int bucket = bucketIndex(value);
  int subBucket = subBucketIndex(value, bucket);

  int magnitude = subBucket >= subBucketCount ? bucket + 1 : bucket;

  return lowestEquivalent(value) + (int64_t(1) << magnitude) - 1;
}


void Histogram::record(int64_t value, int64_t count)
{
  if (value < 0) {
    value = 0;
  } else if (value > highestTrackable) {
    value = highestTrackable;
  }

  size_t i = index(value);
  CHECK_LT(i, counts.size());

  counts[i] += count;
  total += count;
}


void Histogram::add(const Histogram& other)
{
  for (size_t i = 0; i < other.counts.size(); i++) {
    if (other.counts[i] != 0) {
      record(other.valueAt(i), other.counts[i]);
    }
  }
}


int64_t Histogram::min() const
{
  for (size_t i = 0; i < counts.size(); i++) {
    if (counts[i] != 0) {
      return lowestEquivalent(valueAt(i));
    }
  }

  return 0;
}


int64_t Histogram::max() const
{
  for (size_t i = counts.size(); i > 0; i--) {
    if (counts[i - 1] != 0) {
      return highestEquivalent(valueAt(i - 1));
    }
  }

  return 0;
}


double Histogram::mean() const
{
  if (total == 0) {
    return 0.0;
  }

  double sum = 0.0;
  for (size_t i = 0; i < counts.size(); i++) {
    if (counts[i] != 0) {
      int64_t value = valueAt(i);
      int64_t median =
        lowestEquivalent(value) +
        (highestEquivalent(value) - lowestEquivalent(value) + 1) / 2;

      sum += static_cast<double>(median) * counts[i];
    }
  }

  return sum / total;
}


int64_t Histogram::percentile(double percentile) const
{
  if (total == 0) {
    return 0;
  }

  if (percentile < 0.0) {
    percentile = 0.0;
  } else if (percentile > 100.0) {
    percentile = 100.0;
  }

  int64_t target =
    static_cast<int64_t>((percentile / 100.0) * total + 0.5);

  if (target < 1) {
    target = 1;
  }

  int64_t seen = 0;
  for (size_t i = 0; i < counts.size(); i++) {
    seen += counts[i];
    if (seen >= target) {
      return highestEquivalent(valueAt(i));
    }
  }

  return 0; // Unreachable since 'seen' reaches 'total'.
}


bool Histogram::operator == (const Histogram& that) const
{
  return highestTrackable == that.highestTrackable &&
    significantFigures_ == that.significantFigures_ &&
    total == that.total &&
    counts == that.counts;
}


string Histogram::encode() const
{
  size_t length = counts.size();
  while (length > 0 && counts[length - 1] == 0) {
    length--;
  }

  string payload;
  for (size_t i = 0; i < length; i++) {
    if (counts[i] != 0) {
      putVarint(&payload, counts[i]);
      continue;
    }

    int64_t zeros = 1;
    while (i + 1 < length && counts[i + 1] == 0) {
      zeros++;
      i++;
    }

    putVarint(&payload, zeros > 1 ? -zeros : 0);
  }

  int64_t ratio;
  double one = 1.0;
  memcpy(&ratio, &one, sizeof(ratio));

  string data;
  data.reserve(V2_HEADER_SIZE + payload.size());

  putInt32(&data, V2_ENCODING_COOKIE);
  putInt32(&data, static_cast<int32_t>(payload.size()));
  putInt32(&data, 0); // Normalizing index offset.
  putInt32(&data, significantFigures_);
  putInt64(&data, 1); // Lowest discernible value.
  putInt64(&data, highestTrackable);
  putInt64(&data, ratio);

  data.append(payload);

  return data;
}


Try<Histogram> Histogram::decode(const string& data)
{
  if (data.size() < V2_HEADER_SIZE) {
    return Error(
        "Histogram data is truncated: " + stringify(data.size()) +
        " bytes is smaller than the header");
  }

  int32_t cookie = static_cast<int32_t>(getBits(data, 0, 4));
  if (cookie != V2_ENCODING_COOKIE) {
    return Error("Unsupported histogram encoding cookie " + stringify(cookie));
  }

  size_t payloadLength = static_cast<size_t>(getBits(data, 4, 4));
  if (V2_HEADER_SIZE + payloadLength > data.size()) {
    return Error(
        "Histogram data is truncated: payload of " +
        stringify(payloadLength) + " bytes but only " +
        stringify(data.size() - V2_HEADER_SIZE) + " available");
  }

  int32_t offset = static_cast<int32_t>(getBits(data, 8, 4));
  if (offset != 0) {
    return Error("Unsupported normalizing index offset " + stringify(offset));
  }

  int significantFigures = static_cast<int>(getBits(data, 12, 4));

  int64_t lowest = static_cast<int64_t>(getBits(data, 16, 8));
  if (lowest != 1) {
    return Error(
        "Unsupported lowest discernible value " + stringify(lowest));
  }

  int64_t highest = static_cast<int64_t>(getBits(data, 24, 8));

  Try<Histogram> histogram = create(highest, significantFigures);
  if (histogram.isError()) {
    return Error("Invalid histogram header: " + histogram.error());
  }

  Histogram result = histogram.get();

  size_t position = V2_HEADER_SIZE;
  size_t end = V2_HEADER_SIZE + payloadLength;
  size_t index = 0;

  while (position < end) {
    Try<int64_t> value = getVarint(data, &position, end);
    if (value.isError()) {
      return Error(value.error());
    }

    if (value.get() < 0) {
      // Negating the smallest int64 overflows.
      if (value.get() == std::numeric_limits<int64_t>::min()) {
        return Error("Invalid zero run in histogram payload");
      }

      uint64_t zeros = static_cast<uint64_t>(-value.get());
      if (zeros > result.counts.size() - index) {
        return Error(
            "Histogram payload overflows " +
            stringify(result.counts.size()) + " buckets");
      }

      index += static_cast<size_t>(zeros);
      continue;
    }

    if (index >= result.counts.size()) {
      return Error(
          "Histogram payload overflows " +
          stringify(result.counts.size()) + " buckets");
    }

    result.counts[index] = value.get();
    result.total += value.get();
    index++;
  }

  return result;
}

} // namespace aggregator {
} // namespace internal {
} // namespace console {
