// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef __FEED_IN_MEMORY_HPP__
#define __FEED_IN_MEMORY_HPP__

#include <stratus/stratus.hpp>

#include <stratus/feed/metric_feed.hpp>

#include <process/future.hpp>

#include <stout/nothing.hpp>

namespace stratus {
namespace internal {
namespace feed {

// Forward declaration.
class InMemoryMetricFeedProcess;


// Metric feed holding the last value reported for each resource.
// Samples are stamped with the time they are taken.
class InMemoryMetricFeed : public stratus::feed::MetricFeed
{
public:
  InMemoryMetricFeed();
  virtual ~InMemoryMetricFeed();

  virtual process::Future<stratus::feed::MetricSample> sample(
      const ResourceID& resourceId);

  process::Future<Nothing> report(const ResourceID& resourceId, double value);

  process::Future<Nothing> clear(const ResourceID& resourceId);

private:
  InMemoryMetricFeed(const InMemoryMetricFeed&) = delete;
  InMemoryMetricFeed& operator=(const InMemoryMetricFeed&) = delete;

  InMemoryMetricFeedProcess* process;
};

} // namespace feed {
} // namespace internal {
} // namespace stratus {

#endif // __FEED_IN_MEMORY_HPP__
