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


#ifndef __STRATUS_FEED_METRIC_FEED_HPP__
#define __STRATUS_FEED_METRIC_FEED_HPP__

#include <stratus/stratus.hpp>

#include <process/future.hpp>
#include <process/time.hpp>

namespace stratus {
namespace feed {

// A single observation of the scaling metric of a resource: stream
// pressure for processors, request latency for services.
struct MetricSample
{
  MetricSample() : value(0.0) {}

  MetricSample(const process::Time& _timestamp, double _value)
    : timestamp(_timestamp), value(_value) {}

  process::Time timestamp;
  double value;
};


// Source of the metrics the autoscaler acts on. `sample` fails when
// no data is available for the resource; the autoscaler then leaves
// the resource alone.
class MetricFeed
{
public:
  MetricFeed() {}
  virtual ~MetricFeed() {}

  virtual process::Future<MetricSample> sample(
      const ResourceID& resourceId) = 0;
};

} // namespace feed {
} // namespace stratus {

#endif // __STRATUS_FEED_METRIC_FEED_HPP__
