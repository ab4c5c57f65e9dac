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


#include <process/clock.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/hashmap.hpp>
#include <stout/stringify.hpp>

#include "feed/in_memory.hpp"

using namespace process;

using stratus::feed::MetricSample;

namespace stratus {
namespace internal {
namespace feed {

class InMemoryMetricFeedProcess : public Process<InMemoryMetricFeedProcess>
{
public:
  InMemoryMetricFeedProcess()
    : ProcessBase(process::ID::generate("in-memory-metric-feed")) {}

  Future<MetricSample> sample(const ResourceID& resourceId)
  {
    Option<double> value = values.get(resourceId);
    if (value.isNone()) {
      return Failure(
          "No metric reported for resource " + stringify(resourceId));
    }

    return MetricSample(Clock::now(), value.get());
  }

  Nothing report(const ResourceID& resourceId, double value)
  {
    values[resourceId] = value;
    return Nothing();
  }

  Nothing clear(const ResourceID& resourceId)
  {
    values.erase(resourceId);
    return Nothing();
  }

private:
  hashmap<ResourceID, double> values;
};


InMemoryMetricFeed::InMemoryMetricFeed()
{
  process = new InMemoryMetricFeedProcess();
  spawn(process);
}


InMemoryMetricFeed::~InMemoryMetricFeed()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<MetricSample> InMemoryMetricFeed::sample(const ResourceID& resourceId)
{
  return dispatch(process, &InMemoryMetricFeedProcess::sample, resourceId);
}


Future<Nothing> InMemoryMetricFeed::report(
    const ResourceID& resourceId,
    double value)
{
  return dispatch(
      process, &InMemoryMetricFeedProcess::report, resourceId, value);
}


Future<Nothing> InMemoryMetricFeed::clear(const ResourceID& resourceId)
{
  return dispatch(process, &InMemoryMetricFeedProcess::clear, resourceId);
}

} // namespace feed {
} // namespace internal {
} // namespace stratus {
