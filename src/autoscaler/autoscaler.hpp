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


#ifndef __AUTOSCALER_AUTOSCALER_HPP__
#define __AUTOSCALER_AUTOSCALER_HPP__

#include <ostream>
#include <string>

#include <stratus/stratus.hpp>

#include <stratus/feed/metric_feed.hpp>

#include <process/future.hpp>
#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

namespace stratus {
namespace internal {
namespace autoscaler {

// Forward declaration.
class AutoscalerProcess;


struct ScaleDecision
{
  enum Direction
  {
    UP,
    DOWN,
    ZERO
  };

  Direction direction;
  uint32_t target;
  std::string reason;
};


std::ostream& operator<<(
    std::ostream& stream,
    const ScaleDecision::Direction& direction);


// Observable state the autoscaler keeps for a resource.
struct ScaleState
{
  uint32_t target;
  Option<process::Time> lastAction;

  // Number of samples in the metric window.
  size_t samples;
};


// Computes target instance counts of elastic resources from their
// scale policy. A rule fires once its metric predicate held for the
// rule's dwell duration: `up` on values at or above the threshold,
// `down` and `zero` on values at or below it. When several rules fire
// `zero` wins over `down`, which wins over `up`. No action is taken
// within the cooldown of the previous action.
//
// All timing is based on the timestamps of the samples.
class Autoscaler
{
public:
  Autoscaler(
      const Duration& metricWindow,
      uint32_t defaultStep,
      const Duration& defaultCooldown);

  virtual ~Autoscaler();

  // Feeds a sample of the metric of an elastic resource currently
  // running `current` instances. Returns the new target if a rule
  // fired.
  process::Future<Option<ScaleDecision>> evaluate(
      const ResourceID& resourceId,
      const ResourceInfo& info,
      uint32_t current,
      const stratus::feed::MetricSample& sample);

  // Discards the state kept for the resource.
  process::Future<Nothing> remove(const ResourceID& resourceId);

  process::Future<Option<ScaleState>> state(const ResourceID& resourceId);

private:
  Autoscaler(const Autoscaler&) = delete;
  Autoscaler& operator=(const Autoscaler&) = delete;

  AutoscalerProcess* process;
};

} // namespace autoscaler {
} // namespace internal {
} // namespace stratus {

#endif // __AUTOSCALER_AUTOSCALER_HPP__
