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


#include <algorithm>
#include <ostream>
#include <string>

#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/process.hpp>
#include <process/timeseries.hpp>

#include <process/metrics/counter.hpp>
#include <process/metrics/metrics.hpp>

#include <stout/hashmap.hpp>
#include <stout/stringify.hpp>

#include "autoscaler/autoscaler.hpp"

#include "common/protobuf_utils.hpp"
#include "common/resource_utils.hpp"

#include "logging/logging.hpp"

using namespace process;

using process::metrics::Counter;

using std::ostream;
using std::string;

namespace stratus {
namespace internal {
namespace autoscaler {

// Upper bound on the samples kept per resource; older samples are
// sparsified by the time series beyond this.
constexpr size_t METRIC_WINDOW_CAPACITY = 1000;


ostream& operator<<(ostream& stream, const ScaleDecision::Direction& direction)
{
  switch (direction) {
    case ScaleDecision::UP:
      return stream << "up";
    case ScaleDecision::DOWN:
      return stream << "down";
    case ScaleDecision::ZERO:
      return stream << "zero";
  }

  return stream;
}


class AutoscalerProcess : public Process<AutoscalerProcess>
{
public:
  AutoscalerProcess(
      const Duration& _metricWindow,
      uint32_t _defaultStep,
      const Duration& _defaultCooldown)
    : ProcessBase(process::ID::generate("autoscaler")),
      metricWindow(_metricWindow),
      defaultStep(_defaultStep),
      defaultCooldown(_defaultCooldown) {}

  virtual ~AutoscalerProcess() {}

  Option<ScaleDecision> evaluate(
      const ResourceID& resourceId,
      const ResourceInfo& info,
      uint32_t current,
      const stratus::feed::MetricSample& sample);

  Nothing remove(const ResourceID& resourceId)
  {
    states.erase(resourceId);
    return Nothing();
  }

  Option<ScaleState> state(const ResourceID& resourceId)
  {
    if (!states.contains(resourceId)) {
      return None();
    }

    const State& state = states.at(resourceId);

    ScaleState result;
    result.target = state.target;
    result.lastAction = state.lastAction;
    result.samples = state.samples.get().size();
    return result;
  }

private:
  struct State
  {
    State(const Duration& window, uint32_t _target)
      : samples(window, METRIC_WINDOW_CAPACITY),
        target(_target) {}

    TimeSeries<double> samples;
    uint32_t target;
    Option<Time> lastAction;

    // Time at which each rule's predicate started to hold
    // continuously, if it holds.
    Option<Time> upSince;
    Option<Time> downSince;
    Option<Time> zeroSince;
  };

  const Duration metricWindow;
  const uint32_t defaultStep;
  const Duration defaultCooldown;

  hashmap<ResourceID, State> states;

  struct Metrics
  {
    Metrics()
      : scale_actions("autoscaler/scale_actions")
    {
      process::metrics::add(scale_actions);
    }

    ~Metrics()
    {
      process::metrics::remove(scale_actions);
    }

    Counter scale_actions;
  } metrics;
};


namespace {

// Starts tracking when the predicate starts to hold and stops as soon
// as it breaks.
void track(Option<Time>* since, bool holds, const Time& now)
{
  if (!holds) {
    *since = None();
  } else if (since->isNone()) {
    *since = now;
  }
}


bool fired(const Option<Time>& since, const ScaleRule& rule, const Time& now)
{
  if (since.isNone()) {
    return false;
  }

  const Duration dwell = rule.has_dwell()
    ? protobuf::getDuration(rule.dwell())
    : Duration::zero();

  return now - since.get() >= dwell;
}

} // namespace {


Option<ScaleDecision> AutoscalerProcess::evaluate(
    const ResourceID& resourceId,
    const ResourceInfo& info,
    uint32_t current,
    const stratus::feed::MetricSample& sample)
{
  if (!states.contains(resourceId)) {
    states.put(resourceId, State(metricWindow, current));
  }

  State& state = states.at(resourceId);
  state.target = current;

  // A repeated (or late) sample carries no new information about how
  // long a predicate has held.
  Option<TimeSeries<double>::Value> latest = state.samples.latest();
  if (latest.isSome() && sample.timestamp <= latest->time) {
    VLOG(1) << "Ignoring stale metric sample of resource " << resourceId;
    return None();
  }

  state.samples.set(sample.value, sample.timestamp);

  Option<ScalePolicy> policy = resources::getScalePolicy(info);
  if (policy.isNone()) {
    return None();
  }

  const Time now = sample.timestamp;
  const double value = sample.value;
  const uint32_t min = resources::getMinInstances(info);
  const uint32_t max = resources::getMaxInstances(info);

  // A rule only tracks its dwell while firing it would change the
  // target.
  track(&state.upSince,
        policy->has_up() &&
          policy->up().has_threshold() &&
          current < max &&
          value >= policy->up().threshold(),
        now);

  track(&state.downSince,
        policy->has_down() &&
          policy->down().has_threshold() &&
          current > min &&
          value <= policy->down().threshold(),
        now);

  track(&state.zeroSince,
        policy->has_zero() &&
          min == 0 &&
          current > 0 &&
          value <= policy->zero().threshold(),
        now);

  Option<ScaleDecision::Direction> direction;
  const ScaleRule* rule = nullptr;

  if (fired(state.zeroSince, policy->zero(), now)) {
    direction = ScaleDecision::ZERO;
    rule = &policy->zero();
  } else if (fired(state.downSince, policy->down(), now)) {
    direction = ScaleDecision::DOWN;
    rule = &policy->down();
  } else if (fired(state.upSince, policy->up(), now)) {
    direction = ScaleDecision::UP;
    rule = &policy->up();
  }

  if (direction.isNone()) {
    return None();
  }

  const Duration cooldown = policy->has_cooldown()
    ? protobuf::getDuration(policy->cooldown())
    : defaultCooldown;

  if (state.lastAction.isSome() && now - state.lastAction.get() < cooldown) {
    VLOG(1) << "Holding back scale " << direction.get() << " of resource "
            << resourceId << " for another "
            << (cooldown - (now - state.lastAction.get()));
    return None();
  }

  const uint32_t step = rule->has_step() ? rule->step() : defaultStep;

  ScaleDecision decision;
  decision.direction = direction.get();

  switch (direction.get()) {
    case ScaleDecision::UP:
      decision.target = current >= max || step >= max - current
        ? max
        : current + step;
      state.upSince = None();
      break;
    case ScaleDecision::DOWN:
      decision.target = current <= min || current - min <= step
        ? min
        : current - step;
      state.downSince = None();
      break;
    case ScaleDecision::ZERO:
      decision.target = 0;
      state.zeroSince = None();
      break;
  }

  decision.reason =
    "Metric at " + stringify(value) + " triggered scale " +
    stringify(direction.get()) + " from " + stringify(current) + " to " +
    stringify(decision.target) + " instance(s)";

  state.target = decision.target;
  state.lastAction = now;

  ++metrics.scale_actions;

  LOG(INFO) << "Scaling resource " << resourceId << " " << direction.get()
            << ": " << decision.reason;

  return decision;
}


Autoscaler::Autoscaler(
    const Duration& metricWindow,
    uint32_t defaultStep,
    const Duration& defaultCooldown)
{
  process = new AutoscalerProcess(metricWindow, defaultStep, defaultCooldown);
  spawn(process);
}


Autoscaler::~Autoscaler()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<Option<ScaleDecision>> Autoscaler::evaluate(
    const ResourceID& resourceId,
    const ResourceInfo& info,
    uint32_t current,
    const stratus::feed::MetricSample& sample)
{
  return dispatch(
      process,
      &AutoscalerProcess::evaluate,
      resourceId,
      info,
      current,
      sample);
}


Future<Nothing> Autoscaler::remove(const ResourceID& resourceId)
{
  return dispatch(process, &AutoscalerProcess::remove, resourceId);
}


Future<Option<ScaleState>> Autoscaler::state(const ResourceID& resourceId)
{
  return dispatch(process, &AutoscalerProcess::state, resourceId);
}

} // namespace autoscaler {
} // namespace internal {
} // namespace stratus {
