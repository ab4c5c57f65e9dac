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

#include <limits>
#include <string>

#include <gmock/gmock.h>

#include <stratus/stratus.hpp>

#include <stratus/feed/metric_feed.hpp>

#include <process/clock.hpp>
#include <process/future.hpp>
#include <process/gtest.hpp>
#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/gtest.hpp>
#include <stout/option.hpp>

#include "autoscaler/autoscaler.hpp"

#include "common/protobuf_utils.hpp"

#include "tests/utils.hpp"

using process::Clock;
using process::Future;
using process::Time;

using std::string;

using stratus::feed::MetricSample;

using stratus::internal::autoscaler::Autoscaler;
using stratus::internal::autoscaler::ScaleDecision;
using stratus::internal::autoscaler::ScaleState;

namespace stratus {
namespace internal {
namespace tests {

class AutoscalerTest : public ::testing::Test
{
protected:
  AutoscalerTest() : start(Clock::now())
  {
    resourceId.set_value("serve");
  }

  // A sample taken `offset` after the start of the test.
  MetricSample sample(const Duration& offset, double value)
  {
    return MetricSample(start + offset, value);
  }

  const Time start;
  ResourceID resourceId;
};


TEST_F(AutoscalerTest, Dwell)
{
  Autoscaler autoscaler(Minutes(10), 1, Seconds(0));

  ScalePolicy policy;
  policy.set_metric(ScalePolicy::LATENCY);
  policy.mutable_up()->CopyFrom(createScaleRule(100, Seconds(30)));

  const ResourceInfo info = createServiceInfo("serve", 1, 5, policy);

  Future<Option<ScaleDecision>> decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(0), 150));

  AWAIT_READY(decision);
  EXPECT_NONE(decision.get());

  decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(20), 150));

  AWAIT_READY(decision);
  EXPECT_NONE(decision.get());

  // A single sample below the threshold restarts the dwell.
  decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(25), 50));

  AWAIT_READY(decision);
  EXPECT_NONE(decision.get());

  decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(30), 150));

  AWAIT_READY(decision);
  EXPECT_NONE(decision.get());

  decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(50), 150));

  AWAIT_READY(decision);
  EXPECT_NONE(decision.get());

  decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(60), 150));

  AWAIT_READY(decision);
  ASSERT_SOME(decision.get());
  EXPECT_EQ(ScaleDecision::UP, decision->get().direction);
  EXPECT_EQ(2u, decision->get().target);
  EXPECT_EQ(
      "Metric at 150 triggered scale up from 1 to 2 instance(s)",
      decision->get().reason);

  EXPECT_DOUBLE_EQ(1.0, Metrics().at("autoscaler/scale_actions"));
}


TEST_F(AutoscalerTest, StaleSample)
{
  Autoscaler autoscaler(Minutes(10), 1, Seconds(0));

  ScalePolicy policy;
  policy.set_metric(ScalePolicy::LATENCY);
  policy.mutable_up()->CopyFrom(createScaleRule(100, Seconds(10)));

  const ResourceInfo info = createServiceInfo("serve", 1, 5, policy);

  Future<Option<ScaleDecision>> decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(0), 150));

  AWAIT_READY(decision);
  EXPECT_NONE(decision.get());

  decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(0), 50));

  AWAIT_READY(decision);
  EXPECT_NONE(decision.get());

  // The sample repeating the timestamp did not break the dwell.
  decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(10), 150));

  AWAIT_READY(decision);
  ASSERT_SOME(decision.get());
  EXPECT_EQ(ScaleDecision::UP, decision->get().direction);

  Future<Option<ScaleState>> state = autoscaler.state(resourceId);
  AWAIT_READY(state);
  ASSERT_SOME(state.get());
  EXPECT_EQ(2u, state->get().samples);
  EXPECT_EQ(2u, state->get().target);
  EXPECT_SOME_EQ(start + Seconds(10), state->get().lastAction);
}


TEST_F(AutoscalerTest, Cooldown)
{
  Autoscaler autoscaler(Minutes(10), 1, Minutes(5));

  ScalePolicy policy;
  policy.set_metric(ScalePolicy::LATENCY);
  policy.mutable_up()->CopyFrom(createScaleRule(100, Seconds(0)));
  policy.mutable_cooldown()->CopyFrom(
      protobuf::createDurationInfo(Seconds(60)));

  const ResourceInfo info = createServiceInfo("serve", 1, 5, policy);

  Future<Option<ScaleDecision>> decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(0), 150));

  AWAIT_READY(decision);
  ASSERT_SOME(decision.get());
  EXPECT_EQ(2u, decision->get().target);

  decision =
    autoscaler.evaluate(resourceId, info, 2, sample(Seconds(30), 150));

  AWAIT_READY(decision);
  EXPECT_NONE(decision.get());

  // The policy cooldown overrides the default of five minutes.
  decision =
    autoscaler.evaluate(resourceId, info, 2, sample(Seconds(60), 150));

  AWAIT_READY(decision);
  ASSERT_SOME(decision.get());
  EXPECT_EQ(3u, decision->get().target);
}


TEST_F(AutoscalerTest, ZeroWinsOverDown)
{
  Autoscaler autoscaler(Minutes(10), 1, Seconds(0));

  ScalePolicy policy;
  policy.set_metric(ScalePolicy::PRESSURE);
  policy.mutable_up()->CopyFrom(createScaleRule(100, Seconds(0)));
  policy.mutable_down()->CopyFrom(createScaleRule(50, Seconds(0)));
  policy.mutable_zero()->CopyFrom(createScaleRule(10, Seconds(0)));

  const ResourceInfo info =
    createProcessorInfo("ingest", "events", 0, 5, policy);

  Future<Option<ScaleDecision>> decision =
    autoscaler.evaluate(resourceId, info, 3, sample(Seconds(0), 20));

  AWAIT_READY(decision);
  ASSERT_SOME(decision.get());
  EXPECT_EQ(ScaleDecision::DOWN, decision->get().direction);
  EXPECT_EQ(2u, decision->get().target);

  decision =
    autoscaler.evaluate(resourceId, info, 2, sample(Seconds(10), 5));

  AWAIT_READY(decision);
  ASSERT_SOME(decision.get());
  EXPECT_EQ(ScaleDecision::ZERO, decision->get().direction);
  EXPECT_EQ(0u, decision->get().target);
}


// Rules never move the target outside of the declared bounds.
TEST_F(AutoscalerTest, Bounds)
{
  Autoscaler autoscaler(Minutes(10), 3, Seconds(0));

  ScalePolicy policy;
  policy.set_metric(ScalePolicy::LATENCY);
  policy.mutable_up()->CopyFrom(createScaleRule(100, Seconds(0)));
  policy.mutable_down()->CopyFrom(createScaleRule(50, Seconds(0)));

  const ResourceInfo info = createServiceInfo("serve", 2, 5, policy);

  Future<Option<ScaleDecision>> decision =
    autoscaler.evaluate(resourceId, info, 4, sample(Seconds(0), 150));

  AWAIT_READY(decision);
  ASSERT_SOME(decision.get());
  EXPECT_EQ(5u, decision->get().target);

  decision =
    autoscaler.evaluate(resourceId, info, 5, sample(Seconds(10), 150));

  AWAIT_READY(decision);
  EXPECT_NONE(decision.get());

  decision =
    autoscaler.evaluate(resourceId, info, 3, sample(Seconds(20), 10));

  AWAIT_READY(decision);
  ASSERT_SOME(decision.get());
  EXPECT_EQ(ScaleDecision::DOWN, decision->get().direction);
  EXPECT_EQ(2u, decision->get().target);

  decision =
    autoscaler.evaluate(resourceId, info, 2, sample(Seconds(30), 10));

  AWAIT_READY(decision);
  EXPECT_NONE(decision.get());

  // With a zero minimum a down rule alone may reach zero.
  const ResourceInfo elastic = createServiceInfo("serve", 0, 5, policy);

  decision =
    autoscaler.evaluate(resourceId, elastic, 1, sample(Seconds(40), 0));

  AWAIT_READY(decision);
  ASSERT_SOME(decision.get());
  EXPECT_EQ(0u, decision->get().target);
  EXPECT_EQ(ScaleDecision::DOWN, decision->get().direction);
}


TEST_F(AutoscalerTest, RuleStep)
{
  Autoscaler autoscaler(Minutes(10), 1, Seconds(0));

  ScalePolicy policy;
  policy.set_metric(ScalePolicy::LATENCY);
  policy.mutable_up()->CopyFrom(createScaleRule(100, Seconds(0), 2));

  const ResourceInfo info = createServiceInfo("serve", 1, 10, policy);

  Future<Option<ScaleDecision>> decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(0), 150));

  AWAIT_READY(decision);
  ASSERT_SOME(decision.get());
  EXPECT_EQ(3u, decision->get().target);
}


// Steps beyond the bounds land exactly on them.
TEST_F(AutoscalerTest, LargeStep)
{
  Autoscaler autoscaler(Minutes(10), 1, Seconds(0));

  const uint32_t step = std::numeric_limits<uint32_t>::max();

  ScalePolicy policy;
  policy.set_metric(ScalePolicy::LATENCY);
  policy.mutable_up()->CopyFrom(createScaleRule(100, Seconds(0), step));
  policy.mutable_down()->CopyFrom(createScaleRule(10, Seconds(0), step));

  const ResourceInfo info = createServiceInfo("serve", 1, 3, policy);

  Future<Option<ScaleDecision>> decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(0), 150));

  AWAIT_READY(decision);
  ASSERT_SOME(decision.get());
  EXPECT_EQ(ScaleDecision::UP, decision->get().direction);
  EXPECT_EQ(3u, decision->get().target);

  decision =
    autoscaler.evaluate(resourceId, info, 3, sample(Seconds(10), 5));

  AWAIT_READY(decision);
  ASSERT_SOME(decision.get());
  EXPECT_EQ(ScaleDecision::DOWN, decision->get().direction);
  EXPECT_EQ(1u, decision->get().target);
}


TEST_F(AutoscalerTest, NoPolicy)
{
  Autoscaler autoscaler(Minutes(10), 1, Seconds(0));

  const ResourceInfo info = createServiceInfo("serve", 1, 5);

  Future<Option<ScaleDecision>> decision =
    autoscaler.evaluate(resourceId, info, 1, sample(Seconds(0), 1000));

  AWAIT_READY(decision);
  EXPECT_NONE(decision.get());

  AWAIT_READY(autoscaler.remove(resourceId));

  Future<Option<ScaleState>> state = autoscaler.state(resourceId);
  AWAIT_READY(state);
  EXPECT_NONE(state.get());
}

} // namespace tests {
} // namespace internal {
} // namespace stratus {
