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

#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <stratus/stratus.hpp>
#include <stratus/type_utils.hpp>

#include <process/future.hpp>
#include <process/gtest.hpp>

#include <stout/gtest.hpp>
#include <stout/option.hpp>

#include "admission/queue_controller.hpp"

#include "tests/utils.hpp"

using process::Future;

using std::string;
using std::vector;

using stratus::internal::admission::Admission;
using stratus::internal::admission::QueueAdmissionController;
using stratus::internal::admission::QueueState;

namespace stratus {
namespace internal {
namespace tests {

namespace {

ResourceID createResourceId(const string& value)
{
  ResourceID resourceId;
  resourceId.set_value(value);
  return resourceId;
}

} // namespace {


class QueueAdmissionTest : public ::testing::Test {};


TEST_F(QueueAdmissionTest, FIFO)
{
  QueueAdmissionController queues;

  const ResourceID a = createResourceId("a");
  const ResourceID b = createResourceId("b");
  const ResourceID c = createResourceId("c");

  AWAIT_EXPECT_EQ(Admission::admitted(), queues.enqueue("q", a));
  AWAIT_EXPECT_EQ(Admission::waiting(1), queues.enqueue("q", b));
  AWAIT_EXPECT_EQ(Admission::waiting(2), queues.enqueue("q", c));

  // Enqueuing again reports the current position without moving.
  AWAIT_EXPECT_EQ(Admission::admitted(), queues.enqueue("q", a));
  AWAIT_EXPECT_EQ(Admission::waiting(2), queues.enqueue("q", c));

  Future<Option<ResourceID>> promoted = queues.release("q", a);
  AWAIT_READY(promoted);
  ASSERT_SOME_EQ(b, promoted.get());

  Future<QueueState> state = queues.state("q");
  AWAIT_READY(state);
  ASSERT_SOME_EQ(b, state->holder);
  ASSERT_EQ(1u, state->waiters.size());
  EXPECT_EQ(c, state->waiters.front());

  AWAIT_EXPECT_EQ(Admission::admitted(), queues.enqueue("q", b));
  AWAIT_EXPECT_EQ(Admission::waiting(1), queues.enqueue("q", c));

  promoted = queues.release("q", b);
  AWAIT_READY(promoted);
  ASSERT_SOME_EQ(c, promoted.get());

  promoted = queues.release("q", c);
  AWAIT_READY(promoted);
  EXPECT_NONE(promoted.get());

  state = queues.state("q");
  AWAIT_READY(state);
  EXPECT_NONE(state->holder);
  EXPECT_TRUE(state->waiters.empty());
}


TEST_F(QueueAdmissionTest, IndependentQueues)
{
  QueueAdmissionController queues;

  const ResourceID a = createResourceId("a");
  const ResourceID b = createResourceId("b");

  AWAIT_EXPECT_EQ(Admission::admitted(), queues.enqueue("q1", a));
  AWAIT_EXPECT_EQ(Admission::admitted(), queues.enqueue("q2", b));

  // A resource can only be a member of a single queue.
  AWAIT_FAILED(queues.enqueue("q2", a));
}


TEST_F(QueueAdmissionTest, ReleaseByNonHolder)
{
  QueueAdmissionController queues;

  const ResourceID a = createResourceId("a");
  const ResourceID b = createResourceId("b");

  AWAIT_EXPECT_EQ(Admission::admitted(), queues.enqueue("q", a));
  AWAIT_EXPECT_EQ(Admission::waiting(1), queues.enqueue("q", b));

  Future<Option<ResourceID>> promoted = queues.release("q", b);
  AWAIT_READY(promoted);
  EXPECT_NONE(promoted.get());

  promoted = queues.release("unknown", a);
  AWAIT_READY(promoted);
  EXPECT_NONE(promoted.get());

  Future<QueueState> state = queues.state("q");
  AWAIT_READY(state);
  ASSERT_SOME_EQ(a, state->holder);
  EXPECT_EQ(1u, state->waiters.size());
}


// A waiter that leaves does not disturb the order of the others.
TEST_F(QueueAdmissionTest, Withdraw)
{
  QueueAdmissionController queues;

  const ResourceID a = createResourceId("a");
  const ResourceID b = createResourceId("b");
  const ResourceID c = createResourceId("c");
  const ResourceID d = createResourceId("d");

  AWAIT_EXPECT_EQ(Admission::admitted(), queues.enqueue("q", a));
  AWAIT_EXPECT_EQ(Admission::waiting(1), queues.enqueue("q", b));
  AWAIT_EXPECT_EQ(Admission::waiting(2), queues.enqueue("q", c));
  AWAIT_EXPECT_EQ(Admission::waiting(3), queues.enqueue("q", d));

  Future<Option<ResourceID>> promoted = queues.withdraw("q", c);
  AWAIT_READY(promoted);
  EXPECT_NONE(promoted.get());

  AWAIT_EXPECT_EQ(Admission::waiting(2), queues.enqueue("q", d));

  // A holder that withdraws releases the queue.
  promoted = queues.withdraw("q", a);
  AWAIT_READY(promoted);
  ASSERT_SOME_EQ(b, promoted.get());

  Future<QueueState> state = queues.state("q");
  AWAIT_READY(state);
  ASSERT_SOME_EQ(b, state->holder);
  ASSERT_EQ(1u, state->waiters.size());
  EXPECT_EQ(d, state->waiters.front());

  // The withdrawn resource may join another queue now.
  AWAIT_EXPECT_EQ(Admission::admitted(), queues.enqueue("other", c));
}


TEST_F(QueueAdmissionTest, Recover)
{
  QueueAdmissionController queues;

  const ResourceID a = createResourceId("a");
  const ResourceID b = createResourceId("b");

  AWAIT_READY(queues.recover("q", a));

  // Recovering the same holder again is fine, another one is not.
  AWAIT_READY(queues.recover("q", a));
  AWAIT_FAILED(queues.recover("q", b));

  AWAIT_EXPECT_EQ(Admission::admitted(), queues.enqueue("q", a));
  AWAIT_EXPECT_EQ(Admission::waiting(1), queues.enqueue("q", b));
}


TEST_F(QueueAdmissionTest, WaitersMetric)
{
  QueueAdmissionController queues;

  AWAIT_EXPECT_EQ(
      Admission::admitted(),
      queues.enqueue("q", createResourceId("a")));
  AWAIT_EXPECT_EQ(
      Admission::waiting(1),
      queues.enqueue("q", createResourceId("b")));
  AWAIT_EXPECT_EQ(
      Admission::admitted(),
      queues.enqueue("other", createResourceId("c")));
  AWAIT_EXPECT_EQ(
      Admission::waiting(1),
      queues.enqueue("other", createResourceId("d")));

  EXPECT_DOUBLE_EQ(2.0, Metrics().at("admission/waiters"));
}

} // namespace tests {
} // namespace internal {
} // namespace stratus {
