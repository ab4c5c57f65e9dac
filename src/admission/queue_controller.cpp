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
#include <deque>
#include <ostream>
#include <string>
#include <vector>

#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <process/metrics/metrics.hpp>
#include <process/metrics/pull_gauge.hpp>

#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>

#include "admission/queue_controller.hpp"

#include "logging/logging.hpp"

using namespace process;

using process::metrics::PullGauge;

using std::deque;
using std::ostream;
using std::string;
using std::vector;

namespace stratus {
namespace internal {
namespace admission {

ostream& operator<<(ostream& stream, const Admission& admission)
{
  switch (admission.status) {
    case Admission::ADMITTED:
      return stream << "admitted";
    case Admission::WAITING:
      return stream << "waiting at position " << admission.position;
  }

  return stream;
}


class QueueAdmissionControllerProcess
  : public Process<QueueAdmissionControllerProcess>
{
public:
  QueueAdmissionControllerProcess()
    : ProcessBase(process::ID::generate("queue-admission")),
      metrics(*this) {}

  virtual ~QueueAdmissionControllerProcess() {}

  Future<Admission> enqueue(const string& name, const ResourceID& resourceId);

  Option<ResourceID> release(const string& name, const ResourceID& resourceId);

  Option<ResourceID> withdraw(
      const string& name,
      const ResourceID& resourceId);

  Future<Nothing> recover(const string& name, const ResourceID& resourceId);

  QueueState state(const string& name)
  {
    QueueState result;

    if (queues.contains(name)) {
      const Queue& queue = queues.at(name);
      result.holder = queue.holder;
      result.waiters.assign(queue.waiters.begin(), queue.waiters.end());
    }

    return result;
  }

private:
  struct Queue
  {
    Option<ResourceID> holder;
    deque<ResourceID> waiters;
  };

  // Drops the queue once it is neither held nor waited on.
  void cleanup(const string& name)
  {
    const Queue& queue = queues.at(name);
    if (queue.holder.isNone() && queue.waiters.empty()) {
      queues.erase(name);
    }
  }

  struct Metrics
  {
    explicit Metrics(const QueueAdmissionControllerProcess& process)
      : waiters(
            "admission/waiters",
            defer(process, &QueueAdmissionControllerProcess::_waiters))
    {
      process::metrics::add(waiters);
    }

    ~Metrics()
    {
      process::metrics::remove(waiters);
    }

    PullGauge waiters;
  } metrics;

  // PullGauge handlers.
  double _waiters()
  {
    size_t count = 0;
    foreachvalue (const Queue& queue, queues) {
      count += queue.waiters.size();
    }
    return static_cast<double>(count);
  }

  hashmap<string, Queue> queues;

  // The queue each resource holds or waits on.
  hashmap<ResourceID, string> memberships;
};


Future<Admission> QueueAdmissionControllerProcess::enqueue(
    const string& name,
    const ResourceID& resourceId)
{
  Option<string> membership = memberships.get(resourceId);
  if (membership.isSome() && membership.get() != name) {
    return Failure(
        "Resource " + stringify(resourceId) + " is already a member of"
        " queue '" + membership.get() + "'");
  }

  Queue& queue = queues[name];

  if (queue.holder.isNone()) {
    CHECK(queue.waiters.empty());

    queue.holder = resourceId;
    memberships[resourceId] = name;

    LOG(INFO) << "Resource " << resourceId << " admitted to queue '"
              << name << "'";

    return Admission::admitted();
  }

  if (queue.holder.get() == resourceId) {
    return Admission::admitted();
  }

  deque<ResourceID>::iterator it =
    std::find(queue.waiters.begin(), queue.waiters.end(), resourceId);

  if (it == queue.waiters.end()) {
    queue.waiters.push_back(resourceId);
    memberships[resourceId] = name;

    LOG(INFO) << "Resource " << resourceId << " waiting in queue '"
              << name << "' behind " << queue.holder.get();

    return Admission::waiting(queue.waiters.size());
  }

  return Admission::waiting(std::distance(queue.waiters.begin(), it) + 1);
}


Option<ResourceID> QueueAdmissionControllerProcess::release(
    const string& name,
    const ResourceID& resourceId)
{
  if (!queues.contains(name)) {
    return None();
  }

  Queue& queue = queues.at(name);

  if (queue.holder.isNone() || queue.holder.get() != resourceId) {
    VLOG(1) << "Ignoring release of queue '" << name << "' by "
            << resourceId << " which does not hold it";
    return None();
  }

  memberships.erase(resourceId);
  queue.holder = None();

  Option<ResourceID> promoted;
  if (!queue.waiters.empty()) {
    promoted = queue.waiters.front();
    queue.waiters.pop_front();
    queue.holder = promoted;

    LOG(INFO) << "Queue '" << name << "' released by " << resourceId
              << ", promoted " << promoted.get();
  } else {
    LOG(INFO) << "Queue '" << name << "' released by " << resourceId;
  }

  cleanup(name);

  return promoted;
}


Option<ResourceID> QueueAdmissionControllerProcess::withdraw(
    const string& name,
    const ResourceID& resourceId)
{
  if (!queues.contains(name)) {
    return None();
  }

  Queue& queue = queues.at(name);

  if (queue.holder.isSome() && queue.holder.get() == resourceId) {
    return release(name, resourceId);
  }

  deque<ResourceID>::iterator it =
    std::find(queue.waiters.begin(), queue.waiters.end(), resourceId);

  if (it != queue.waiters.end()) {
    queue.waiters.erase(it);
    memberships.erase(resourceId);

    LOG(INFO) << "Resource " << resourceId << " left queue '" << name << "'";

    cleanup(name);
  }

  return None();
}


Future<Nothing> QueueAdmissionControllerProcess::recover(
    const string& name,
    const ResourceID& resourceId)
{
  Option<string> membership = memberships.get(resourceId);
  if (membership.isSome() && membership.get() != name) {
    return Failure(
        "Resource " + stringify(resourceId) + " is already a member of"
        " queue '" + membership.get() + "'");
  }

  Queue& queue = queues[name];

  if (queue.holder.isSome() && queue.holder.get() != resourceId) {
    return Failure(
        "Queue '" + name + "' is already held by " +
        stringify(queue.holder.get()));
  }

  queue.holder = resourceId;
  memberships[resourceId] = name;

  // Recovery of holders happens before any waiter re-enqueues.
  CHECK(queue.waiters.empty());

  LOG(INFO) << "Recovered holder " << resourceId << " of queue '"
            << name << "'";

  return Nothing();
}


QueueAdmissionController::QueueAdmissionController()
{
  process = new QueueAdmissionControllerProcess();
  spawn(process);
}


QueueAdmissionController::~QueueAdmissionController()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<Admission> QueueAdmissionController::enqueue(
    const string& queue,
    const ResourceID& resourceId)
{
  return dispatch(
      process, &QueueAdmissionControllerProcess::enqueue, queue, resourceId);
}


Future<Option<ResourceID>> QueueAdmissionController::release(
    const string& queue,
    const ResourceID& resourceId)
{
  return dispatch(
      process, &QueueAdmissionControllerProcess::release, queue, resourceId);
}


Future<Option<ResourceID>> QueueAdmissionController::withdraw(
    const string& queue,
    const ResourceID& resourceId)
{
  return dispatch(
      process, &QueueAdmissionControllerProcess::withdraw, queue, resourceId);
}


Future<Nothing> QueueAdmissionController::recover(
    const string& queue,
    const ResourceID& resourceId)
{
  return dispatch(
      process, &QueueAdmissionControllerProcess::recover, queue, resourceId);
}


Future<QueueState> QueueAdmissionController::state(const string& queue)
{
  return dispatch(process, &QueueAdmissionControllerProcess::state, queue);
}

} // namespace admission {
} // namespace internal {
} // namespace stratus {
