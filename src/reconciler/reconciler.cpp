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
#include <vector>

#include <process/clock.hpp>
#include <process/collect.hpp>
#include <process/defer.hpp>
#include <process/delay.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/owned.hpp>
#include <process/process.hpp>
#include <process/timer.hpp>

#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/hashset.hpp>
#include <stout/lambda.hpp>
#include <stout/stringify.hpp>

#include "common/protobuf_utils.hpp"
#include "common/resource_utils.hpp"

#include "logging/logging.hpp"

#include "reconciler/metrics.hpp"
#include "reconciler/reconciler.hpp"
#include "reconciler/worker.hpp"

using namespace process;

using std::deque;
using std::vector;

using stratus::feed::MetricFeed;

using stratus::internal::admission::QueueAdmissionController;

using stratus::internal::autoscaler::Autoscaler;

using stratus::internal::scheduler::Scheduler;

using stratus::internal::store::ResourceStore;

namespace stratus {
namespace internal {
namespace reconciler {

class ReconcilerProcess : public Process<ReconcilerProcess>
{
public:
  ReconcilerProcess(
      const engine::Flags& _flags,
      ResourceStore* _store,
      QueueAdmissionController* _queues,
      Scheduler* _scheduler,
      Autoscaler* _autoscaler,
      stratus::placement::Backend* _backend,
      MetricFeed* _feed,
      const accelerators::Catalog& _catalog)
    : ProcessBase(process::ID::generate("reconciler")),
      flags(_flags),
      store(_store),
      queues(_queues),
      scheduler(_scheduler),
      autoscaler(_autoscaler),
      backend(_backend),
      feed(_feed),
      catalog(_catalog),
      started(false),
      nextLeaseId(0) {}

  virtual ~ReconcilerProcess() {}

  Future<Nothing> start();

  Nothing reconcile(const ResourceID& resourceId)
  {
    enqueue(resourceId, UPDATE);
    return Nothing();
  }

protected:
  virtual void initialize();
  virtual void finalize();

private:
  struct Lease
  {
    uint64_t id;
    size_t worker;
    Future<Option<Duration>> future;
    Timer timer;

    // Whether the resource changed while it was leased.
    bool dirty;
  };

  Future<Nothing> _start(const vector<Resource>& resources);

  void changed(const Resource& resource);
  void wakeup(const ResourceID& resourceId);

  void enqueue(const ResourceID& resourceId, Trigger trigger);

  // Hands queued resources to idle workers.
  void schedule();

  void release(
      const ResourceID& resourceId,
      uint64_t leaseId,
      const Future<Option<Duration>>& future);

  void expire(const ResourceID& resourceId, uint64_t leaseId);

  // Reconciles the resource again after `delay` unless something
  // else triggers it first.
  void requeue(const ResourceID& resourceId, const Duration& delay);
  void requeued(const ResourceID& resourceId);

  void resync();
  void _resync(const Future<vector<Resource>>& list);

  void autoscale();
  void _autoscale(const Future<vector<Resource>>& list);

  const engine::Flags flags;
  ResourceStore* store;
  QueueAdmissionController* queues;
  Scheduler* scheduler;
  Autoscaler* autoscaler;
  stratus::placement::Backend* backend;
  MetricFeed* feed;
  const accelerators::Catalog catalog;

  Metrics metrics;

  bool started;

  vector<Owned<Worker>> workers;
  deque<size_t> idle;

  // Resources waiting for a worker, deduplicated.
  deque<ResourceID> queue;
  hashset<ResourceID> queued;

  // Resources whose next pass also evaluates their scale policy.
  hashset<ResourceID> autoscaling;

  hashmap<ResourceID, Lease> leases;
  uint64_t nextLeaseId;

  hashmap<ResourceID, Timer> timers;
};


void ReconcilerProcess::initialize()
{
  const lambda::function<void(const ResourceID&)> wakeup =
    defer(self(), &Self::wakeup, lambda::_1);

  for (size_t i = 0; i < flags.workers; i++) {
    workers.push_back(Owned<Worker>(new Worker(
        flags,
        store,
        queues,
        scheduler,
        autoscaler,
        backend,
        feed,
        catalog,
        &metrics,
        wakeup)));

    idle.push_back(i);
  }
}


void ReconcilerProcess::finalize()
{
  foreachvalue (const Timer& timer, timers) {
    Clock::cancel(timer);
  }

  foreachvalue (Lease& lease, leases) {
    Clock::cancel(lease.timer);
    lease.future.discard();
  }
}


Future<Nothing> ReconcilerProcess::start()
{
  if (started) {
    return Failure("The reconciler was already started");
  }

  started = true;

  LOG(INFO) << "Starting the reconciler with " << workers.size()
            << " worker(s)";

  return store->list()
    .then(defer(self(), &Self::_start, lambda::_1));
}


Future<Nothing> ReconcilerProcess::_start(const vector<Resource>& resources)
{
  vector<Resource> holders;
  vector<Resource> waiters;

  foreach (const Resource& resource, resources) {
    const ResourceStatus& status = resource.status();

    if (!status.has_queue() || protobuf::isTerminalPhase(status.phase())) {
      continue;
    }

    if (status.phase() == ResourceStatus::QUEUED) {
      waiters.push_back(resource);
    } else {
      holders.push_back(resource);
    }
  }

  // Waiters rejoin their queues in the order they originally joined.
  std::stable_sort(
      waiters.begin(),
      waiters.end(),
      [](const Resource& left, const Resource& right) {
        return left.status().queued_at().nanoseconds() <
          right.status().queued_at().nanoseconds();
      });

  // NOTE: Dispatches to the queue controller are processed in the
  // order they are made, so holders are restored before any waiter
  // gets to queue up.
  vector<Future<Nothing>> futures;

  foreach (const Resource& resource, holders) {
    LOG(INFO) << "Recovering resource " << resource.id()
              << " as the holder of queue '" << resource.status().queue()
              << "'";

    futures.push_back(
        queues->recover(resource.status().queue(), resource.id()));
  }

  foreach (const Resource& resource, waiters) {
    futures.push_back(
        queues->enqueue(resource.status().queue(), resource.id())
          .then([]() { return Nothing(); }));
  }

  return await(futures)
    .then(defer(self(), [=](const vector<Future<Nothing>>& results) {
      foreach (const Future<Nothing>& result, results) {
        if (!result.isReady()) {
          LOG(WARNING) << "Failed to recover queue membership: "
                       << (result.isFailed() ? result.failure() : "discarded");
        }
      }

      return store->watch(defer(self(), &Self::changed, lambda::_1));
    }))
    .then(defer(self(), [=]() {
      resync();
      autoscale();
      return Nothing();
    }));
}


void ReconcilerProcess::changed(const Resource& resource)
{
  enqueue(resource.id(), UPDATE);
}


void ReconcilerProcess::wakeup(const ResourceID& resourceId)
{
  VLOG(1) << "Waking up resource " << resourceId;

  enqueue(resourceId, UPDATE);
}


void ReconcilerProcess::enqueue(const ResourceID& resourceId, Trigger trigger)
{
  if (trigger == AUTOSCALE) {
    autoscaling.insert(resourceId);
  }

  if (leases.contains(resourceId)) {
    leases.at(resourceId).dirty = true;
    return;
  }

  if (!queued.contains(resourceId)) {
    queue.push_back(resourceId);
    queued.insert(resourceId);
  }

  schedule();
}


void ReconcilerProcess::schedule()
{
  while (!queue.empty() && !idle.empty()) {
    const ResourceID resourceId = queue.front();
    queue.pop_front();
    queued.erase(resourceId);

    const size_t worker = idle.front();
    idle.pop_front();

    Trigger trigger = UPDATE;
    if (autoscaling.contains(resourceId)) {
      autoscaling.erase(resourceId);
      trigger = AUTOSCALE;
    }

    ++metrics.reconciliations;

    Lease lease;
    lease.id = nextLeaseId++;
    lease.worker = worker;
    lease.dirty = false;
    lease.future = workers[worker]->reconcile(resourceId, trigger);
    lease.timer = delay(
        flags.lease_timeout,
        self(),
        &Self::expire,
        resourceId,
        lease.id);

    leases.put(resourceId, lease);

    lease.future
      .onAny(defer(self(), &Self::release, resourceId, lease.id, lambda::_1));
  }

  metrics.pending = static_cast<double>(queue.size());
}


void ReconcilerProcess::release(
    const ResourceID& resourceId,
    uint64_t leaseId,
    const Future<Option<Duration>>& future)
{
  Option<Lease> lease = leases.get(resourceId);

  // Ignore passes whose lease expired.
  if (lease.isNone() || lease->id != leaseId) {
    return;
  }

  leases.erase(resourceId);

  Clock::cancel(lease->timer);
  idle.push_back(lease->worker);

  if (future.isReady()) {
    if (future.get().isSome()) {
      requeue(resourceId, future.get().get());
    }
  } else {
    LOG(ERROR) << "Failed to reconcile resource " << resourceId << ": "
               << (future.isFailed() ? future.failure() : "discarded");

    requeue(resourceId, flags.poll_interval);
  }

  if (lease->dirty) {
    enqueue(resourceId, UPDATE);
  }

  schedule();
}


void ReconcilerProcess::expire(const ResourceID& resourceId, uint64_t leaseId)
{
  Option<Lease> lease = leases.get(resourceId);
  if (lease.isNone() || lease->id != leaseId) {
    return;
  }

  LOG(WARNING) << "Lease of resource " << resourceId << " expired after "
               << flags.lease_timeout;

  ++metrics.lease_expirations;

  leases.erase(resourceId);

  Future<Option<Duration>> future = lease->future;
  future.discard();

  idle.push_back(lease->worker);

  enqueue(resourceId, UPDATE);
}


void ReconcilerProcess::requeue(
    const ResourceID& resourceId,
    const Duration& delay)
{
  if (timers.contains(resourceId)) {
    Clock::cancel(timers.at(resourceId));
  }

  VLOG(1) << "Reconciling resource " << resourceId << " again in " << delay;

  timers.put(
      resourceId,
      process::delay(delay, self(), &Self::requeued, resourceId));
}


void ReconcilerProcess::requeued(const ResourceID& resourceId)
{
  timers.erase(resourceId);
  enqueue(resourceId, UPDATE);
}


void ReconcilerProcess::resync()
{
  store->list()
    .onAny(defer(self(), &Self::_resync, lambda::_1));
}


void ReconcilerProcess::_resync(const Future<vector<Resource>>& list)
{
  if (!list.isReady()) {
    LOG(ERROR) << "Failed to list resources for resync: "
               << (list.isFailed() ? list.failure() : "discarded");
  } else {
    foreach (const Resource& resource, list.get()) {
      const ResourceStatus& status = resource.status();

      if (!protobuf::isTerminalPhase(status.phase()) ||
          resource.generation() > status.observed_generation() ||
          status.instances_size() > 0) {
        enqueue(resource.id(), UPDATE);
      }
    }
  }

  delay(flags.resync_interval, self(), &Self::resync);
}


void ReconcilerProcess::autoscale()
{
  store->list()
    .onAny(defer(self(), &Self::_autoscale, lambda::_1));
}


void ReconcilerProcess::_autoscale(const Future<vector<Resource>>& list)
{
  if (!list.isReady()) {
    LOG(ERROR) << "Failed to list resources for autoscaling: "
               << (list.isFailed() ? list.failure() : "discarded");
  } else {
    foreach (const Resource& resource, list.get()) {
      if (resource.status().phase() == ResourceStatus::RUNNING &&
          resources::isElastic(resource.info()) &&
          resources::getScalePolicy(resource.info()).isSome()) {
        enqueue(resource.id(), AUTOSCALE);
      }
    }
  }

  delay(flags.autoscale_interval, self(), &Self::autoscale);
}


Reconciler::Reconciler(
    const engine::Flags& flags,
    ResourceStore* store,
    QueueAdmissionController* queues,
    Scheduler* scheduler,
    Autoscaler* autoscaler,
    stratus::placement::Backend* backend,
    MetricFeed* feed,
    const accelerators::Catalog& catalog)
{
  process = new ReconcilerProcess(
      flags,
      store,
      queues,
      scheduler,
      autoscaler,
      backend,
      feed,
      catalog);

  spawn(process);
}


Reconciler::~Reconciler()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<Nothing> Reconciler::start()
{
  return dispatch(process, &ReconcilerProcess::start);
}


Future<Nothing> Reconciler::reconcile(const ResourceID& resourceId)
{
  return dispatch(process, &ReconcilerProcess::reconcile, resourceId);
}


PID<ReconcilerProcess> Reconciler::pid() const
{
  return process->self();
}

} // namespace reconciler {
} // namespace internal {
} // namespace stratus {
