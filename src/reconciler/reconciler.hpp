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

#ifndef __RECONCILER_RECONCILER_HPP__
#define __RECONCILER_RECONCILER_HPP__

#include <stratus/stratus.hpp>

#include <stratus/feed/metric_feed.hpp>

#include <stratus/placement/backend.hpp>

#include <process/future.hpp>
#include <process/pid.hpp>

#include <stout/nothing.hpp>

#include "admission/queue_controller.hpp"

#include "autoscaler/autoscaler.hpp"

#include "common/accelerators.hpp"

#include "engine/flags.hpp"

#include "scheduler/scheduler.hpp"

#include "store/resource_store.hpp"

namespace stratus {
namespace internal {
namespace reconciler {

// Forward declaration.
class ReconcilerProcess;


// Converges every resource in the store towards its desired spec.
//
// Resources are reconciled whenever their record is written, when the
// delay a previous pass asked for elapses, and on every resync sweep.
// A pool of workers processes them, and a resource is leased to at
// most one worker at a time; changes arriving while it is leased are
// folded into a single follow-up pass. A lease that is not returned
// within the lease timeout expires and the resource is handed out
// again.
class Reconciler
{
public:
  // All collaborators must outlive the reconciler.
  Reconciler(
      const engine::Flags& flags,
      store::ResourceStore* store,
      admission::QueueAdmissionController* queues,
      scheduler::Scheduler* scheduler,
      autoscaler::Autoscaler* autoscaler,
      stratus::placement::Backend* backend,
      stratus::feed::MetricFeed* feed,
      const accelerators::Catalog& catalog);

  virtual ~Reconciler();

  // Restores the queue memberships of recovered resources, then starts
  // watching the store and arms the resync and autoscale sweeps.
  process::Future<Nothing> start();

  // Schedules a reconciliation pass of the resource.
  process::Future<Nothing> reconcile(const ResourceID& resourceId);

  process::PID<ReconcilerProcess> pid() const;

private:
  Reconciler(const Reconciler&) = delete;
  Reconciler& operator=(const Reconciler&) = delete;

  ReconcilerProcess* process;
};

} // namespace reconciler {
} // namespace internal {
} // namespace stratus {

#endif // __RECONCILER_RECONCILER_HPP__
