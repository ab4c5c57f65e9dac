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

#ifndef __RECONCILER_WORKER_HPP__
#define __RECONCILER_WORKER_HPP__

#include <stratus/stratus.hpp>

#include <stratus/feed/metric_feed.hpp>

#include <stratus/placement/backend.hpp>

#include <process/future.hpp>

#include <stout/duration.hpp>
#include <stout/lambda.hpp>
#include <stout/option.hpp>

#include "admission/queue_controller.hpp"

#include "autoscaler/autoscaler.hpp"

#include "common/accelerators.hpp"

#include "engine/flags.hpp"

#include "reconciler/metrics.hpp"

#include "scheduler/scheduler.hpp"

#include "store/resource_store.hpp"

namespace stratus {
namespace internal {
namespace reconciler {

// Forward declaration.
class WorkerProcess;


// What caused a resource to be reconciled.
enum Trigger
{
  // A write to the resource, a timer or a resync sweep.
  UPDATE,

  // The autoscaler tick: a running elastic resource also samples its
  // metric and applies the resulting scale decision.
  AUTOSCALE
};


// Drives a single resource one step through its lifecycle. Every
// step reads the latest record, takes at most one transition and
// writes the outcome back with a version check; a conflicting write
// is re-applied to the re-read record, so whatever the step did to
// the backend (e.g., provisioned instances) is never lost.
//
// The caller must make sure a resource is never reconciled by two
// workers at once.
class Worker
{
public:
  // All collaborators must outlive the worker. `wakeup` is invoked
  // with every resource admitted to a queue because this worker
  // released it.
  Worker(
      const engine::Flags& flags,
      store::ResourceStore* store,
      admission::QueueAdmissionController* queues,
      scheduler::Scheduler* scheduler,
      autoscaler::Autoscaler* autoscaler,
      stratus::placement::Backend* backend,
      stratus::feed::MetricFeed* feed,
      const accelerators::Catalog& catalog,
      Metrics* metrics,
      const lambda::function<void(const ResourceID&)>& wakeup);

  virtual ~Worker();

  // Returns the time after which the resource should be reconciled
  // again even if nothing changes, if any.
  process::Future<Option<Duration>> reconcile(
      const ResourceID& resourceId,
      Trigger trigger);

private:
  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  WorkerProcess* process;
};

} // namespace reconciler {
} // namespace internal {
} // namespace stratus {

#endif // __RECONCILER_WORKER_HPP__
