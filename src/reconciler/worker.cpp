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
#include <string>
#include <vector>

#include <google/protobuf/repeated_field.h>

#include <process/collect.hpp>
#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/future.hpp>
#include <process/id.hpp>
#include <process/loop.hpp>
#include <process/process.hpp>

#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/hashset.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/unreachable.hpp>

#include "common/protobuf_utils.hpp"
#include "common/resource_utils.hpp"
#include "common/validation.hpp"

#include "logging/logging.hpp"

#include "reconciler/worker.hpp"

using namespace process;

using std::string;
using std::vector;

using stratus::feed::MetricFeed;
using stratus::feed::MetricSample;

using stratus::internal::admission::Admission;
using stratus::internal::admission::QueueAdmissionController;

using stratus::internal::autoscaler::Autoscaler;
using stratus::internal::autoscaler::ScaleDecision;

using stratus::internal::scheduler::Placement;
using stratus::internal::scheduler::PlacementError;
using stratus::internal::scheduler::Scheduler;

using stratus::internal::store::ResourceStore;

namespace stratus {
namespace internal {
namespace reconciler {

namespace {

// Returns the resource as declared by the generation it is currently
// realizing, which lags behind the latest spec while a spec change
// has not been picked up yet.
Resource observed(const Resource& resource)
{
  Resource result = resource;
  if (resource.status().has_observed_spec()) {
    result.mutable_info()->CopyFrom(resource.status().observed_spec());
  }
  return result;
}


bool isActive(const Instance& instance)
{
  return instance.phase() == Instance::PROVISIONING ||
    instance.phase() == Instance::RUNNING;
}


Instance drainInstance(const Instance& instance, const Time& now)
{
  Instance draining = instance;
  draining.set_phase(Instance::DRAINING);
  draining.mutable_drain_started_at()->CopyFrom(
      protobuf::createTimeInfo(now));
  return draining;
}


string describe(const vector<InstanceID>& instances)
{
  vector<string> values;
  foreach (const InstanceID& instanceId, instances) {
    values.push_back(instanceId.value());
  }
  return strings::join(", ", values);
}

} // namespace {


class WorkerProcess : public Process<WorkerProcess>
{
public:
  WorkerProcess(
      const engine::Flags& _flags,
      ResourceStore* _store,
      QueueAdmissionController* _queues,
      Scheduler* _scheduler,
      Autoscaler* _autoscaler,
      stratus::placement::Backend* _backend,
      MetricFeed* _feed,
      const accelerators::Catalog& _catalog,
      Metrics* _metrics,
      const lambda::function<void(const ResourceID&)>& _wakeup)
    : ProcessBase(process::ID::generate("reconcile-worker")),
      flags(_flags),
      store(_store),
      queues(_queues),
      scheduler(_scheduler),
      autoscaler(_autoscaler),
      backend(_backend),
      feed(_feed),
      catalog(_catalog),
      metrics(_metrics),
      wakeup(_wakeup) {}

  virtual ~WorkerProcess() {}

  Future<Option<Duration>> reconcile(
      const ResourceID& resourceId,
      Trigger trigger);

private:
  // Edits to the instances of a resource. Unlike the rest of a status
  // update they are applied to the latest record whatever phase it is
  // in, so that no instance is ever lost track of.
  struct InstanceChanges
  {
    vector<Instance> added;

    // Replace the instance with the same ID, if it still exists.
    vector<Instance> updated;

    hashset<InstanceID> removed;

    void apply(ResourceStatus* status) const;
  };

  typedef lambda::function<void(const Resource&, ResourceStatus*)> Update;

  Future<Option<Duration>> _reconcile(
      const ResourceID& resourceId,
      Trigger trigger,
      const Option<Resource>& resource);

  Future<Option<Duration>> pending(const Resource& resource);

  Future<Option<Duration>> queued(const Resource& resource);

  Future<Option<Duration>> scheduling(const Resource& resource);

  Future<Option<Duration>> _scheduling(
      const Resource& resource,
      const Try<Placement, PlacementError>& placement);

  Future<Option<Duration>> provisioning(const Resource& resource);

  Future<Option<Duration>> _provisioning(
      const Resource& resource,
      const hashmap<InstanceID, HealthStatus>& health);

  Future<Option<Duration>> running(const Resource& resource, Trigger trigger);

  Future<Option<Duration>> _running(
      const Resource& resource,
      Trigger trigger,
      const Option<Duration>& deadline,
      const hashmap<InstanceID, HealthStatus>& health);

  Future<Option<Duration>> converge(
      const Resource& resource,
      const Option<Duration>& deadline,
      const InstanceChanges& changes,
      const Option<ScaleDecision>& decision);

  Future<Option<Duration>> scale(
      const Option<Duration>& deadline,
      const Option<Resource>& resource);

  Future<Option<Duration>> draining(const Resource& resource);

  Future<Option<Duration>> terminating(const Resource& resource);

  Future<Option<Duration>> terminal(const Resource& resource);

  // Moves the resource to `FAILED` after terminating its instances
  // and leaving its queue.
  Future<Option<Duration>> fail(
      const Resource& resource,
      const string& message,
      const InstanceChanges& changes = InstanceChanges());

  // Accounts for a transient failure: the resource goes back to
  // `SCHEDULING` after an exponential backoff, or fails once the
  // retries are exhausted.
  Future<Option<Duration>> retry(
      const Resource& resource,
      const string& message,
      const InstanceChanges& changes = InstanceChanges());

  // Writes a status derived from the latest record: `changes` are
  // always applied, `update` only if the phase is still `expected`.
  // Conflicting writes are retried against the re-read record.
  // Returns the record as written, or none if the resource is gone.
  Future<Option<Resource>> commit(
      const ResourceID& resourceId,
      const ResourceStatus::Phase& expected,
      const Update& update,
      const InstanceChanges& changes = InstanceChanges());

  Future<Nothing> withdraw(const Resource& resource);

  Future<hashmap<InstanceID, HealthStatus>> checkHealth(
      const vector<InstanceID>& instances);

  // Returns the instances that were terminated.
  Future<hashset<InstanceID>> terminateInstances(
      const vector<InstanceID>& instances);

  // Terminates the draining instances that are idle or exceeded the
  // drain timeout. Returns the instances that were terminated.
  Future<hashset<InstanceID>> drain(const Resource& resource);

  bool provisionExpired(const Instance& instance, const Time& now) const
  {
    return instance.has_created_at() &&
      now - protobuf::getTime(instance.created_at()) >=
        flags.provision_timeout;
  }

  const engine::Flags flags;
  ResourceStore* store;
  QueueAdmissionController* queues;
  Scheduler* scheduler;
  Autoscaler* autoscaler;
  stratus::placement::Backend* backend;
  MetricFeed* feed;
  const accelerators::Catalog catalog;
  Metrics* metrics;
  const lambda::function<void(const ResourceID&)> wakeup;
};


void WorkerProcess::InstanceChanges::apply(ResourceStatus* status) const
{
  google::protobuf::RepeatedPtrField<Instance> instances;

  foreach (const Instance& instance, status->instances()) {
    if (removed.contains(instance.instance_id())) {
      continue;
    }

    Instance* kept = instances.Add();
    kept->CopyFrom(instance);

    foreach (const Instance& update, updated) {
      if (update.instance_id() == instance.instance_id()) {
        kept->CopyFrom(update);
      }
    }
  }

  foreach (const Instance& instance, added) {
    if (removed.contains(instance.instance_id())) {
      continue;
    }

    bool exists = false;
    foreach (const Instance& existing, instances) {
      if (existing.instance_id() == instance.instance_id()) {
        exists = true;
        break;
      }
    }

    if (!exists) {
      instances.Add()->CopyFrom(instance);
    }
  }

  status->mutable_instances()->Swap(&instances);
}


Future<Option<Duration>> WorkerProcess::reconcile(
    const ResourceID& resourceId,
    Trigger trigger)
{
  return store->get(resourceId)
    .then(defer(self(), &Self::_reconcile, resourceId, trigger, lambda::_1));
}


Future<Option<Duration>> WorkerProcess::_reconcile(
    const ResourceID& resourceId,
    Trigger trigger,
    const Option<Resource>& resource)
{
  if (resource.isNone()) {
    VLOG(1) << "Skipping reconciliation of unknown resource " << resourceId;
    return None();
  }

  VLOG(1) << "Reconciling resource " << resourceId << " in phase "
          << resource->status().phase();

  switch (resource->status().phase()) {
    case ResourceStatus::PENDING:
      return pending(resource.get());
    case ResourceStatus::QUEUED:
      return queued(resource.get());
    case ResourceStatus::SCHEDULING:
      return scheduling(resource.get());
    case ResourceStatus::PROVISIONING:
      return provisioning(resource.get());
    case ResourceStatus::RUNNING:
      return running(resource.get(), trigger);
    case ResourceStatus::DRAINING:
      return draining(resource.get());
    case ResourceStatus::TERMINATING:
      return terminating(resource.get());
    case ResourceStatus::TERMINATED:
    case ResourceStatus::FAILED:
      return terminal(resource.get());
    case ResourceStatus::UNKNOWN:
      break;
  }

  return Failure(
      "Resource " + stringify(resourceId) + " is in unknown phase " +
      stringify(resource->status().phase()));
}


Future<Option<Duration>> WorkerProcess::pending(const Resource& resource)
{
  const ResourceInfo& info = resource.info();

  Option<Error> error = validation::validateResourceInfo(info, catalog);
  if (error.isSome()) {
    return fail(resource, "Invalid resource: " + error->message);
  }

  // Leave the queue of the previous generation if it changed.
  Future<Nothing> withdrawn = Nothing();
  if (resource.status().has_queue() &&
      (!info.has_queue() || info.queue() != resource.status().queue())) {
    withdrawn = withdraw(resource);
  }

  const uint64_t generation = resource.generation();

  return withdrawn
    .then(defer(self(), [=]() {
      return commit(
          resource.id(),
          ResourceStatus::PENDING,
          [=](const Resource&, ResourceStatus* status) {
            status->set_observed_generation(generation);
            status->mutable_observed_spec()->CopyFrom(info);
            status->set_retry_count(0);
            status->clear_retry_after();
            status->clear_running_since();

            if (resources::isElastic(info)) {
              status->set_target_instances(
                  resources::getRequiredInstances(info, *status));
            } else {
              status->clear_target_instances();
            }

            if (info.has_queue()) {
              // A resource that keeps its queue keeps its place in it.
              if (status->queue() != info.queue()) {
                status->set_queue(info.queue());
                status->mutable_queued_at()->CopyFrom(
                    protobuf::getCurrentTime());
              }

              status->set_phase(ResourceStatus::QUEUED);
              status->set_message(
                  "Waiting for admission to queue '" + info.queue() + "'");
            } else {
              status->clear_queue();
              status->clear_queued_at();
              status->set_phase(ResourceStatus::SCHEDULING);
              status->set_message("Scheduling");
            }
          });
    }))
    .then([]() -> Option<Duration> { return None(); });
}


Future<Option<Duration>> WorkerProcess::queued(const Resource& resource)
{
  // Re-evaluate a spec that changed while waiting, it may name a
  // different queue.
  if (resource.generation() > resource.status().observed_generation() ||
      !resource.status().has_queue()) {
    return commit(
        resource.id(),
        ResourceStatus::QUEUED,
        [](const Resource&, ResourceStatus* status) {
          status->set_phase(ResourceStatus::PENDING);
        })
      .then([]() -> Option<Duration> { return None(); });
  }

  const ResourceID resourceId = resource.id();
  const string queue = resource.status().queue();

  return queues->enqueue(queue, resourceId)
    .then(defer(self(), [=](const Admission& admission) {
      if (admission.status == Admission::ADMITTED) {
        LOG(INFO) << "Resource " << resourceId << " was admitted to queue '"
                  << queue << "'";

        return commit(
            resourceId,
            ResourceStatus::QUEUED,
            [=](const Resource&, ResourceStatus* status) {
              status->set_phase(ResourceStatus::SCHEDULING);
              status->set_message("Admitted to queue '" + queue + "'");
            });
      }

      return commit(
          resourceId,
          ResourceStatus::QUEUED,
          [=](const Resource&, ResourceStatus* status) {
            status->set_message(
                "Waiting in queue '" + queue + "' (position " +
                stringify(admission.position) + ")");
          });
    }))
    .then([]() -> Option<Duration> { return None(); });
}


Future<Option<Duration>> WorkerProcess::scheduling(const Resource& resource)
{
  const Time now = Clock::now();

  if (resource.status().has_retry_after()) {
    const Time retryAfter = protobuf::getTime(resource.status().retry_after());
    if (now < retryAfter) {
      return Option<Duration>(retryAfter - now);
    }
  }

  const Resource spec = observed(resource);

  const uint32_t required =
    resources::getRequiredInstances(spec.info(), resource.status());

  const uint32_t active = resources::countActiveInstances(resource.status());

  if (active >= required) {
    return commit(
        resource.id(),
        ResourceStatus::SCHEDULING,
        [=](const Resource&, ResourceStatus* status) {
          status->set_phase(ResourceStatus::PROVISIONING);
          status->clear_retry_after();
          status->set_message(
              "Waiting for " + stringify(active) +
              " instance(s) to become healthy");
        })
      .then([]() -> Option<Duration> { return None(); });
  }

  // Instances provisioned after the lease expired must still be
  // adopted by the resource, otherwise nothing would terminate them.
  return undiscardable(scheduler->place(spec)
    .then(defer(self(), &Self::_scheduling, resource, lambda::_1)));
}


Future<Option<Duration>> WorkerProcess::_scheduling(
    const Resource& resource,
    const Try<Placement, PlacementError>& placement)
{
  if (placement.isSome()) {
    InstanceChanges changes;
    changes.added = placement->instances;

    const string message =
      "Placed " + stringify(placement->instances.size()) +
      " instance(s) on platform '" + placement->platform + "'";

    return commit(
        resource.id(),
        ResourceStatus::SCHEDULING,
        [=](const Resource&, ResourceStatus* status) {
          status->clear_retry_after();
          status->set_message(message);
        },
        changes)
      .then([]() -> Option<Duration> { return None(); });
  }

  const PlacementError& error = placement.error();
  const string message = error.message;

  switch (error.type) {
    case PlacementError::NO_CAPACITY: {
      VLOG(1) << "Resource " << resource.id() << " is waiting for capacity: "
              << message;

      const Duration interval = flags.poll_interval;

      return commit(
          resource.id(),
          ResourceStatus::SCHEDULING,
          [=](const Resource&, ResourceStatus* status) {
            status->set_message(message);
          })
        .then([interval]() -> Option<Duration> { return interval; });
    }
    case PlacementError::INVALID:
      return fail(resource, message);
    case PlacementError::TRANSIENT:
      return retry(resource, message);
  }

  UNREACHABLE();
}


Future<Option<Duration>> WorkerProcess::provisioning(const Resource& resource)
{
  vector<InstanceID> instances;
  foreach (const Instance& instance, resource.status().instances()) {
    if (instance.phase() == Instance::PROVISIONING) {
      instances.push_back(instance.instance_id());
    }
  }

  return checkHealth(instances)
    .then(defer(self(), &Self::_provisioning, resource, lambda::_1));
}


Future<Option<Duration>> WorkerProcess::_provisioning(
    const Resource& resource,
    const hashmap<InstanceID, HealthStatus>& health)
{
  const Time now = Clock::now();

  InstanceChanges changes;
  vector<InstanceID> failed;
  Option<string> reason;
  bool waiting = false;

  foreach (const Instance& instance, resource.status().instances()) {
    if (instance.phase() != Instance::PROVISIONING) {
      continue;
    }

    const InstanceID& instanceId = instance.instance_id();
    const HealthStatus status =
      health.get(instanceId).getOrElse(HEALTH_UNKNOWN);

    if (status == HEALTHY) {
      Instance running = instance;
      running.set_phase(Instance::RUNNING);
      changes.updated.push_back(running);
    } else if (status == UNHEALTHY) {
      failed.push_back(instanceId);
      reason = "Instance " + stringify(instanceId) + " is unhealthy";
    } else if (provisionExpired(instance, now)) {
      failed.push_back(instanceId);
      reason =
        "Instance " + stringify(instanceId) + " did not become healthy"
        " within " + stringify(flags.provision_timeout);
    } else {
      waiting = true;
    }
  }

  if (!failed.empty()) {
    // The nodes of a cluster are only useful together.
    if (resource.info().kind() == ResourceInfo::CLUSTER) {
      failed.clear();
      foreach (const Instance& instance, resource.status().instances()) {
        failed.push_back(instance.instance_id());
      }
    }

    const string message = reason.get();

    return terminateInstances(failed)
      .then(defer(self(), [=](const hashset<InstanceID>& terminated) {
        InstanceChanges changes_ = changes;
        changes_.removed = terminated;
        return retry(resource, message, changes_);
      }));
  }

  if (waiting) {
    const Duration interval = flags.poll_interval;

    return commit(
        resource.id(),
        ResourceStatus::PROVISIONING,
        [](const Resource&, ResourceStatus*) {},
        changes)
      .then([interval]() -> Option<Duration> { return interval; });
  }

  return commit(
      resource.id(),
      ResourceStatus::PROVISIONING,
      [=](const Resource& current, ResourceStatus* status) {
        const ResourceInfo& spec = status->has_observed_spec()
          ? status->observed_spec()
          : current.info();

        const uint32_t required =
          resources::getRequiredInstances(spec, *status);

        uint32_t running = 0;
        foreach (const Instance& instance, status->instances()) {
          if (instance.phase() == Instance::RUNNING) {
            running++;
          }
        }

        if (running >= required) {
          status->set_phase(ResourceStatus::RUNNING);
          status->mutable_running_since()->CopyFrom(
              protobuf::createTimeInfo(now));
          status->set_retry_count(0);
          status->clear_retry_after();
          status->set_message(
              "Running " + stringify(running) + " instance(s)");
        } else {
          status->set_phase(ResourceStatus::SCHEDULING);
          status->set_message(
              "Scheduling " + stringify(required - running) +
              " more instance(s)");
        }
      },
      changes)
    .then([]() -> Option<Duration> { return None(); });
}


Future<Option<Duration>> WorkerProcess::running(
    const Resource& resource,
    Trigger trigger)
{
  const ResourceInfo& info = resource.info();
  const Time now = Clock::now();

  if (resource.generation() > resource.status().observed_generation()) {
    const uint64_t generation = resource.generation();

    // Bounds and scale policy apply to the running instances as is.
    if (resource.status().has_observed_spec() &&
        resources::isScalingChange(resource.status().observed_spec(), info)) {
      LOG(INFO) << "Applying generation " << generation << " of resource "
                << resource.id() << " in place";

      return commit(
          resource.id(),
          ResourceStatus::RUNNING,
          [=](const Resource&, ResourceStatus* status) {
            status->set_observed_generation(generation);
            status->mutable_observed_spec()->CopyFrom(info);
            status->set_target_instances(
                resources::getRequiredInstances(info, *status));
            status->set_message(
                "Applied scaling change of generation " +
                stringify(generation));
          })
        .then([]() -> Option<Duration> { return None(); });
    }

    LOG(INFO) << "Replacing the instances of resource " << resource.id()
              << " to apply generation " << generation;

    return autoscaler->remove(resource.id())
      .then(defer(self(), [=]() {
        return commit(
            resource.id(),
            ResourceStatus::RUNNING,
            [=](const Resource&, ResourceStatus* status) {
              foreach (Instance& instance, *status->mutable_instances()) {
                if (isActive(instance)) {
                  instance.CopyFrom(drainInstance(instance, now));
                }
              }

              status->set_phase(ResourceStatus::DRAINING);
              status->set_message(
                  "Replacing instances to apply generation " +
                  stringify(generation));
            });
      }))
      .then([]() -> Option<Duration> { return None(); });
  }

  Option<Duration> deadline;

  const ContainerTemplate& container = resources::getContainer(info);
  if (container.has_timeout() && resource.status().has_running_since()) {
    const Duration timeout = protobuf::getDuration(container.timeout());
    const Time expiry =
      protobuf::getTime(resource.status().running_since()) + timeout;

    if (now >= expiry) {
      LOG(INFO) << "Resource " << resource.id() << " exceeded its timeout of "
                << timeout;

      return commit(
          resource.id(),
          ResourceStatus::RUNNING,
          [=](const Resource&, ResourceStatus* status) {
            status->set_phase(ResourceStatus::TERMINATING);
            status->set_message(
                "Exceeded timeout of " + stringify(timeout));
          })
        .then([]() -> Option<Duration> { return None(); });
    }

    deadline = expiry - now;
  }

  vector<InstanceID> instances;
  foreach (const Instance& instance, resource.status().instances()) {
    if (isActive(instance)) {
      instances.push_back(instance.instance_id());
    }
  }

  return checkHealth(instances)
    .then(defer(self(),
                &Self::_running,
                resource,
                trigger,
                deadline,
                lambda::_1));
}


Future<Option<Duration>> WorkerProcess::_running(
    const Resource& resource,
    Trigger trigger,
    const Option<Duration>& deadline,
    const hashmap<InstanceID, HealthStatus>& health)
{
  const Time now = Clock::now();
  const ResourceInfo& info = resource.info();
  const ResourceID resourceId = resource.id();

  InstanceChanges changes;
  vector<InstanceID> unhealthy;

  foreach (const Instance& instance, resource.status().instances()) {
    if (!isActive(instance)) {
      continue;
    }

    const InstanceID& instanceId = instance.instance_id();
    const HealthStatus status =
      health.get(instanceId).getOrElse(HEALTH_UNKNOWN);

    if (instance.phase() == Instance::PROVISIONING) {
      if (status == HEALTHY) {
        Instance running = instance;
        running.set_phase(Instance::RUNNING);
        changes.updated.push_back(running);
      } else if (status == UNHEALTHY || provisionExpired(instance, now)) {
        unhealthy.push_back(instanceId);
      }
    } else if (status == UNHEALTHY) {
      unhealthy.push_back(instanceId);
    }
  }

  if (!unhealthy.empty()) {
    const string message = "Unhealthy instance(s) " + describe(unhealthy);

    LOG(WARNING) << "Resource " << resourceId << " has "
                 << unhealthy.size() << " unhealthy instance(s)";

    // Elastic resources replace single instances, the replacement is
    // placed like any other scale up.
    if (resources::isElastic(info)) {
      return terminateInstances(unhealthy)
        .then(defer(self(), [=](const hashset<InstanceID>& terminated) {
          InstanceChanges changes_ = changes;
          changes_.removed = terminated;

          return commit(
              resourceId,
              ResourceStatus::RUNNING,
              [=](const Resource&, ResourceStatus* status) {
                status->set_message("Replacing " + message);
              },
              changes_);
        }))
        .then([]() -> Option<Duration> { return None(); });
    }

    if (resources::getContainer(info).restart() ==
          ContainerTemplate::ALWAYS) {
      vector<InstanceID> instances;
      foreach (const Instance& instance, resource.status().instances()) {
        instances.push_back(instance.instance_id());
      }

      return terminateInstances(instances)
        .then(defer(self(), [=](const hashset<InstanceID>& terminated) {
          InstanceChanges changes_;
          changes_.removed = terminated;

          return commit(
              resourceId,
              ResourceStatus::RUNNING,
              [=](const Resource&, ResourceStatus* status) {
                status->set_phase(ResourceStatus::SCHEDULING);
                status->clear_running_since();
                status->set_message(message + "; restarting");
              },
              changes_);
        }))
        .then([]() -> Option<Duration> { return None(); });
    }

    return fail(resource, message);
  }

  Future<Option<ScaleDecision>> decision = None();

  Option<ScalePolicy> policy = resources::getScalePolicy(info);
  if (trigger == AUTOSCALE &&
      resources::isElastic(info) &&
      policy.isSome()) {
    const uint32_t current =
      resources::getRequiredInstances(info, resource.status());

    decision = feed->sample(resourceId)
      .then(defer(self(), [=](const MetricSample& sample) {
        return autoscaler->evaluate(resourceId, info, current, sample);
      }))
      .recover([resourceId](const Future<Option<ScaleDecision>>& future)
          -> Future<Option<ScaleDecision>> {
        VLOG(1) << "Skipping autoscaling of resource " << resourceId << ": "
                << (future.isFailed() ? future.failure() : "discarded");
        return None();
      });
  }

  return decision
    .then(defer(self(),
                &Self::converge,
                resource,
                deadline,
                changes,
                lambda::_1));
}


Future<Option<Duration>> WorkerProcess::converge(
    const Resource& resource,
    const Option<Duration>& deadline,
    const InstanceChanges& changes,
    const Option<ScaleDecision>& decision)
{
  const Time now = Clock::now();

  const uint32_t target = decision.isSome()
    ? decision->target
    : resources::getRequiredInstances(resource.info(), resource.status());

  ResourceStatus projected = resource.status();
  changes.apply(&projected);

  vector<Instance> active;
  foreach (const Instance& instance, projected.instances()) {
    if (isActive(instance)) {
      active.push_back(instance);
    }
  }

  InstanceChanges changes_ = changes;
  Option<string> message;

  if (decision.isSome()) {
    message = decision->reason;
  }

  if (active.size() > target) {
    // Drop instances that are not serving yet first, then the newest.
    std::stable_sort(
        active.begin(),
        active.end(),
        [](const Instance& left, const Instance& right) {
          if (left.phase() != right.phase()) {
            return left.phase() == Instance::PROVISIONING;
          }
          return left.created_at().nanoseconds() >
            right.created_at().nanoseconds();
        });

    const size_t excess = active.size() - target;

    for (size_t i = 0; i < excess; i++) {
      const Instance draining = drainInstance(active[i], now);

      bool replaced = false;
      foreach (Instance& update, changes_.updated) {
        if (update.instance_id() == draining.instance_id()) {
          update.CopyFrom(draining);
          replaced = true;
        }
      }

      if (!replaced) {
        changes_.updated.push_back(draining);
      }
    }

    LOG(INFO) << "Draining " << excess << " instance(s) of resource "
              << resource.id() << " to scale to " << target;

    if (message.isNone()) {
      message = "Draining " + stringify(excess) + " instance(s) to scale to " +
        stringify(target);
    }
  }

  const ResourceID resourceId = resource.id();

  return drain(resource)
    .then(defer(self(), [=](const hashset<InstanceID>& drained) {
      InstanceChanges changes__ = changes_;
      foreach (const InstanceID& instanceId, drained) {
        changes__.removed.insert(instanceId);
      }

      return commit(
          resourceId,
          ResourceStatus::RUNNING,
          [=](const Resource&, ResourceStatus* status) {
            if (decision.isSome()) {
              status->set_target_instances(decision->target);
            }

            if (message.isSome()) {
              status->set_message(message.get());
            }
          },
          changes__);
    }))
    .then(defer(self(), &Self::scale, deadline, lambda::_1));
}


Future<Option<Duration>> WorkerProcess::scale(
    const Option<Duration>& deadline,
    const Option<Resource>& resource)
{
  if (resource.isNone() ||
      resource->status().phase() != ResourceStatus::RUNNING) {
    return None();
  }

  const Resource spec = observed(resource.get());
  const ResourceID resourceId = resource->id();

  const uint32_t target =
    resources::getRequiredInstances(spec.info(), resource->status());

  const uint32_t active = resources::countActiveInstances(resource->status());

  // Provisioning and draining instances need to be looked at again.
  Option<Duration> requeue = deadline;
  foreach (const Instance& instance, resource->status().instances()) {
    if (instance.phase() == Instance::PROVISIONING ||
        instance.phase() == Instance::DRAINING) {
      requeue = requeue.isSome()
        ? std::min(requeue.get(), flags.poll_interval)
        : flags.poll_interval;
      break;
    }
  }

  if (active >= target) {
    return requeue;
  }

  if (!resources::isElastic(spec.info())) {
    return commit(
        resourceId,
        ResourceStatus::RUNNING,
        [=](const Resource&, ResourceStatus* status) {
          status->set_phase(ResourceStatus::SCHEDULING);
          status->set_message(
              "Lost " + stringify(target - active) + " instance(s)");
        })
      .then([]() -> Option<Duration> { return None(); });
  }

  const Duration interval = flags.poll_interval;

  return undiscardable(scheduler->place(spec)
    .then(defer(self(), [=](const Try<Placement, PlacementError>& placement)
        -> Future<Option<Duration>> {
      if (placement.isSome()) {
        InstanceChanges changes;
        changes.added = placement->instances;

        const string message =
          "Scaling to " + stringify(target) + " instance(s): placed " +
          stringify(placement->instances.size()) +
          " instance(s) on platform '" + placement->platform + "'";

        return commit(
            resourceId,
            ResourceStatus::RUNNING,
            [=](const Resource&, ResourceStatus* status) {
              status->set_message(message);
            },
            changes)
          .then([interval]() -> Option<Duration> { return interval; });
      }

      const string message = placement.error().message;

      LOG(WARNING) << "Failed to scale resource " << resourceId << " to "
                   << target << " instance(s): " << message;

      return commit(
          resourceId,
          ResourceStatus::RUNNING,
          [=](const Resource&, ResourceStatus* status) {
            status->set_message(message);
          })
        .then([interval]() -> Option<Duration> { return interval; });
    })));
}


Future<Option<Duration>> WorkerProcess::draining(const Resource& resource)
{
  const Time now = Clock::now();

  InstanceChanges changes;
  foreach (const Instance& instance, resource.status().instances()) {
    if (isActive(instance)) {
      changes.updated.push_back(drainInstance(instance, now));
    }
  }

  const Duration interval = flags.poll_interval;

  return drain(resource)
    .then(defer(self(), [=](const hashset<InstanceID>& drained) {
      InstanceChanges changes_ = changes;
      changes_.removed = drained;

      return commit(
          resource.id(),
          ResourceStatus::DRAINING,
          [](const Resource& current, ResourceStatus* status) {
            if (status->instances_size() == 0) {
              status->set_phase(ResourceStatus::PENDING);
              status->set_message(
                  "Re-evaluating generation " +
                  stringify(current.generation()));
            }
          },
          changes_);
    }))
    .then([interval](const Option<Resource>& resource) -> Option<Duration> {
      if (resource.isSome() && resource->status().instances_size() > 0) {
        return interval;
      }
      return None();
    });
}


Future<Option<Duration>> WorkerProcess::terminating(const Resource& resource)
{
  const Time now = Clock::now();
  const ResourceID resourceId = resource.id();

  // Instances that are not serving yet are terminated right away, the
  // others get to drain first.
  vector<InstanceID> provisioning;
  InstanceChanges changes;

  foreach (const Instance& instance, resource.status().instances()) {
    if (instance.phase() == Instance::PROVISIONING) {
      provisioning.push_back(instance.instance_id());
    } else if (instance.phase() == Instance::RUNNING) {
      changes.updated.push_back(drainInstance(instance, now));
    }
  }

  const Duration interval = flags.poll_interval;

  return withdraw(resource)
    .then(defer(self(), [=]() {
      return autoscaler->remove(resourceId);
    }))
    .then(defer(self(), [=]() {
      return terminateInstances(provisioning);
    }))
    .then(defer(self(), [=](const hashset<InstanceID>& terminated) {
      return drain(resource)
        .then(defer(self(), [=](const hashset<InstanceID>& drained) {
          InstanceChanges changes_ = changes;
          changes_.removed = terminated;
          foreach (const InstanceID& instanceId, drained) {
            changes_.removed.insert(instanceId);
          }

          return commit(
              resourceId,
              ResourceStatus::TERMINATING,
              [](const Resource&, ResourceStatus* status) {
                status->clear_queue();
                status->clear_queued_at();
                status->clear_retry_after();

                if (status->instances_size() == 0) {
                  status->set_phase(ResourceStatus::TERMINATED);
                  if (status->deletion_requested()) {
                    status->set_message("Deleted");
                  }
                }
              },
              changes_);
        }));
    }))
    .then([interval](const Option<Resource>& resource) -> Option<Duration> {
      if (resource.isSome() && resource->status().instances_size() > 0) {
        return interval;
      }
      return None();
    });
}


Future<Option<Duration>> WorkerProcess::terminal(const Resource& resource)
{
  // Instances whose termination failed earlier.
  vector<InstanceID> leftovers;
  foreach (const Instance& instance, resource.status().instances()) {
    leftovers.push_back(instance.instance_id());
  }

  if (!leftovers.empty()) {
    LOG(INFO) << "Terminating " << leftovers.size() << " leftover instance(s)"
              << " of resource " << resource.id();
  }

  const ResourceID resourceId = resource.id();
  const ResourceStatus::Phase phase = resource.status().phase();
  const Duration interval = flags.poll_interval;

  return withdraw(resource)
    .then(defer(self(), [=]() {
      return terminateInstances(leftovers);
    }))
    .then(defer(self(), [=](const hashset<InstanceID>& terminated) {
      InstanceChanges changes;
      changes.removed = terminated;

      return commit(
          resourceId,
          phase,
          [](const Resource& current, ResourceStatus* status) {
            status->clear_queue();
            status->clear_queued_at();

            // A spec update revives a finished resource unless it is
            // being deleted.
            if (current.generation() > status->observed_generation() &&
                !status->deletion_requested()) {
              status->set_phase(ResourceStatus::PENDING);
              status->set_retry_count(0);
              status->clear_retry_after();
              status->clear_running_since();
              status->set_message(
                  "Re-evaluating generation " +
                  stringify(current.generation()));
            }
          },
          changes);
    }))
    .then([interval](const Option<Resource>& resource) -> Option<Duration> {
      if (resource.isSome() &&
          protobuf::isTerminalPhase(resource->status().phase()) &&
          resource->status().instances_size() > 0) {
        return interval;
      }
      return None();
    });
}


Future<Option<Duration>> WorkerProcess::fail(
    const Resource& resource,
    const string& message,
    const InstanceChanges& changes)
{
  LOG(ERROR) << "Failing resource " << resource.id() << ": " << message;

  vector<InstanceID> instances;
  foreach (const Instance& instance, resource.status().instances()) {
    if (!changes.removed.contains(instance.instance_id())) {
      instances.push_back(instance.instance_id());
    }
  }

  const ResourceID resourceId = resource.id();
  const ResourceStatus::Phase phase = resource.status().phase();
  const uint64_t generation = resource.generation();
  const ResourceInfo info = resource.info();

  return terminateInstances(instances)
    .then(defer(self(), [=](const hashset<InstanceID>& terminated) {
      return withdraw(resource)
        .then(defer(self(), [=]() {
          return autoscaler->remove(resourceId);
        }))
        .then(defer(self(), [=]() {
          InstanceChanges changes_ = changes;
          foreach (const InstanceID& instanceId, terminated) {
            changes_.removed.insert(instanceId);
          }

          return commit(
              resourceId,
              phase,
              [=](const Resource&, ResourceStatus* status) {
                status->set_phase(ResourceStatus::FAILED);
                status->set_message(message);
                status->set_observed_generation(generation);
                status->mutable_observed_spec()->CopyFrom(info);
                status->clear_retry_after();
                status->clear_queue();
                status->clear_queued_at();
              },
              changes_);
        }));
    }))
    .then([]() -> Option<Duration> { return None(); });
}


Future<Option<Duration>> WorkerProcess::retry(
    const Resource& resource,
    const string& message,
    const InstanceChanges& changes)
{
  const uint32_t retries = resource.status().retry_count() + 1;

  if (retries > flags.max_retries) {
    LOG(ERROR) << "Giving up on resource " << resource.id() << " after "
               << retries << " consecutive failures";
    return fail(resource, message, changes);
  }

  Duration backoff = flags.retry_backoff_factor;
  for (uint32_t i = 1; i < retries && backoff < flags.max_retry_backoff; i++) {
    backoff = backoff * 2;
  }
  backoff = std::min(backoff, flags.max_retry_backoff);

  LOG(WARNING) << "Attempt " << retries << " for resource " << resource.id()
               << " failed: " << message << "; retrying in " << backoff;

  const Time retryAfter = Clock::now() + backoff;
  const uint32_t attempts = flags.max_retries + 1;

  return commit(
      resource.id(),
      resource.status().phase(),
      [=](const Resource&, ResourceStatus* status) {
        status->set_phase(ResourceStatus::SCHEDULING);
        status->set_retry_count(retries);
        status->mutable_retry_after()->CopyFrom(
            protobuf::createTimeInfo(retryAfter));
        status->set_message(
            message + " (attempt " + stringify(retries) + " of " +
            stringify(attempts) + ")");
      },
      changes)
    .then([backoff]() -> Option<Duration> { return backoff; });
}


Future<Option<Resource>> WorkerProcess::commit(
    const ResourceID& resourceId,
    const ResourceStatus::Phase& expected,
    const Update& update,
    const InstanceChanges& changes)
{
  return process::loop(
      self(),
      [=]() {
        return store->get(resourceId);
      },
      [=](const Option<Resource>& resource)
          -> Future<ControlFlow<Option<Resource>>> {
        if (resource.isNone()) {
          // Nothing would ever terminate the instances that were about
          // to be adopted by the resource.
          vector<InstanceID> orphans;
          foreach (const Instance& instance, changes.added) {
            orphans.push_back(instance.instance_id());
          }

          return terminateInstances(orphans)
            .then([]() -> ControlFlow<Option<Resource>> {
              return Break(Option<Resource>::none());
            });
        }

        const ResourceStatus& current = resource->status();

        ResourceStatus status = current;
        changes.apply(&status);

        if (status.phase() == expected) {
          update(resource.get(), &status);
        }

        if (status.phase() != current.phase()) {
          LOG(INFO) << "Resource " << resourceId << " transitioned from "
                    << current.phase() << " to " << status.phase()
                    << (status.has_message() ? ": " + status.message() : "");

          status.mutable_last_transition_time()->CopyFrom(
              protobuf::getCurrentTime());
        }

        if (status == current) {
          return Break(resource);
        }

        return store->updateStatus(resourceId, status, resource->version())
          .then(defer(self(), [=](const Option<Resource>& updated)
              -> ControlFlow<Option<Resource>> {
            if (updated.isNone()) {
              ++metrics->conflicts;
              VLOG(1) << "Retrying conflicting status update of resource "
                      << resourceId;
              return Continue();
            }

            return Break(updated);
          }));
      });
}


Future<Nothing> WorkerProcess::withdraw(const Resource& resource)
{
  if (!resource.status().has_queue()) {
    return Nothing();
  }

  const string queue = resource.status().queue();
  const ResourceID resourceId = resource.id();

  return queues->withdraw(queue, resourceId)
    .then(defer(self(), [=](const Option<ResourceID>& promoted) {
      if (promoted.isSome()) {
        LOG(INFO) << "Resource " << promoted.get() << " was admitted to queue '"
                  << queue << "' after resource " << resourceId
                  << " left it";

        wakeup(promoted.get());
      }

      return Nothing();
    }));
}


Future<hashmap<InstanceID, HealthStatus>> WorkerProcess::checkHealth(
    const vector<InstanceID>& instances)
{
  vector<Future<HealthStatus>> futures;
  foreach (const InstanceID& instanceId, instances) {
    futures.push_back(backend->healthCheck(instanceId)
      .recover([instanceId](const Future<HealthStatus>& future)
          -> Future<HealthStatus> {
        LOG(WARNING) << "Failed to check the health of instance " << instanceId
                     << ": "
                     << (future.isFailed() ? future.failure() : "discarded");
        return HEALTH_UNKNOWN;
      }));
  }

  return collect(futures)
    .then([instances](const vector<HealthStatus>& statuses) {
      hashmap<InstanceID, HealthStatus> health;
      for (size_t i = 0; i < instances.size(); i++) {
        health.put(instances[i], statuses[i]);
      }
      return health;
    });
}


Future<hashset<InstanceID>> WorkerProcess::terminateInstances(
    const vector<InstanceID>& instances)
{
  vector<Future<Nothing>> futures;
  foreach (const InstanceID& instanceId, instances) {
    LOG(INFO) << "Terminating instance " << instanceId;
    futures.push_back(backend->terminate(instanceId));
  }

  return await(futures)
    .then([instances](const vector<Future<Nothing>>& results) {
      hashset<InstanceID> terminated;
      for (size_t i = 0; i < results.size(); i++) {
        if (results[i].isReady()) {
          terminated.insert(instances[i]);
        } else {
          LOG(WARNING) << "Failed to terminate instance " << instances[i]
                       << ": "
                       << (results[i].isFailed()
                           ? results[i].failure()
                           : "discarded");
        }
      }
      return terminated;
    });
}


Future<hashset<InstanceID>> WorkerProcess::drain(const Resource& resource)
{
  const Time now = Clock::now();
  const Duration timeout =
    resources::getDrainTimeout(resource.info(), flags.drain_timeout);

  vector<InstanceID> expired;
  vector<InstanceID> draining;
  vector<Future<size_t>> inflight;

  foreach (const Instance& instance, resource.status().instances()) {
    if (instance.phase() != Instance::DRAINING) {
      continue;
    }

    const Time since = instance.has_drain_started_at()
      ? protobuf::getTime(instance.drain_started_at())
      : now;

    if (now - since >= timeout) {
      LOG(WARNING) << "Instance " << instance.instance_id() << " of resource "
                   << resource.id() << " did not drain within " << timeout
                   << "; terminating it";

      expired.push_back(instance.instance_id());
    } else {
      draining.push_back(instance.instance_id());
      inflight.push_back(backend->inflight(instance.instance_id()));
    }
  }

  return await(inflight)
    .then(defer(self(), [=](const vector<Future<size_t>>& results) {
      vector<InstanceID> idle = expired;

      for (size_t i = 0; i < results.size(); i++) {
        if (results[i].isReady() && results[i].get() == 0) {
          idle.push_back(draining[i]);
        } else if (!results[i].isReady()) {
          VLOG(1) << "Failed to get the in-flight work of instance "
                  << draining[i] << ": "
                  << (results[i].isFailed()
                      ? results[i].failure()
                      : "discarded");
        }
      }

      return terminateInstances(idle);
    }));
}


Worker::Worker(
    const engine::Flags& flags,
    ResourceStore* store,
    QueueAdmissionController* queues,
    Scheduler* scheduler,
    Autoscaler* autoscaler,
    stratus::placement::Backend* backend,
    MetricFeed* feed,
    const accelerators::Catalog& catalog,
    Metrics* metrics,
    const lambda::function<void(const ResourceID&)>& wakeup)
{
  process = new WorkerProcess(
      flags,
      store,
      queues,
      scheduler,
      autoscaler,
      backend,
      feed,
      catalog,
      metrics,
      wakeup);

  spawn(process);
}


Worker::~Worker()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<Option<Duration>> Worker::reconcile(
    const ResourceID& resourceId,
    Trigger trigger)
{
  return dispatch(process, &WorkerProcess::reconcile, resourceId, trigger);
}

} // namespace reconciler {
} // namespace internal {
} // namespace stratus {
