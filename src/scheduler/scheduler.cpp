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


#include <ostream>
#include <string>
#include <vector>

#include <process/collect.hpp>
#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <process/metrics/counter.hpp>
#include <process/metrics/metrics.hpp>

#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/lambda.hpp>
#include <stout/stringify.hpp>

#include "common/accelerators.hpp"
#include "common/protobuf_utils.hpp"
#include "common/resource_utils.hpp"

#include "logging/logging.hpp"

#include "scheduler/scheduler.hpp"

using namespace process;

using process::metrics::Counter;

using std::ostream;
using std::string;
using std::vector;

namespace stratus {
namespace internal {
namespace scheduler {

ostream& operator<<(ostream& stream, const PlacementError& error)
{
  switch (error.type) {
    case PlacementError::NO_CAPACITY:
      stream << "NO_CAPACITY";
      break;
    case PlacementError::INVALID:
      stream << "INVALID";
      break;
    case PlacementError::TRANSIENT:
      stream << "TRANSIENT";
      break;
  }

  return stream << ": " << error.message;
}


class SchedulerProcess : public Process<SchedulerProcess>
{
public:
  explicit SchedulerProcess(stratus::placement::Backend* _backend)
    : ProcessBase(process::ID::generate("scheduler")),
      backend(_backend) {}

  virtual ~SchedulerProcess() {}

  Future<Try<Placement, PlacementError>> place(const Resource& resource);

private:
  // A platform along with one of the accelerator options of the
  // resource that the platform offers.
  struct Candidate
  {
    string platform;
    accelerators::Request request;
  };

  Future<Try<Placement, PlacementError>> _place(
      const Resource& resource,
      const vector<accelerators::Request>& requests,
      const vector<PlatformInfo>& platforms);

  // Tries the options starting at `index`. `answered` tells if any
  // platform answered a capacity query so far.
  Future<Try<Placement, PlacementError>> attempt(
      const Resource& resource,
      const vector<Candidate>& options,
      size_t index,
      bool answered);

  Future<Try<Placement, PlacementError>> _attempt(
      const Resource& resource,
      const vector<Candidate>& options,
      size_t index,
      bool answered,
      const Option<Capacity>& capacity);

  Future<Try<Placement, PlacementError>> provision(
      const Resource& resource,
      const Candidate& option,
      const string& zone);

  Future<Try<Placement, PlacementError>> _provision(
      const Resource& resource,
      const ProvisionRequest& request,
      const vector<Instance>& instances);

  struct Metrics
  {
    Metrics()
      : placements("scheduler/placements"),
        no_capacity("scheduler/no_capacity")
    {
      process::metrics::add(placements);
      process::metrics::add(no_capacity);
    }

    ~Metrics()
    {
      process::metrics::remove(placements);
      process::metrics::remove(no_capacity);
    }

    Counter placements;
    Counter no_capacity;
  } metrics;

  stratus::placement::Backend* backend;
};


namespace {

// Number of nodes provisioned by a single placement.
uint32_t getNodeCount(const ResourceInfo& info)
{
  return info.kind() == ResourceInfo::CLUSTER ? info.cluster().num_nodes() : 1;
}


bool offers(const PlatformInfo& platform, const accelerators::Request& request)
{
  if (request.cpuOnly()) {
    return true;
  }

  foreach (const string& accelerator, platform.accelerators()) {
    if (accelerator == request.type) {
      return true;
    }
  }

  return false;
}

} // namespace {


Future<Try<Placement, PlacementError>> SchedulerProcess::place(
    const Resource& resource)
{
  const ContainerTemplate& container =
    resources::getContainer(resource.info());

  Try<vector<accelerators::Request>> requests = accelerators::parse(container);
  if (requests.isError()) {
    return PlacementError(PlacementError::INVALID, requests.error());
  }

  if (resource.info().kind() == ResourceInfo::UNKNOWN) {
    return PlacementError(PlacementError::INVALID, "Unknown resource kind");
  }

  return backend->platforms()
    .then(defer(self(),
                &Self::_place,
                resource,
                requests.get(),
                lambda::_1))
    .recover([](const Future<Try<Placement, PlacementError>>& future)
        -> Future<Try<Placement, PlacementError>> {
      return PlacementError(
          PlacementError::TRANSIENT,
          "Failed to list platforms: " +
          (future.isFailed() ? future.failure() : "discarded"));
    });
}


Future<Try<Placement, PlacementError>> SchedulerProcess::_place(
    const Resource& resource,
    const vector<accelerators::Request>& requests,
    const vector<PlatformInfo>& platforms)
{
  const ContainerTemplate& container =
    resources::getContainer(resource.info());

  hashmap<string, PlatformInfo> known;
  foreach (const PlatformInfo& platform, platforms) {
    known[platform.name()] = platform;
  }

  vector<PlatformInfo> candidates;

  if (container.has_platform()) {
    if (!known.contains(container.platform())) {
      return PlacementError(
          PlacementError::INVALID,
          "Unknown platform '" + container.platform() + "'");
    }

    candidates.push_back(known.at(container.platform()));
  } else if (container.platform_preferences_size() > 0) {
    foreach (const string& platform, container.platform_preferences()) {
      if (!known.contains(platform)) {
        VLOG(1) << "Skipping unknown preferred platform '" << platform
                << "' for resource " << resource.id();
        continue;
      }

      candidates.push_back(known.at(platform));
    }
  } else {
    candidates = platforms;
  }

  vector<Candidate> options;
  foreach (const PlatformInfo& platform, candidates) {
    foreach (const accelerators::Request& request, requests) {
      if (offers(platform, request)) {
        options.push_back(Candidate{platform.name(), request});
      }
    }
  }

  if (options.empty()) {
    ++metrics.no_capacity;

    return PlacementError(
        PlacementError::NO_CAPACITY,
        "No candidate platform offers the requested accelerators");
  }

  return attempt(resource, options, 0, false);
}


Future<Try<Placement, PlacementError>> SchedulerProcess::attempt(
    const Resource& resource,
    const vector<Candidate>& options,
    size_t index,
    bool answered)
{
  if (index >= options.size()) {
    if (!answered) {
      return PlacementError(
          PlacementError::TRANSIENT,
          "None of the candidate platforms answered capacity queries");
    }

    ++metrics.no_capacity;

    return PlacementError(
        PlacementError::NO_CAPACITY,
        "Insufficient capacity on all candidate platforms");
  }

  const Candidate& option = options[index];
  const string platform = option.platform;

  return backend->queryCapacity(option.platform, option.request.type)
    .then([](const Capacity& capacity) -> Option<Capacity> {
      return capacity;
    })
    .recover([platform](const Future<Option<Capacity>>& future)
        -> Future<Option<Capacity>> {
      LOG(WARNING) << "Failed to query capacity of platform '" << platform
                   << "': "
                   << (future.isFailed() ? future.failure() : "discarded");
      return None();
    })
    .then(defer(self(),
                &Self::_attempt,
                resource,
                options,
                index,
                answered,
                lambda::_1));
}


Future<Try<Placement, PlacementError>> SchedulerProcess::_attempt(
    const Resource& resource,
    const vector<Candidate>& options,
    size_t index,
    bool answered,
    const Option<Capacity>& capacity)
{
  const Candidate& option = options[index];

  if (capacity.isNone()) {
    // Skip every remaining option of the platform that failed.
    size_t next = index + 1;
    while (next < options.size() &&
           options[next].platform == option.platform) {
      next++;
    }

    return attempt(resource, options, next, answered);
  }

  const uint64_t nodes = getNodeCount(resource.info());
  const uint64_t needed =
    option.request.cpuOnly() ? nodes : option.request.count * nodes;

  foreach (const Capacity::Zone& zone, capacity->zones()) {
    if (zone.available() >= needed) {
      return provision(resource, option, zone.name());
    }
  }

  VLOG(1) << "Platform '" << option.platform << "' lacks capacity for "
          << nodes << " x " << option.request << " in a single zone";

  return attempt(resource, options, index + 1, true);
}


Future<Try<Placement, PlacementError>> SchedulerProcess::provision(
    const Resource& resource,
    const Candidate& option,
    const string& zone)
{
  ProvisionRequest request;
  request.mutable_resource_id()->CopyFrom(resource.id());
  request.set_platform(option.platform);
  request.set_node_count(getNodeCount(resource.info()));
  request.mutable_container()->CopyFrom(
      resources::getContainer(resource.info()));

  AcceleratorAllocation* allocation = request.mutable_allocation();
  allocation->set_count(option.request.count);
  allocation->set_zone(zone);
  if (!option.request.cpuOnly()) {
    allocation->set_type(option.request.type);
  }

  LOG(INFO) << "Provisioning " << request.node_count() << " instance(s) of "
            << request.allocation() << " on platform '" << option.platform
            << "' for resource " << resource.id();

  const string platform = option.platform;

  return backend->provision(request)
    .then(defer(self(), &Self::_provision, resource, request, lambda::_1))
    .recover([platform](const Future<Try<Placement, PlacementError>>& future)
        -> Future<Try<Placement, PlacementError>> {
      return PlacementError(
          PlacementError::TRANSIENT,
          "Failed to provision on platform '" + platform + "': " +
          (future.isFailed() ? future.failure() : "discarded"));
    });
}


Future<Try<Placement, PlacementError>> SchedulerProcess::_provision(
    const Resource& resource,
    const ProvisionRequest& request,
    const vector<Instance>& instances)
{
  if (instances.size() < request.node_count()) {
    LOG(WARNING) << "Platform '" << request.platform() << "' provisioned "
                 << instances.size() << " of " << request.node_count()
                 << " instance(s) for resource " << resource.id()
                 << ", terminating them";

    vector<Future<Nothing>> terminations;
    foreach (const Instance& instance, instances) {
      terminations.push_back(backend->terminate(instance.instance_id()));
    }

    const string message =
      "Platform '" + request.platform() + "' provisioned " +
      stringify(instances.size()) + " of " +
      stringify(request.node_count()) + " instance(s)";

    return await(terminations)
      .then([message](const vector<Future<Nothing>>& terminated)
          -> Try<Placement, PlacementError> {
        foreach (const Future<Nothing>& termination, terminated) {
          if (!termination.isReady()) {
            LOG(ERROR) << "Failed to terminate a partially provisioned"
                       << " instance: "
                       << (termination.isFailed()
                             ? termination.failure() : "discarded");
          }
        }

        return PlacementError(PlacementError::TRANSIENT, message);
      });
  }

  const TimeInfo now = protobuf::getCurrentTime();

  Placement placement;
  placement.platform = request.platform();
  placement.allocation = request.allocation();

  foreach (Instance instance, instances) {
    instance.set_platform(request.platform());
    instance.set_phase(Instance::PROVISIONING);

    if (!instance.has_allocation()) {
      instance.mutable_allocation()->CopyFrom(request.allocation());
    }

    if (!instance.has_created_at()) {
      instance.mutable_created_at()->CopyFrom(now);
    }

    placement.instances.push_back(instance);
  }

  ++metrics.placements;

  LOG(INFO) << "Placed resource " << resource.id() << " on platform '"
            << placement.platform << "' (" << placement.allocation << ")";

  return placement;
}


Scheduler::Scheduler(stratus::placement::Backend* backend)
{
  process = new SchedulerProcess(backend);
  spawn(process);
}


Scheduler::~Scheduler()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<Try<Placement, PlacementError>> Scheduler::place(
    const Resource& resource)
{
  return dispatch(process, &SchedulerProcess::place, resource);
}

} // namespace scheduler {
} // namespace internal {
} // namespace stratus {
