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
#include <set>
#include <string>
#include <vector>

#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/hashset.hpp>
#include <stout/stringify.hpp>
#include <stout/uuid.hpp>

#include "common/protobuf_utils.hpp"

#include "logging/logging.hpp"

#include "placement/local.hpp"

using namespace process;

using std::string;
using std::vector;

namespace stratus {
namespace internal {
namespace placement {

class LocalBackendProcess : public Process<LocalBackendProcess>
{
public:
  explicit LocalBackendProcess(const LocalPlatforms& platforms);

  virtual ~LocalBackendProcess() {}

  vector<PlatformInfo> platforms();

  Future<Capacity> queryCapacity(const string& platform, const string& type);

  Future<vector<Instance>> provision(const ProvisionRequest& request);

  Future<Nothing> terminate(const InstanceID& instanceId);

  Future<HealthStatus> healthCheck(const InstanceID& instanceId);

  Future<size_t> inflight(const InstanceID& instanceId);

  Future<Nothing> setHealth(
      const InstanceID& instanceId,
      const HealthStatus& health);

  Future<Nothing> setInflight(const InstanceID& instanceId, size_t requests);

  Future<Nothing> setCapacity(
      const string& platform,
      const string& zone,
      const string& type,
      uint32_t total);

  Future<Nothing> setAvailable(const string& platform, bool available);

  vector<Instance> instances()
  {
    vector<Instance> result;
    foreachvalue (const State& state, instances_) {
      result.push_back(state.instance);
    }
    return result;
  }

private:
  struct Pool
  {
    Pool() : total(0), used(0) {}

    uint32_t free() const { return total > used ? total - used : 0; }

    uint32_t total;
    uint32_t used;
  };

  struct Zone
  {
    string name;

    // Keyed by accelerator type, the empty type being the CPU-only
    // instance slots.
    hashmap<string, Pool> pools;
  };

  struct Platform
  {
    Platform() : available(true) {}

    string name;
    vector<Zone> zones;
    bool available;
  };

  struct State
  {
    Instance instance;
    string zone;
    string pool;
    uint32_t allocated;
    HealthStatus health;
    size_t inflight;
  };

  Try<Platform*> find(const string& platform);

  // Preserves the order of the platforms as configured.
  vector<string> order;
  hashmap<string, Platform> platforms_;
  hashmap<InstanceID, State> instances_;
};


LocalBackendProcess::LocalBackendProcess(const LocalPlatforms& platforms)
  : ProcessBase(process::ID::generate("local-backend"))
{
  foreach (const LocalPlatforms::Platform& platform, platforms.platforms()) {
    Platform& platform_ = platforms_[platform.name()];
    platform_.name = platform.name();

    foreach (const LocalPlatforms::Zone& zone, platform.zones()) {
      Zone zone_;
      zone_.name = zone.name();
      zone_.pools[""].total = zone.cpus();

      foreach (const LocalPlatforms::Zone::Accelerator& accelerator,
               zone.accelerators()) {
        zone_.pools[accelerator.type()].total += accelerator.count();
      }

      platform_.zones.push_back(zone_);
    }

    order.push_back(platform.name());
  }
}


Try<LocalBackendProcess::Platform*> LocalBackendProcess::find(
    const string& platform)
{
  if (!platforms_.contains(platform)) {
    return Error("Unknown platform '" + platform + "'");
  }

  Platform* platform_ = &platforms_.at(platform);
  if (!platform_->available) {
    return Error("Platform '" + platform + "' is unavailable");
  }

  return platform_;
}


vector<PlatformInfo> LocalBackendProcess::platforms()
{
  vector<PlatformInfo> result;

  foreach (const string& name, order) {
    const Platform& platform = platforms_.at(name);

    PlatformInfo info;
    info.set_name(platform.name);

    std::set<string> types;
    foreach (const Zone& zone, platform.zones) {
      info.add_zones(zone.name);
      foreachkey (const string& type, zone.pools) {
        if (!type.empty()) {
          types.insert(type);
        }
      }
    }

    foreach (const string& type, types) {
      info.add_accelerators(type);
    }

    result.push_back(info);
  }

  return result;
}


Future<Capacity> LocalBackendProcess::queryCapacity(
    const string& platform,
    const string& type)
{
  Try<Platform*> platform_ = find(platform);
  if (platform_.isError()) {
    return Failure(platform_.error());
  }

  Capacity capacity;
  capacity.set_platform(platform);
  if (!type.empty()) {
    capacity.set_accelerator(type);
  }

  foreach (const Zone& zone, platform_.get()->zones) {
    if (zone.pools.contains(type)) {
      Capacity::Zone* zone_ = capacity.add_zones();
      zone_->set_name(zone.name);
      zone_->set_available(zone.pools.at(type).free());
    }
  }

  return capacity;
}


Future<vector<Instance>> LocalBackendProcess::provision(
    const ProvisionRequest& request)
{
  Try<Platform*> platform = find(request.platform());
  if (platform.isError()) {
    return Failure(platform.error());
  }

  const AcceleratorAllocation& allocation = request.allocation();
  const string type = allocation.count() > 0 ? allocation.type() : "";

  Zone* zone = nullptr;
  foreach (Zone& zone_, platform.get()->zones) {
    if (zone_.name == allocation.zone()) {
      zone = &zone_;
    }
  }

  if (zone == nullptr) {
    return Failure(
        "Unknown zone '" + allocation.zone() + "' on platform '" +
        request.platform() + "'");
  }

  // CPU-only instances take one slot each.
  const uint32_t perNode = allocation.count() > 0 ? allocation.count() : 1;
  const uint64_t needed =
    static_cast<uint64_t>(perNode) * request.node_count();

  if (!zone->pools.contains(type) || zone->pools.at(type).free() < needed) {
    return Failure(
        "Insufficient capacity for " + stringify(request.node_count()) +
        " x " + stringify(allocation) + " in zone '" + zone->name + "'");
  }

  const TimeInfo now = protobuf::getCurrentTime();

  vector<Instance> result;
  for (uint32_t node = 0; node < request.node_count(); node++) {
    Instance instance;
    instance.mutable_instance_id()->set_value(
        request.platform() + "-" + id::UUID::random().toString());
    instance.set_platform(request.platform());
    instance.mutable_allocation()->CopyFrom(allocation);
    instance.set_phase(Instance::PROVISIONING);
    instance.mutable_created_at()->CopyFrom(now);

    if (request.container().has_address()) {
      instance.set_node_address(request.container().address());
    } else {
      instance.set_node_address(
          zone->name + "." + instance.instance_id().value());
    }

    State state;
    state.instance = instance;
    state.zone = zone->name;
    state.pool = type;
    state.allocated = perNode;
    state.health = HEALTHY;
    state.inflight = 0;

    instances_[instance.instance_id()] = state;
    zone->pools[type].used += perNode;

    result.push_back(instance);
  }

  VLOG(1) << "Provisioned " << result.size() << " instance(s) of "
          << allocation << " on platform '" << request.platform()
          << "' for resource " << request.resource_id();

  return result;
}


Future<Nothing> LocalBackendProcess::terminate(const InstanceID& instanceId)
{
  if (!instances_.contains(instanceId)) {
    return Nothing();
  }

  const State& state = instances_.at(instanceId);

  Try<Platform*> platform = find(state.instance.platform());
  if (platform.isError()) {
    return Failure(platform.error());
  }

  foreach (Zone& zone, platform.get()->zones) {
    if (zone.name == state.zone) {
      Pool& pool = zone.pools[state.pool];
      pool.used -= std::min(pool.used, state.allocated);
    }
  }

  VLOG(1) << "Terminated instance " << instanceId;

  instances_.erase(instanceId);

  return Nothing();
}


Future<HealthStatus> LocalBackendProcess::healthCheck(
    const InstanceID& instanceId)
{
  if (!instances_.contains(instanceId)) {
    return UNHEALTHY;
  }

  const State& state = instances_.at(instanceId);

  Try<Platform*> platform = find(state.instance.platform());
  if (platform.isError()) {
    return Failure(platform.error());
  }

  return state.health;
}


Future<size_t> LocalBackendProcess::inflight(const InstanceID& instanceId)
{
  if (!instances_.contains(instanceId)) {
    return 0u;
  }

  return instances_.at(instanceId).inflight;
}


Future<Nothing> LocalBackendProcess::setHealth(
    const InstanceID& instanceId,
    const HealthStatus& health)
{
  if (!instances_.contains(instanceId)) {
    return Failure("Unknown instance " + stringify(instanceId));
  }

  instances_.at(instanceId).health = health;
  return Nothing();
}


Future<Nothing> LocalBackendProcess::setInflight(
    const InstanceID& instanceId,
    size_t requests)
{
  if (!instances_.contains(instanceId)) {
    return Failure("Unknown instance " + stringify(instanceId));
  }

  instances_.at(instanceId).inflight = requests;
  return Nothing();
}


Future<Nothing> LocalBackendProcess::setCapacity(
    const string& platform,
    const string& zone,
    const string& type,
    uint32_t total)
{
  if (!platforms_.contains(platform)) {
    return Failure("Unknown platform '" + platform + "'");
  }

  foreach (Zone& zone_, platforms_.at(platform).zones) {
    if (zone_.name == zone) {
      zone_.pools[type].total = total;
      return Nothing();
    }
  }

  return Failure("Unknown zone '" + zone + "'");
}


Future<Nothing> LocalBackendProcess::setAvailable(
    const string& platform,
    bool available)
{
  if (!platforms_.contains(platform)) {
    return Failure("Unknown platform '" + platform + "'");
  }

  platforms_.at(platform).available = available;
  return Nothing();
}


Try<LocalBackend*> LocalBackend::create(const LocalPlatforms& platforms)
{
  hashset<string> names;

  foreach (const LocalPlatforms::Platform& platform, platforms.platforms()) {
    if (platform.name().empty()) {
      return Error("Platform names must not be empty");
    }

    if (names.contains(platform.name())) {
      return Error("Platform '" + platform.name() + "' is listed twice");
    }

    names.insert(platform.name());

    if (platform.zones().empty()) {
      return Error("Platform '" + platform.name() + "' has no zones");
    }

    hashset<string> zones;
    foreach (const LocalPlatforms::Zone& zone, platform.zones()) {
      if (zone.name().empty() || zones.contains(zone.name())) {
        return Error(
            "Platform '" + platform.name() + "' has an empty or duplicate"
            " zone name");
      }

      zones.insert(zone.name());
    }
  }

  return new LocalBackend(platforms);
}


LocalBackend::LocalBackend(const LocalPlatforms& platforms)
{
  process = new LocalBackendProcess(platforms);
  spawn(process);
}


LocalBackend::~LocalBackend()
{
  process::terminate(process);
  process::wait(process);
  delete process;
}


Future<vector<PlatformInfo>> LocalBackend::platforms()
{
  return dispatch(process, &LocalBackendProcess::platforms);
}


Future<Capacity> LocalBackend::queryCapacity(
    const string& platform,
    const string& accelerator)
{
  return dispatch(
      process, &LocalBackendProcess::queryCapacity, platform, accelerator);
}


Future<vector<Instance>> LocalBackend::provision(
    const ProvisionRequest& request)
{
  return dispatch(process, &LocalBackendProcess::provision, request);
}


Future<Nothing> LocalBackend::terminate(const InstanceID& instanceId)
{
  return dispatch(process, &LocalBackendProcess::terminate, instanceId);
}


Future<HealthStatus> LocalBackend::healthCheck(const InstanceID& instanceId)
{
  return dispatch(process, &LocalBackendProcess::healthCheck, instanceId);
}


Future<size_t> LocalBackend::inflight(const InstanceID& instanceId)
{
  return dispatch(process, &LocalBackendProcess::inflight, instanceId);
}


Future<Nothing> LocalBackend::setHealth(
    const InstanceID& instanceId,
    const HealthStatus& health)
{
  return dispatch(
      process, &LocalBackendProcess::setHealth, instanceId, health);
}


Future<Nothing> LocalBackend::setInflight(
    const InstanceID& instanceId,
    size_t requests)
{
  return dispatch(
      process, &LocalBackendProcess::setInflight, instanceId, requests);
}


Future<Nothing> LocalBackend::setCapacity(
    const string& platform,
    const string& zone,
    const string& type,
    uint32_t total)
{
  return dispatch(
      process,
      &LocalBackendProcess::setCapacity,
      platform,
      zone,
      type,
      total);
}


Future<Nothing> LocalBackend::setAvailable(
    const string& platform,
    bool available)
{
  return dispatch(
      process, &LocalBackendProcess::setAvailable, platform, available);
}


Future<vector<Instance>> LocalBackend::instances()
{
  return dispatch(process, &LocalBackendProcess::instances);
}

} // namespace placement {
} // namespace internal {
} // namespace stratus {
