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


#ifndef __PLACEMENT_LOCAL_HPP__
#define __PLACEMENT_LOCAL_HPP__

#include <string>
#include <vector>

#include <stratus/stratus.hpp>

#include <stratus/placement/backend.hpp>

#include <process/future.hpp>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "messages/flags.pb.h"

namespace stratus {
namespace internal {
namespace placement {

// Forward declaration.
class LocalBackendProcess;


// A placement backend that keeps its platforms in memory. Instances
// only exist as bookkeeping: provisioning allocates accelerators from
// a zone and terminating frees them. Instances report healthy and
// idle unless told otherwise through the methods below, which makes
// this backend the reference for the tests as well as a dry-run
// backend for the daemon.
class LocalBackend : public stratus::placement::Backend
{
public:
  static Try<LocalBackend*> create(const LocalPlatforms& platforms);

  virtual ~LocalBackend();

  virtual process::Future<std::vector<PlatformInfo>> platforms();

  virtual process::Future<Capacity> queryCapacity(
      const std::string& platform,
      const std::string& accelerator);

  virtual process::Future<std::vector<Instance>> provision(
      const ProvisionRequest& request);

  virtual process::Future<Nothing> terminate(const InstanceID& instanceId);

  virtual process::Future<HealthStatus> healthCheck(
      const InstanceID& instanceId);

  virtual process::Future<size_t> inflight(const InstanceID& instanceId);

  // Overrides the health reported for an instance.
  process::Future<Nothing> setHealth(
      const InstanceID& instanceId,
      const HealthStatus& health);

  // Overrides the in-flight work reported for an instance.
  process::Future<Nothing> setInflight(
      const InstanceID& instanceId,
      size_t requests);

  // Changes the number of accelerators of `type` a zone has in total;
  // an empty type changes the CPU-only instance slots.
  process::Future<Nothing> setCapacity(
      const std::string& platform,
      const std::string& zone,
      const std::string& type,
      uint32_t total);

  // While a platform is unavailable every call against it fails.
  process::Future<Nothing> setAvailable(
      const std::string& platform,
      bool available);

  // Returns the instances that currently exist.
  process::Future<std::vector<Instance>> instances();

private:
  explicit LocalBackend(const LocalPlatforms& platforms);

  LocalBackend(const LocalBackend&) = delete;
  LocalBackend& operator=(const LocalBackend&) = delete;

  LocalBackendProcess* process;
};

} // namespace placement {
} // namespace internal {
} // namespace stratus {

#endif // __PLACEMENT_LOCAL_HPP__
