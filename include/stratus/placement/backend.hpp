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


#ifndef __STRATUS_PLACEMENT_BACKEND_HPP__
#define __STRATUS_PLACEMENT_BACKEND_HPP__

#include <vector>

#include <stratus/stratus.hpp>

#include <process/future.hpp>

#include <stout/nothing.hpp>

namespace stratus {
namespace placement {

// Abstraction over the external platforms (clouds, GPU marketplaces)
// instances get provisioned on. Implementations are expected to be
// safe to call concurrently; every call returns a future which fails
// when the platform could not be reached or refused the operation.
class Backend
{
public:
  Backend() {}
  virtual ~Backend() {}

  // Returns the platforms this backend can place onto along with the
  // accelerator types and zones each of them offers.
  virtual process::Future<std::vector<PlatformInfo>> platforms() = 0;

  // Returns the per-zone availability of `accelerator` on `platform`.
  // An empty accelerator type asks for CPU-only capacity.
  virtual process::Future<Capacity> queryCapacity(
      const std::string& platform,
      const std::string& accelerator) = 0;

  // Provisions `request.node_count()` instances. A backend may return
  // fewer instances than requested, the caller owns whatever is
  // returned and must terminate it.
  virtual process::Future<std::vector<Instance>> provision(
      const ProvisionRequest& request) = 0;

  // Terminates an instance. Terminating an instance that is already
  // gone must succeed.
  virtual process::Future<Nothing> terminate(const InstanceID& instanceId) = 0;

  virtual process::Future<HealthStatus> healthCheck(
      const InstanceID& instanceId) = 0;

  // Returns the number of requests still being processed by the
  // instance, used to decide when a draining instance can be stopped.
  // Backends that cannot observe in-flight work report zero.
  virtual process::Future<size_t> inflight(const InstanceID& instanceId)
  {
    return 0u;
  }
};

} // namespace placement {
} // namespace stratus {

#endif // __STRATUS_PLACEMENT_BACKEND_HPP__
