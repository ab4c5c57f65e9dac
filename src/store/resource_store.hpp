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


#ifndef __STORE_RESOURCE_STORE_HPP__
#define __STORE_RESOURCE_STORE_HPP__

#include <string>
#include <vector>

#include <stratus/stratus.hpp>

#include <process/future.hpp>

#include <stout/lambda.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

#include "messages/messages.hpp"

namespace stratus {
namespace internal {
namespace store {

// Forward declaration.
class ResourceStoreProcess;


// Selects resources in `ResourceStore::list`. Unset fields match
// every resource.
struct ResourceFilter
{
  bool matches(const Resource& resource) const;

  Option<std::string> namespace_;
  Option<std::string> owner;
  Option<ResourceInfo::Kind> kind;
  Option<ResourceStatus::Phase> phase;
};


// Durable, versioned record of the desired spec and observed status
// of every resource. Every write bumps the record `version`; status
// writes are test-and-set on that version, which is the only
// concurrency control the reconciler relies on.
//
// When a work directory is given every record is checkpointed under
// it and `recover()` must complete before the store is used.
class ResourceStore
{
public:
  explicit ResourceStore(
      const Option<std::string>& workDir = None(),
      size_t maxStatusHistory = 100);

  virtual ~ResourceStore();

  // Recovers the checkpointed resources (if any).
  process::Future<Nothing> recover();

  process::Future<Option<Resource>> get(const ResourceID& resourceId);

  process::Future<std::vector<Resource>> list(
      const ResourceFilter& filter = ResourceFilter());

  // Declares or updates the desired spec of the resource identified by
  // `(owner, namespace, name)`. The generation is only bumped when the
  // spec actually changes. Fails if the resource is being deleted.
  process::Future<Resource> putSpec(const ResourceInfo& info);

  // Replaces the status of a resource if its version still equals
  // `expectedVersion`. Returns the updated resource, or none if the
  // record was written concurrently (the caller must re-read and
  // retry). Fails for unknown resources.
  process::Future<Option<Resource>> updateStatus(
      const ResourceID& resourceId,
      const ResourceStatus& status,
      uint64_t expectedVersion);

  // Requests deletion: the resource moves to `TERMINATING` and the
  // reconciler takes care of releasing everything it holds.
  process::Future<Nothing> remove(const ResourceID& resourceId);

  // Returns the retained status updates of a resource, oldest first.
  process::Future<std::vector<StatusUpdate>> history(
      const ResourceID& resourceId);

  // Registers a callback invoked with every record written to the
  // store. The callback runs within the store and must not block.
  process::Future<Nothing> watch(
      const lambda::function<void(const Resource&)>& callback);

private:
  ResourceStore(const ResourceStore&) = delete;
  ResourceStore& operator=(const ResourceStore&) = delete;

  ResourceStoreProcess* process;
};

} // namespace store {
} // namespace internal {
} // namespace stratus {

#endif // __STORE_RESOURCE_STORE_HPP__
