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


#include <list>
#include <memory>
#include <string>
#include <vector>

#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/owned.hpp>
#include <process/process.hpp>

#include <stout/circular_buffer.hpp>
#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/os.hpp>
#include <stout/protobuf.hpp>
#include <stout/result.hpp>
#include <stout/uuid.hpp>

#include "common/protobuf_utils.hpp"

#include "logging/logging.hpp"

#include "store/checkpoint.hpp"
#include "store/paths.hpp"
#include "store/resource_store.hpp"

using namespace process;

using std::list;
using std::shared_ptr;
using std::string;
using std::vector;

namespace stratus {
namespace internal {
namespace store {

namespace {

// Resources are unique per (owner, namespace, name). Neither the
// namespace nor the name may contain a '/', so the key is unambiguous.
string key(const ResourceInfo& info)
{
  return info.owner() + "/" + info.namespace_() + "/" + info.name();
}

} // namespace {


bool ResourceFilter::matches(const Resource& resource) const
{
  if (namespace_.isSome() &&
      resource.info().namespace_() != namespace_.get()) {
    return false;
  }

  if (owner.isSome() && resource.info().owner() != owner.get()) {
    return false;
  }

  if (kind.isSome() && resource.info().kind() != kind.get()) {
    return false;
  }

  if (phase.isSome() && resource.status().phase() != phase.get()) {
    return false;
  }

  return true;
}


class ResourceStoreProcess : public Process<ResourceStoreProcess>
{
public:
  ResourceStoreProcess(
      const Option<string>& _workDir,
      size_t _maxStatusHistory)
    : ProcessBase(process::ID::generate("resource-store")),
      workDir(_workDir),
      maxStatusHistory(_maxStatusHistory),
      sequence(0) {}

  virtual ~ResourceStoreProcess() {}

  Future<Nothing> recover();

  Option<Resource> get(const ResourceID& resourceId)
  {
    if (!records.contains(resourceId)) {
      return None();
    }

    return records.at(resourceId)->resource;
  }

  vector<Resource> list(const ResourceFilter& filter)
  {
    vector<Resource> result;
    foreachvalue (const Owned<Record>& record, records) {
      if (filter.matches(record->resource)) {
        result.push_back(record->resource);
      }
    }
    return result;
  }

  Future<Resource> putSpec(const ResourceInfo& info);

  Future<Option<Resource>> updateStatus(
      const ResourceID& resourceId,
      const ResourceStatus& status,
      uint64_t expectedVersion);

  Future<Nothing> remove(const ResourceID& resourceId);

  Future<vector<StatusUpdate>> history(const ResourceID& resourceId)
  {
    if (!records.contains(resourceId)) {
      return Failure("Unknown resource " + stringify(resourceId));
    }

    vector<StatusUpdate> result;
    foreach (const shared_ptr<StatusUpdate>& update,
             records.at(resourceId)->updates) {
      result.push_back(*update);
    }
    return result;
  }

  Nothing watch(const lambda::function<void(const Resource&)>& callback)
  {
    watchers.push_back(callback);
    return Nothing();
  }

private:
  struct Record
  {
    Record(const Resource& _resource, size_t capacity)
      : resource(_resource), updates(capacity) {}

    Resource resource;

    // NOTE: We use a shared pointer because the Boost code used
    // internally by stout's circular_buffer does memset's which are
    // unsafe for protobuf messages.
    circular_buffer<shared_ptr<StatusUpdate>> updates;
  };

  // Checkpoints the record if the store is durable.
  Try<Nothing> persist(const Resource& resource);

  // Makes a written record visible: appends the status to the history
  // of the resource and notifies the watchers.
  void commit(Record* record, const Resource& resource);

  const Option<string> workDir;
  const size_t maxStatusHistory;

  // Sequence number of the last status update, across all resources.
  uint64_t sequence;

  hashmap<ResourceID, Owned<Record>> records;
  hashmap<string, ResourceID> keys;

  vector<lambda::function<void(const Resource&)>> watchers;
};


Future<Nothing> ResourceStoreProcess::recover()
{
  if (workDir.isNone()) {
    return Nothing();
  }

  Try<list<string>> paths = paths::getResourcePaths(workDir.get());
  if (paths.isError()) {
    return Failure("Failed to find checkpointed resources: " + paths.error());
  }

  foreach (const string& path, paths.get()) {
    Result<Resource> resource = ::protobuf::read<Resource>(path);
    if (resource.isError()) {
      return Failure(
          "Failed to read resource from '" + path + "': " + resource.error());
    }

    if (resource.isNone()) {
      // The checkpoint was interrupted after the file was created.
      LOG(WARNING) << "Ignoring empty resource checkpoint '" << path << "'";
      continue;
    }

    Owned<Record> record(new Record(resource.get(), maxStatusHistory));

    records[resource.get().id()] = record;
    keys[key(resource.get().info())] = resource.get().id();

    commit(record.get(), resource.get());
  }

  LOG(INFO) << "Recovered " << records.size() << " resources from '"
            << workDir.get() << "'";

  return Nothing();
}


Future<Resource> ResourceStoreProcess::putSpec(const ResourceInfo& info)
{
  if (!info.IsInitialized()) {
    return Failure(
        "Resource is missing required fields: " +
        info.InitializationErrorString());
  }

  Option<ResourceID> resourceId = keys.get(key(info));

  if (resourceId.isSome()) {
    Record* record = records.at(resourceId.get()).get();
    const Resource& current = record->resource;

    if (current.status().deletion_requested()) {
      if (current.status().phase() != ResourceStatus::TERMINATED) {
        return Failure(
            "Resource '" + key(info) + "' is being deleted");
      }

      // The previous incarnation is gone, a fresh resource takes its
      // name below.
      if (workDir.isSome()) {
        const string path =
          paths::getResourcePath(workDir.get(), current.id());

        Try<Nothing> rm = os::rm(path);
        if (rm.isError()) {
          return Failure(
              "Failed to remove '" + path + "': " + rm.error());
        }
      }

      records.erase(resourceId.get());
      keys.erase(key(info));
    } else {
      if (current.info() == info) {
        return current;
      }

      Resource resource = current;
      resource.mutable_info()->CopyFrom(info);
      resource.set_generation(current.generation() + 1);
      resource.set_version(current.version() + 1);

      Try<Nothing> persisted = persist(resource);
      if (persisted.isError()) {
        return Failure(persisted.error());
      }

      LOG(INFO) << "Updated spec of resource " << resource.id()
                << " ('" << key(info) << "') to generation "
                << resource.generation();

      record->resource = resource;

      foreach (const auto& watcher, watchers) {
        watcher(resource);
      }

      return resource;
    }
  }

  const TimeInfo now = protobuf::getCurrentTime();

  Resource resource;
  resource.mutable_id()->set_value(id::UUID::random().toString());
  resource.mutable_info()->CopyFrom(info);
  resource.set_generation(1);
  resource.set_version(1);
  resource.mutable_created_at()->CopyFrom(now);

  ResourceStatus* status = resource.mutable_status();
  status->set_phase(ResourceStatus::PENDING);
  status->mutable_last_transition_time()->CopyFrom(now);

  Try<Nothing> persisted = persist(resource);
  if (persisted.isError()) {
    return Failure(persisted.error());
  }

  LOG(INFO) << "Created " << info.kind() << " resource " << resource.id()
            << " ('" << key(info) << "')";

  Owned<Record> record(new Record(resource, maxStatusHistory));

  records[resource.id()] = record;
  keys[key(info)] = resource.id();

  commit(record.get(), resource);

  return resource;
}


Future<Option<Resource>> ResourceStoreProcess::updateStatus(
    const ResourceID& resourceId,
    const ResourceStatus& status,
    uint64_t expectedVersion)
{
  if (!records.contains(resourceId)) {
    return Failure("Unknown resource " + stringify(resourceId));
  }

  Record* record = records.at(resourceId).get();
  const Resource& current = record->resource;

  if (current.version() != expectedVersion) {
    VLOG(1) << "Rejecting status update of resource " << resourceId
            << " at version " << expectedVersion
            << " (current version is " << current.version() << ")";
    return None();
  }

  if (status.observed_generation() > current.generation()) {
    return Failure(
        "Observed generation " + stringify(status.observed_generation()) +
        " of resource " + stringify(resourceId) + " is ahead of the spec"
        " generation " + stringify(current.generation()));
  }

  Resource resource = current;
  resource.mutable_status()->CopyFrom(status);

  // Deletion can only be requested through `remove()`, a status
  // written by the reconciler never cancels it.
  if (current.status().deletion_requested()) {
    resource.mutable_status()->set_deletion_requested(true);
  }

  if (resource.status() == current.status()) {
    return current;
  }

  resource.set_version(current.version() + 1);

  Try<Nothing> persisted = persist(resource);
  if (persisted.isError()) {
    return Failure(persisted.error());
  }

  commit(record, resource);

  return resource;
}


Future<Nothing> ResourceStoreProcess::remove(const ResourceID& resourceId)
{
  if (!records.contains(resourceId)) {
    return Failure("Unknown resource " + stringify(resourceId));
  }

  Record* record = records.at(resourceId).get();

  if (record->resource.status().deletion_requested()) {
    return Nothing();
  }

  Resource resource = record->resource;
  resource.set_version(resource.version() + 1);

  ResourceStatus* status = resource.mutable_status();
  status->set_phase(ResourceStatus::TERMINATING);
  status->set_deletion_requested(true);
  status->set_message("Deletion requested");
  status->clear_retry_after();
  status->mutable_last_transition_time()->CopyFrom(
      protobuf::getCurrentTime());

  Try<Nothing> persisted = persist(resource);
  if (persisted.isError()) {
    return Failure(persisted.error());
  }

  LOG(INFO) << "Deletion requested for resource " << resourceId;

  commit(record, resource);

  return Nothing();
}


Try<Nothing> ResourceStoreProcess::persist(const Resource& resource)
{
  if (workDir.isNone()) {
    return Nothing();
  }

  const string path = paths::getResourcePath(workDir.get(), resource.id());

  Try<Nothing> checkpointed = checkpoint(path, resource);
  if (checkpointed.isError()) {
    LOG(ERROR) << "Failed to checkpoint resource " << resource.id()
               << ": " << checkpointed.error();
    return Error(
        "Failed to checkpoint resource " + stringify(resource.id()) + ": " +
        checkpointed.error());
  }

  return Nothing();
}


void ResourceStoreProcess::commit(Record* record, const Resource& resource)
{
  record->resource = resource;

  shared_ptr<StatusUpdate> update(new StatusUpdate());
  update->set_sequence(++sequence);
  update->mutable_resource_id()->CopyFrom(resource.id());
  update->set_phase(resource.status().phase());
  update->mutable_timestamp()->CopyFrom(protobuf::getCurrentTime());
  update->set_version(resource.version());

  if (resource.status().has_message()) {
    update->set_message(resource.status().message());
  }

  VLOG(1) << "Recorded " << *update;

  record->updates.push_back(update);

  foreach (const auto& watcher, watchers) {
    watcher(resource);
  }
}


ResourceStore::ResourceStore(
    const Option<string>& workDir,
    size_t maxStatusHistory)
{
  process = new ResourceStoreProcess(workDir, maxStatusHistory);
  spawn(process);
}


ResourceStore::~ResourceStore()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<Nothing> ResourceStore::recover()
{
  return dispatch(process, &ResourceStoreProcess::recover);
}


Future<Option<Resource>> ResourceStore::get(const ResourceID& resourceId)
{
  return dispatch(process, &ResourceStoreProcess::get, resourceId);
}


Future<vector<Resource>> ResourceStore::list(const ResourceFilter& filter)
{
  return dispatch(process, &ResourceStoreProcess::list, filter);
}


Future<Resource> ResourceStore::putSpec(const ResourceInfo& info)
{
  return dispatch(process, &ResourceStoreProcess::putSpec, info);
}


Future<Option<Resource>> ResourceStore::updateStatus(
    const ResourceID& resourceId,
    const ResourceStatus& status,
    uint64_t expectedVersion)
{
  return dispatch(
      process,
      &ResourceStoreProcess::updateStatus,
      resourceId,
      status,
      expectedVersion);
}


Future<Nothing> ResourceStore::remove(const ResourceID& resourceId)
{
  return dispatch(process, &ResourceStoreProcess::remove, resourceId);
}


Future<vector<StatusUpdate>> ResourceStore::history(
    const ResourceID& resourceId)
{
  return dispatch(process, &ResourceStoreProcess::history, resourceId);
}


Future<Nothing> ResourceStore::watch(
    const lambda::function<void(const Resource&)>& callback)
{
  return dispatch(process, &ResourceStoreProcess::watch, callback);
}

} // namespace store {
} // namespace internal {
} // namespace stratus {
