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

#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <stratus/stratus.hpp>
#include <stratus/type_utils.hpp>

#include <process/future.hpp>
#include <process/gtest.hpp>
#include <process/owned.hpp>

#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>

#include "messages/messages.hpp"

#include "store/paths.hpp"
#include "store/resource_store.hpp"

#include "tests/utils.hpp"

using process::Future;
using process::Owned;

using std::string;
using std::vector;

using stratus::internal::store::ResourceFilter;
using stratus::internal::store::ResourceStore;

namespace stratus {
namespace internal {
namespace tests {

class ResourceStoreTest : public TemporaryDirectoryTest {};


TEST_F(ResourceStoreTest, PutSpec)
{
  ResourceStore store;

  Future<Resource> resource = store.putSpec(createContainerInfo("train"));
  AWAIT_READY(resource);

  EXPECT_EQ(1u, resource->generation());
  EXPECT_EQ(1u, resource->version());
  EXPECT_EQ(ResourceStatus::PENDING, resource->status().phase());
  EXPECT_EQ(0u, resource->status().observed_generation());
  EXPECT_TRUE(resource->has_created_at());

  Future<Option<Resource>> get = store.get(resource->id());
  AWAIT_READY(get);
  ASSERT_SOME(get.get());
  EXPECT_EQ(resource->id(), get->get().id());
  EXPECT_EQ(resource->info(), get->get().info());

  ResourceID unknown;
  unknown.set_value("unknown");

  get = store.get(unknown);
  AWAIT_READY(get);
  EXPECT_NONE(get.get());
}


// An unchanged spec is not a write, a changed one bumps both the
// generation and the version.
TEST_F(ResourceStoreTest, Generation)
{
  ResourceStore store;

  ResourceInfo info = createContainerInfo("train");

  Future<Resource> resource = store.putSpec(info);
  AWAIT_READY(resource);

  const ResourceID resourceId = resource->id();

  resource = store.putSpec(info);
  AWAIT_READY(resource);
  EXPECT_EQ(resourceId, resource->id());
  EXPECT_EQ(1u, resource->generation());
  EXPECT_EQ(1u, resource->version());

  info.mutable_container()->set_image("registry.example.com/trainer:v2");

  resource = store.putSpec(info);
  AWAIT_READY(resource);
  EXPECT_EQ(resourceId, resource->id());
  EXPECT_EQ(2u, resource->generation());
  EXPECT_EQ(2u, resource->version());
  EXPECT_EQ(ResourceStatus::PENDING, resource->status().phase());
}


// Resources are identified by owner, namespace and name.
TEST_F(ResourceStoreTest, Identity)
{
  ResourceStore store;

  ResourceInfo info1 = createContainerInfo("train");
  ResourceInfo info2 = info1;
  info2.set_owner("bob");
  ResourceInfo info3 = info1;
  info3.set_namespace_("research");

  Future<Resource> resource1 = store.putSpec(info1);
  Future<Resource> resource2 = store.putSpec(info2);
  Future<Resource> resource3 = store.putSpec(info3);

  AWAIT_READY(resource1);
  AWAIT_READY(resource2);
  AWAIT_READY(resource3);

  EXPECT_NE(resource1->id(), resource2->id());
  EXPECT_NE(resource1->id(), resource3->id());
  EXPECT_NE(resource2->id(), resource3->id());

  ResourceFilter filter;
  filter.owner = "alice";

  Future<vector<Resource>> list = store.list(filter);
  AWAIT_READY(list);
  EXPECT_EQ(2u, list->size());

  filter.namespace_ = "research";

  list = store.list(filter);
  AWAIT_READY(list);
  ASSERT_EQ(1u, list->size());
  EXPECT_EQ(resource3->id(), list->front().id());

  list = store.list();
  AWAIT_READY(list);
  EXPECT_EQ(3u, list->size());
}


TEST_F(ResourceStoreTest, ListByKindAndPhase)
{
  ResourceStore store;

  Future<Resource> container = store.putSpec(createContainerInfo("train"));
  Future<Resource> service = store.putSpec(createServiceInfo("serve", 1, 2));

  AWAIT_READY(container);
  AWAIT_READY(service);

  ResourceStatus status = service->status();
  status.set_phase(ResourceStatus::RUNNING);

  AWAIT_READY(store.updateStatus(service->id(), status, 1));

  ResourceFilter filter;
  filter.kind = ResourceInfo::SERVICE;

  Future<vector<Resource>> list = store.list(filter);
  AWAIT_READY(list);
  ASSERT_EQ(1u, list->size());
  EXPECT_EQ(service->id(), list->front().id());

  filter = ResourceFilter();
  filter.phase = ResourceStatus::PENDING;

  list = store.list(filter);
  AWAIT_READY(list);
  ASSERT_EQ(1u, list->size());
  EXPECT_EQ(container->id(), list->front().id());
}


TEST_F(ResourceStoreTest, MissingRequiredFields)
{
  ResourceStore store;

  ResourceInfo info;
  info.set_name("train");

  AWAIT_FAILED(store.putSpec(info));
}


// Status writes are test-and-set on the record version.
TEST_F(ResourceStoreTest, UpdateStatusConflict)
{
  ResourceStore store;

  Future<Resource> resource = store.putSpec(createContainerInfo("train"));
  AWAIT_READY(resource);

  ResourceStatus status = resource->status();
  status.set_phase(ResourceStatus::SCHEDULING);
  status.set_message("Scheduling");

  Future<Option<Resource>> update =
    store.updateStatus(resource->id(), status, 1);

  AWAIT_READY(update);
  ASSERT_SOME(update.get());
  EXPECT_EQ(2u, update->get().version());
  EXPECT_EQ(1u, update->get().generation());
  EXPECT_EQ(ResourceStatus::SCHEDULING, update->get().status().phase());

  // A writer that still holds version 1 loses.
  status.set_phase(ResourceStatus::FAILED);

  update = store.updateStatus(resource->id(), status, 1);
  AWAIT_READY(update);
  EXPECT_NONE(update.get());

  Future<Option<Resource>> get = store.get(resource->id());
  AWAIT_READY(get);
  ASSERT_SOME(get.get());
  EXPECT_EQ(ResourceStatus::SCHEDULING, get->get().status().phase());

  // Writing an identical status does not bump the version.
  status.set_phase(ResourceStatus::SCHEDULING);

  update = store.updateStatus(resource->id(), status, 2);
  AWAIT_READY(update);
  ASSERT_SOME(update.get());
  EXPECT_EQ(2u, update->get().version());
}


TEST_F(ResourceStoreTest, UpdateStatusInvalid)
{
  ResourceStore store;

  Future<Resource> resource = store.putSpec(createContainerInfo("train"));
  AWAIT_READY(resource);

  ResourceStatus status = resource->status();
  status.set_observed_generation(2);

  AWAIT_FAILED(store.updateStatus(resource->id(), status, 1));

  ResourceID unknown;
  unknown.set_value("unknown");

  AWAIT_FAILED(store.updateStatus(unknown, status, 1));
}


TEST_F(ResourceStoreTest, Remove)
{
  ResourceStore store;

  ResourceInfo info = createContainerInfo("train");

  Future<Resource> resource = store.putSpec(info);
  AWAIT_READY(resource);

  AWAIT_READY(store.remove(resource->id()));

  Future<Option<Resource>> get = store.get(resource->id());
  AWAIT_READY(get);
  ASSERT_SOME(get.get());
  EXPECT_EQ(ResourceStatus::TERMINATING, get->get().status().phase());
  EXPECT_TRUE(get->get().status().deletion_requested());
  EXPECT_EQ(2u, get->get().version());

  // Removing twice is a no-op.
  AWAIT_READY(store.remove(resource->id()));

  get = store.get(resource->id());
  AWAIT_READY(get);
  ASSERT_SOME(get.get());
  EXPECT_EQ(2u, get->get().version());

  // A status write cannot cancel the deletion.
  ResourceStatus status = get->get().status();
  status.set_deletion_requested(false);
  status.set_message("Draining");

  Future<Option<Resource>> update =
    store.updateStatus(resource->id(), status, 2);

  AWAIT_READY(update);
  ASSERT_SOME(update.get());
  EXPECT_TRUE(update->get().status().deletion_requested());

  // The spec cannot change while the resource is being deleted.
  info.mutable_container()->set_image("registry.example.com/trainer:v2");
  AWAIT_FAILED(store.putSpec(info));

  // Once terminated the name is free again.
  status = update->get().status();
  status.set_phase(ResourceStatus::TERMINATED);

  update = store.updateStatus(resource->id(), status, 3);
  AWAIT_READY(update);
  ASSERT_SOME(update.get());

  Future<Resource> recreated = store.putSpec(info);
  AWAIT_READY(recreated);
  EXPECT_NE(resource->id(), recreated->id());
  EXPECT_EQ(1u, recreated->generation());
  EXPECT_EQ(ResourceStatus::PENDING, recreated->status().phase());

  get = store.get(resource->id());
  AWAIT_READY(get);
  EXPECT_NONE(get.get());
}


TEST_F(ResourceStoreTest, History)
{
  ResourceStore store(None(), 3);

  Future<Resource> resource = store.putSpec(createContainerInfo("train"));
  AWAIT_READY(resource);

  const vector<ResourceStatus::Phase> phases = {
    ResourceStatus::QUEUED,
    ResourceStatus::SCHEDULING,
    ResourceStatus::PROVISIONING,
    ResourceStatus::RUNNING
  };

  uint64_t version = resource->version();

  foreach (const ResourceStatus::Phase& phase, phases) {
    ResourceStatus status = resource->status();
    status.set_phase(phase);

    Future<Option<Resource>> update =
      store.updateStatus(resource->id(), status, version);

    AWAIT_READY(update);
    ASSERT_SOME(update.get());

    version = update->get().version();
  }

  Future<vector<StatusUpdate>> history = store.history(resource->id());
  AWAIT_READY(history);

  // Only the three most recent updates are retained.
  ASSERT_EQ(3u, history->size());
  EXPECT_EQ(ResourceStatus::SCHEDULING, history->at(0).phase());
  EXPECT_EQ(ResourceStatus::PROVISIONING, history->at(1).phase());
  EXPECT_EQ(ResourceStatus::RUNNING, history->at(2).phase());

  EXPECT_LT(history->at(0).sequence(), history->at(1).sequence());
  EXPECT_LT(history->at(1).sequence(), history->at(2).sequence());
  EXPECT_EQ(version, history->at(2).version());
}


TEST_F(ResourceStoreTest, Watch)
{
  ResourceStore store;

  vector<Resource> written;

  AWAIT_READY(store.watch([&written](const Resource& resource) {
    written.push_back(resource);
  }));

  Future<Resource> resource = store.putSpec(createContainerInfo("train"));
  AWAIT_READY(resource);

  AWAIT_READY(store.remove(resource->id()));

  // The callback is invoked within the store, which has processed
  // both writes by now.
  AWAIT_READY(store.get(resource->id()));

  ASSERT_EQ(2u, written.size());
  EXPECT_EQ(ResourceStatus::PENDING, written[0].status().phase());
  EXPECT_EQ(ResourceStatus::TERMINATING, written[1].status().phase());
}


// Records written to a durable store survive a restart.
TEST_F(ResourceStoreTest, Recover)
{
  const string workDir = path::join(sandbox.get(), "work");

  Option<ResourceID> resourceId;

  {
    ResourceStore store(workDir);
    AWAIT_READY(store.recover());

    Future<Resource> resource =
      store.putSpec(createServiceInfo("serve", 1, 3));

    AWAIT_READY(resource);

    resourceId = resource->id();

    ResourceStatus status = resource->status();
    status.set_phase(ResourceStatus::RUNNING);
    status.set_observed_generation(1);
    status.set_target_instances(2);

    AWAIT_READY(store.updateStatus(resource->id(), status, 1));
  }

  EXPECT_TRUE(os::exists(
      store::paths::getResourcePath(workDir, resourceId.get())));

  ResourceStore store(workDir);
  AWAIT_READY(store.recover());

  Future<Option<Resource>> get = store.get(resourceId.get());
  AWAIT_READY(get);
  ASSERT_SOME(get.get());
  EXPECT_EQ(2u, get->get().version());
  EXPECT_EQ(ResourceStatus::RUNNING, get->get().status().phase());
  EXPECT_EQ(2u, get->get().status().target_instances());

  // The recovered record keeps its identity.
  Future<Resource> resource = store.putSpec(createServiceInfo("serve", 1, 3));
  AWAIT_READY(resource);
  EXPECT_EQ(resourceId.get(), resource->id());
  EXPECT_EQ(2u, resource->version());
}

} // namespace tests {
} // namespace internal {
} // namespace stratus {
