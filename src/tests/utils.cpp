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

#include "tests/utils.hpp"

#include <process/check.hpp>
#include <process/future.hpp>

#include <process/metrics/metrics.hpp>

#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/try.hpp>
#include <stout/uuid.hpp>

#include <stout/os/realpath.hpp>

#include "common/protobuf_utils.hpp"

using std::string;
using std::vector;

using process::Future;

namespace stratus {
namespace internal {
namespace tests {

void TemporaryDirectoryTest::SetUp()
{
  // Save the current working directory.
  cwd = os::getcwd();

  // Create a temporary directory for the test.
  Try<string> directory = os::mkdtemp();

  ASSERT_SOME(directory) << "Failed to mkdtemp";

  // We get the `realpath` of the temporary directory because some
  // platforms, like macOS, symlink `/tmp` to `/private/var`.
  Result<string> realpath = os::realpath(directory.get());
  ASSERT_SOME(realpath);

  sandbox = realpath.get();

  // Run the test out of the temporary directory we created.
  ASSERT_SOME(os::chdir(sandbox.get()))
    << "Failed to chdir into '" << sandbox.get() << "'";
}


void TemporaryDirectoryTest::TearDown()
{
  // Return to previous working directory and cleanup the sandbox.
  ASSERT_SOME(os::chdir(cwd));

  if (sandbox.isSome()) {
    ASSERT_SOME(os::rmdir(sandbox.get()));
  }
}


hashmap<string, double> Metrics()
{
  Future<hashmap<string, double>> snapshot =
    process::metrics::snapshot(None());

  snapshot.await();

  CHECK_READY(snapshot);

  return snapshot.get();
}


LocalPlatforms createPlatforms(
    const string& platform,
    const string& zone,
    const hashmap<string, uint32_t>& accelerators,
    uint32_t cpus)
{
  LocalPlatforms platforms;

  LocalPlatforms::Platform* platform_ = platforms.add_platforms();
  platform_->set_name(platform);

  LocalPlatforms::Zone* zone_ = platform_->add_zones();
  zone_->set_name(zone);
  zone_->set_cpus(cpus);

  foreachpair (const string& type, uint32_t count, accelerators) {
    LocalPlatforms::Zone::Accelerator* accelerator =
      zone_->add_accelerators();
    accelerator->set_type(type);
    accelerator->set_count(count);
  }

  return platforms;
}


ContainerTemplate createContainerTemplate(const vector<string>& accelerators)
{
  ContainerTemplate container;
  container.set_image("registry.example.com/trainer:latest");
  container.set_command("python");
  container.add_arguments("train.py");

  foreach (const string& accelerator, accelerators) {
    container.add_accelerators(accelerator);
  }

  return container;
}


ResourceInfo createContainerInfo(
    const string& name,
    const vector<string>& accelerators,
    const Option<string>& queue)
{
  ResourceInfo info;
  info.set_name(name);
  info.set_namespace_("default");
  info.set_owner("alice");
  info.set_kind(ResourceInfo::CONTAINER);
  info.mutable_container()->CopyFrom(createContainerTemplate(accelerators));

  if (queue.isSome()) {
    info.set_queue(queue.get());
  }

  return info;
}


ResourceInfo createServiceInfo(
    const string& name,
    uint32_t minContainers,
    uint32_t maxContainers,
    const Option<ScalePolicy>& scale)
{
  ResourceInfo info;
  info.set_name(name);
  info.set_namespace_("default");
  info.set_owner("alice");
  info.set_kind(ResourceInfo::SERVICE);

  Service* service = info.mutable_service();
  service->mutable_container()->CopyFrom(createContainerTemplate());
  service->set_min_containers(minContainers);
  service->set_max_containers(maxContainers);

  if (scale.isSome()) {
    service->mutable_scale()->CopyFrom(scale.get());
  }

  return info;
}


ResourceInfo createProcessorInfo(
    const string& name,
    const string& stream,
    uint32_t minWorkers,
    uint32_t maxWorkers,
    const Option<ScalePolicy>& scale)
{
  ResourceInfo info;
  info.set_name(name);
  info.set_namespace_("default");
  info.set_owner("alice");
  info.set_kind(ResourceInfo::PROCESSOR);

  Processor* processor = info.mutable_processor();
  processor->set_stream(stream);
  processor->mutable_container()->CopyFrom(createContainerTemplate());
  processor->set_min_workers(minWorkers);
  processor->set_max_workers(maxWorkers);

  if (scale.isSome()) {
    processor->mutable_scale()->CopyFrom(scale.get());
  }

  return info;
}


ResourceInfo createClusterInfo(
    const string& name,
    uint32_t nodes,
    const vector<string>& accelerators)
{
  ResourceInfo info;
  info.set_name(name);
  info.set_namespace_("default");
  info.set_owner("alice");
  info.set_kind(ResourceInfo::CLUSTER);

  Cluster* cluster = info.mutable_cluster();
  cluster->set_num_nodes(nodes);
  cluster->mutable_container()->CopyFrom(
      createContainerTemplate(accelerators));

  return info;
}


ScaleRule createScaleRule(
    double threshold,
    const Duration& dwell,
    const Option<uint32_t>& step)
{
  ScaleRule rule;
  rule.set_threshold(threshold);
  rule.mutable_dwell()->CopyFrom(protobuf::createDurationInfo(dwell));

  if (step.isSome()) {
    rule.set_step(step.get());
  }

  return rule;
}


Resource createResource(const ResourceInfo& info)
{
  Resource resource;
  resource.mutable_id()->set_value(id::UUID::random().toString());
  resource.mutable_info()->CopyFrom(info);
  resource.set_generation(1);
  resource.set_version(1);
  resource.mutable_status()->set_phase(ResourceStatus::PENDING);
  return resource;
}


vector<Instance> getInstances(
    const Resource& resource,
    const Instance::Phase& phase)
{
  vector<Instance> result;
  foreach (const Instance& instance, resource.status().instances()) {
    if (instance.phase() == phase) {
      result.push_back(instance);
    }
  }
  return result;
}

} // namespace tests {
} // namespace internal {
} // namespace stratus {
