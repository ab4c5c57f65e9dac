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

#include <stout/foreach.hpp>
#include <stout/unreachable.hpp>

#include "common/protobuf_utils.hpp"
#include "common/resource_utils.hpp"

namespace stratus {
namespace internal {
namespace resources {

const ContainerTemplate& getContainer(const ResourceInfo& info)
{
  switch (info.kind()) {
    case ResourceInfo::CONTAINER:
      return info.container();
    case ResourceInfo::PROCESSOR:
      return info.processor().container();
    case ResourceInfo::SERVICE:
      return info.service().container();
    case ResourceInfo::CLUSTER:
      return info.cluster().container();
    case ResourceInfo::UNKNOWN:
      break;
  }

  return ContainerTemplate::default_instance();
}


bool isElastic(const ResourceInfo& info)
{
  return info.kind() == ResourceInfo::PROCESSOR ||
    info.kind() == ResourceInfo::SERVICE;
}


uint32_t getMinInstances(const ResourceInfo& info)
{
  switch (info.kind()) {
    case ResourceInfo::CONTAINER:
      return 1;
    case ResourceInfo::PROCESSOR:
      return info.processor().min_workers();
    case ResourceInfo::SERVICE:
      return info.service().min_containers();
    case ResourceInfo::CLUSTER:
      return info.cluster().num_nodes();
    case ResourceInfo::UNKNOWN:
      return 0;
  }

  UNREACHABLE();
}


uint32_t getMaxInstances(const ResourceInfo& info)
{
  switch (info.kind()) {
    case ResourceInfo::CONTAINER:
      return 1;
    case ResourceInfo::PROCESSOR:
      return info.processor().max_workers();
    case ResourceInfo::SERVICE:
      return info.service().max_containers();
    case ResourceInfo::CLUSTER:
      return info.cluster().num_nodes();
    case ResourceInfo::UNKNOWN:
      return 0;
  }

  UNREACHABLE();
}


Option<ScalePolicy> getScalePolicy(const ResourceInfo& info)
{
  if (info.kind() == ResourceInfo::PROCESSOR &&
      info.processor().has_scale()) {
    return info.processor().scale();
  }

  if (info.kind() == ResourceInfo::SERVICE && info.service().has_scale()) {
    return info.service().scale();
  }

  return None();
}


uint32_t getInitialTarget(const ResourceInfo& info)
{
  // An elastic resource that may scale to zero still starts with one
  // instance; the `zero` rule takes it down once the metric allows.
  return std::min(
      std::max(getMinInstances(info), 1u),
      getMaxInstances(info));
}


uint32_t getRequiredInstances(
    const ResourceInfo& info,
    const ResourceStatus& status)
{
  if (!isElastic(info)) {
    return getMinInstances(info);
  }

  uint32_t target = status.has_target_instances()
    ? status.target_instances()
    : getInitialTarget(info);

  return std::min(
      std::max(target, getMinInstances(info)),
      getMaxInstances(info));
}


bool isScalingChange(const ResourceInfo& left, const ResourceInfo& right)
{
  if (left.kind() != right.kind() || !isElastic(left)) {
    return false;
  }

  ResourceInfo left_ = left;
  ResourceInfo right_ = right;

  if (left.kind() == ResourceInfo::PROCESSOR) {
    left_.mutable_processor()->clear_min_workers();
    left_.mutable_processor()->clear_max_workers();
    left_.mutable_processor()->clear_scale();
    right_.mutable_processor()->clear_min_workers();
    right_.mutable_processor()->clear_max_workers();
    right_.mutable_processor()->clear_scale();
  } else {
    left_.mutable_service()->clear_min_containers();
    left_.mutable_service()->clear_max_containers();
    left_.mutable_service()->clear_scale();
    right_.mutable_service()->clear_min_containers();
    right_.mutable_service()->clear_max_containers();
    right_.mutable_service()->clear_scale();
  }

  return left_ == right_;
}


Duration getDrainTimeout(
    const ResourceInfo& info,
    const Duration& defaultTimeout)
{
  if (info.has_drain_timeout()) {
    return protobuf::getDuration(info.drain_timeout());
  }

  return defaultTimeout;
}


uint32_t countActiveInstances(const ResourceStatus& status)
{
  uint32_t count = 0;
  foreach (const Instance& instance, status.instances()) {
    if (instance.phase() == Instance::PROVISIONING ||
        instance.phase() == Instance::RUNNING) {
      count++;
    }
  }
  return count;
}

} // namespace resources {
} // namespace internal {
} // namespace stratus {
