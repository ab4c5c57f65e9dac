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


#ifndef __COMMON_RESOURCE_UTILS_HPP__
#define __COMMON_RESOURCE_UTILS_HPP__

#include <stratus/stratus.hpp>

#include <stout/duration.hpp>
#include <stout/option.hpp>

namespace stratus {
namespace internal {
namespace resources {

// Returns the container template carried by the payload matching the
// kind of the resource, or the default template if there is none.
const ContainerTemplate& getContainer(const ResourceInfo& info);


// Processors and Services change their instance count at runtime.
bool isElastic(const ResourceInfo& info);


uint32_t getMinInstances(const ResourceInfo& info);


uint32_t getMaxInstances(const ResourceInfo& info);


Option<ScalePolicy> getScalePolicy(const ResourceInfo& info);


// Returns the instance count an elastic resource starts out with.
uint32_t getInitialTarget(const ResourceInfo& info);


// Returns the number of instances the resource needs right now. For
// elastic resources this is the autoscaler target kept in `status`.
uint32_t getRequiredInstances(
    const ResourceInfo& info,
    const ResourceStatus& status);


// Returns true if `left` and `right` only differ in the fields that
// can be applied to running instances, i.e. the replica bounds and
// the scale policy of an elastic resource.
bool isScalingChange(const ResourceInfo& left, const ResourceInfo& right);


Duration getDrainTimeout(
    const ResourceInfo& info,
    const Duration& defaultTimeout);


// Counts instances that are provisioning or running, i.e. the ones
// that make up the current size of the resource.
uint32_t countActiveInstances(const ResourceStatus& status);

} // namespace resources {
} // namespace internal {
} // namespace stratus {

#endif // __COMMON_RESOURCE_UTILS_HPP__
