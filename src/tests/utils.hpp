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

#ifndef __TESTS_UTILS_HPP__
#define __TESTS_UTILS_HPP__

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <stratus/stratus.hpp>

#include <stout/duration.hpp>
#include <stout/hashmap.hpp>
#include <stout/option.hpp>

#include "messages/flags.pb.h"

namespace stratus {
namespace internal {
namespace tests {

// Test fixture for creating a temporary directory for each test.
class TemporaryDirectoryTest : public ::testing::Test
{
protected:
  virtual void SetUp();
  virtual void TearDown();

  Option<std::string> sandbox;

private:
  std::string cwd;
};


// Get the metrics snapshot.
hashmap<std::string, double> Metrics();


// A single platform with a single zone offering `accelerators` (e.g.
// {"A100_SXM", 8}) and `cpus` CPU-only instance slots.
LocalPlatforms createPlatforms(
    const std::string& platform,
    const std::string& zone,
    const hashmap<std::string, uint32_t>& accelerators,
    uint32_t cpus = 16);


ContainerTemplate createContainerTemplate(
    const std::vector<std::string>& accelerators =
      std::vector<std::string>());


ResourceInfo createContainerInfo(
    const std::string& name,
    const std::vector<std::string>& accelerators =
      std::vector<std::string>(),
    const Option<std::string>& queue = None());


ResourceInfo createServiceInfo(
    const std::string& name,
    uint32_t minContainers,
    uint32_t maxContainers,
    const Option<ScalePolicy>& scale = None());


ResourceInfo createProcessorInfo(
    const std::string& name,
    const std::string& stream,
    uint32_t minWorkers,
    uint32_t maxWorkers,
    const Option<ScalePolicy>& scale = None());


ResourceInfo createClusterInfo(
    const std::string& name,
    uint32_t nodes,
    const std::vector<std::string>& accelerators =
      std::vector<std::string>());


ScaleRule createScaleRule(
    double threshold,
    const Duration& dwell,
    const Option<uint32_t>& step = None());


// Wraps the spec into a freshly declared resource, as the Resource
// Store would.
Resource createResource(const ResourceInfo& info);


// Returns the instances of the resource in the given phase.
std::vector<Instance> getInstances(
    const Resource& resource,
    const Instance::Phase& phase);

} // namespace tests {
} // namespace internal {
} // namespace stratus {

#endif // __TESTS_UTILS_HPP__
