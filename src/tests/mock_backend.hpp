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

#ifndef __TESTS_MOCK_BACKEND_HPP__
#define __TESTS_MOCK_BACKEND_HPP__

#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <stratus/stratus.hpp>

#include <stratus/placement/backend.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/check.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "placement/local.hpp"

namespace stratus {
namespace internal {
namespace tests {

// Placement backend whose calls are forwarded to a `LocalBackend`
// unless a test sets its own expectations.
class MockBackend : public stratus::placement::Backend
{
public:
  explicit MockBackend(const LocalPlatforms& platforms)
  {
    Try<placement::LocalBackend*> create =
      placement::LocalBackend::create(platforms);

    CHECK_SOME(create);

    local.reset(create.get());

    ON_CALL(*this, platforms())
      .WillByDefault(testing::Invoke(
          local.get(), &placement::LocalBackend::platforms));
    EXPECT_CALL(*this, platforms())
      .WillRepeatedly(testing::DoDefault());

    ON_CALL(*this, queryCapacity(testing::_, testing::_))
      .WillByDefault(testing::Invoke(
          local.get(), &placement::LocalBackend::queryCapacity));
    EXPECT_CALL(*this, queryCapacity(testing::_, testing::_))
      .WillRepeatedly(testing::DoDefault());

    ON_CALL(*this, provision(testing::_))
      .WillByDefault(testing::Invoke(
          local.get(), &placement::LocalBackend::provision));
    EXPECT_CALL(*this, provision(testing::_))
      .WillRepeatedly(testing::DoDefault());

    ON_CALL(*this, terminate(testing::_))
      .WillByDefault(testing::Invoke(
          local.get(), &placement::LocalBackend::terminate));
    EXPECT_CALL(*this, terminate(testing::_))
      .WillRepeatedly(testing::DoDefault());

    ON_CALL(*this, healthCheck(testing::_))
      .WillByDefault(testing::Invoke(
          local.get(), &placement::LocalBackend::healthCheck));
    EXPECT_CALL(*this, healthCheck(testing::_))
      .WillRepeatedly(testing::DoDefault());

    ON_CALL(*this, inflight(testing::_))
      .WillByDefault(testing::Invoke(
          local.get(), &placement::LocalBackend::inflight));
    EXPECT_CALL(*this, inflight(testing::_))
      .WillRepeatedly(testing::DoDefault());
  }

  virtual ~MockBackend() {}

  MOCK_METHOD0(platforms, process::Future<std::vector<PlatformInfo>>());

  MOCK_METHOD2(queryCapacity, process::Future<Capacity>(
      const std::string&,
      const std::string&));

  MOCK_METHOD1(provision, process::Future<std::vector<Instance>>(
      const ProvisionRequest&));

  MOCK_METHOD1(terminate, process::Future<Nothing>(const InstanceID&));

  MOCK_METHOD1(healthCheck, process::Future<HealthStatus>(
      const InstanceID&));

  MOCK_METHOD1(inflight, process::Future<size_t>(const InstanceID&));

  process::Owned<placement::LocalBackend> local;
};

} // namespace tests {
} // namespace internal {
} // namespace stratus {

#endif // __TESTS_MOCK_BACKEND_HPP__
