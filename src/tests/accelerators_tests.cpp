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

#include <gtest/gtest.h>

#include <stratus/stratus.hpp>

#include <stout/gtest.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

#include "common/accelerators.hpp"

#include "tests/utils.hpp"

using std::string;
using std::vector;

using stratus::internal::accelerators::Catalog;
using stratus::internal::accelerators::Request;

namespace stratus {
namespace internal {
namespace tests {

TEST(AcceleratorsTest, Parse)
{
  Try<Request> request = accelerators::parse("2:A100_SXM");
  ASSERT_SOME(request);
  EXPECT_EQ(2u, request->count);
  EXPECT_EQ("A100_SXM", request->type);
  EXPECT_FALSE(request->cpuOnly());
  EXPECT_EQ("2:A100_SXM", stringify(request.get()));

  request = accelerators::parse(" 8 : H100_SXM ");
  ASSERT_SOME(request);
  EXPECT_EQ(Request(8, "H100_SXM"), request.get());

  EXPECT_ERROR(accelerators::parse("A100_SXM"));
  EXPECT_ERROR(accelerators::parse("2:"));
  EXPECT_ERROR(accelerators::parse(":A100_SXM"));
  EXPECT_ERROR(accelerators::parse("0:A100_SXM"));
  EXPECT_ERROR(accelerators::parse("-2:A100_SXM"));
  EXPECT_ERROR(accelerators::parse("two:A100_SXM"));
  EXPECT_ERROR(accelerators::parse("1:2:A100_SXM"));

  // Counts starting with a byte outside of ASCII.
  EXPECT_ERROR(accelerators::parse("\xb2:A100_SXM"));
  EXPECT_ERROR(accelerators::parse("\xef\xbc\x92:A100_SXM"));
}


TEST(AcceleratorsTest, ParseContainer)
{
  Try<vector<Request>> requests =
    accelerators::parse(createContainerTemplate());

  ASSERT_SOME(requests);
  ASSERT_EQ(1u, requests->size());
  EXPECT_TRUE(requests->front().cpuOnly());
  EXPECT_EQ("cpu", stringify(requests->front()));

  requests = accelerators::parse(
      createContainerTemplate({"4:H100_SXM", "8:A100_SXM", "2:L4"}));

  ASSERT_SOME(requests);
  ASSERT_EQ(3u, requests->size());
  EXPECT_EQ(Request(4, "H100_SXM"), requests->at(0));
  EXPECT_EQ(Request(8, "A100_SXM"), requests->at(1));
  EXPECT_EQ(Request(2, "L4"), requests->at(2));

  EXPECT_ERROR(accelerators::parse(
      createContainerTemplate({"4:H100_SXM", "bogus"})));
}


TEST(AcceleratorsTest, Catalog)
{
  Catalog builtin;

  EXPECT_TRUE(builtin.contains("A100_SXM"));
  EXPECT_TRUE(builtin.contains("MI300X"));
  EXPECT_FALSE(builtin.contains("a100_sxm"));

  EXPECT_SOME_EQ(80u, builtin.memory("H100_SXM"));
  EXPECT_SOME_EQ(24u, builtin.memory("L4"));
  EXPECT_NONE(builtin.memory("TPU_V5"));

  EXPECT_NONE(builtin.validate(Request()));
  EXPECT_NONE(builtin.validate(Request(1, "L4")));
  EXPECT_SOME(builtin.validate(Request(1, "TPU_V5")));

  EXPECT_EQ(
      static_cast<size_t>(Catalog::builtin().accelerators_size()),
      builtin.size());

  AcceleratorCatalog custom;
  AcceleratorCatalog::Accelerator* accelerator = custom.add_accelerators();
  accelerator->set_name("TPU_V5");
  accelerator->set_memory(16);

  Catalog catalog(custom);
  EXPECT_EQ(1u, catalog.size());
  EXPECT_TRUE(catalog.contains("TPU_V5"));
  EXPECT_FALSE(catalog.contains("A100_SXM"));
}

} // namespace tests {
} // namespace internal {
} // namespace stratus {
