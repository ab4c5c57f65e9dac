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

#include "tests/flags.hpp"

namespace stratus {
namespace internal {
namespace tests {

// Storage for the flags.
Flags flags;


Flags::Flags()
{
  // We log to stderr by default, but when running tests we'd prefer
  // less junk to fly by, so force one to specify the verbosity.
  add(&Flags::verbose,
      "verbose",
      "Log all severity levels to stderr",
      false);

  // NOTE: The default await timeout matches process::TEST_AWAIT_TIMEOUT,
  // but we can't use that value directly due to static initializer ordering.
  add(&Flags::test_await_timeout,
      "test_await_timeout",
      "The default timeout for awaiting test events.",
      Seconds(15));
}

} // namespace tests {
} // namespace internal {
} // namespace stratus {
