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

#ifndef __ENGINE_FLAGS_HPP__
#define __ENGINE_FLAGS_HPP__

#include <stdint.h>

#include <string>

#include <stout/duration.hpp>
#include <stout/flags.hpp>
#include <stout/option.hpp>

#include "logging/flags.hpp"

#include "messages/flags.pb.h"

namespace stratus {
namespace internal {
namespace engine {

class Flags : public virtual logging::Flags
{
public:
  Flags();

  Option<std::string> work_dir;
  size_t workers;
  Duration resync_interval;
  Duration autoscale_interval;
  Duration poll_interval;
  Duration lease_timeout;
  uint32_t max_retries;
  Duration retry_backoff_factor;
  Duration max_retry_backoff;
  Duration drain_timeout;
  Duration provision_timeout;
  uint32_t autoscale_step;
  Duration autoscale_cooldown;
  Duration metric_window;
  size_t max_status_history;
  Option<AcceleratorCatalog> accelerators;
  Option<LocalPlatforms> platforms;
  Option<ResourceInfos> resources;
};

} // namespace engine {
} // namespace internal {
} // namespace stratus {

#endif // __ENGINE_FLAGS_HPP__
