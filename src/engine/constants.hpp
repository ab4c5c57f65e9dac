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

#ifndef __ENGINE_CONSTANTS_HPP__
#define __ENGINE_CONSTANTS_HPP__

#include <stddef.h>
#include <stdint.h>

#include <stout/duration.hpp>

namespace stratus {
namespace internal {
namespace engine {

// Number of reconciliation workers running in parallel.
constexpr size_t DEFAULT_WORKERS = 4;

// Period of the full resync sweep, which catches up on any store
// notification that was missed.
constexpr Duration DEFAULT_RESYNC_INTERVAL = Seconds(30);

// Period at which running elastic resources are handed to the
// autoscaler.
constexpr Duration DEFAULT_AUTOSCALE_INTERVAL = Seconds(5);

// Period at which resources waiting on something outside of the
// engine (capacity, health, drains) are looked at again.
constexpr Duration DEFAULT_POLL_INTERVAL = Seconds(2);

// Time after which the execution lease of a resource is reclaimed
// from a worker that has not finished reconciling it.
constexpr Duration DEFAULT_LEASE_TIMEOUT = Minutes(5);

constexpr uint32_t DEFAULT_MAX_RETRIES = 5;

// Backoff after the first transient failure; doubled on every
// subsequent one up to `DEFAULT_MAX_RETRY_BACKOFF`.
constexpr Duration DEFAULT_RETRY_BACKOFF_FACTOR = Seconds(2);
constexpr Duration DEFAULT_MAX_RETRY_BACKOFF = Minutes(2);

constexpr Duration DEFAULT_DRAIN_TIMEOUT = Minutes(5);

constexpr Duration DEFAULT_PROVISION_TIMEOUT = Minutes(10);

constexpr uint32_t DEFAULT_AUTOSCALE_STEP = 1;

constexpr Duration DEFAULT_AUTOSCALE_COOLDOWN = Seconds(30);

constexpr Duration DEFAULT_METRIC_WINDOW = Minutes(15);

// Status updates retained per resource.
constexpr size_t DEFAULT_MAX_STATUS_HISTORY = 100;

} // namespace engine {
} // namespace internal {
} // namespace stratus {

#endif // __ENGINE_CONSTANTS_HPP__
