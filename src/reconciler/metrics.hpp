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

#ifndef __RECONCILER_METRICS_HPP__
#define __RECONCILER_METRICS_HPP__

#include <process/metrics/counter.hpp>
#include <process/metrics/push_gauge.hpp>

namespace stratus {
namespace internal {
namespace reconciler {

// Metrics shared by the reconciler and its workers.
struct Metrics
{
  Metrics();

  ~Metrics();

  process::metrics::Counter reconciliations;
  process::metrics::Counter conflicts;
  process::metrics::Counter lease_expirations;

  // Resources waiting for a worker.
  process::metrics::PushGauge pending;
};

} // namespace reconciler {
} // namespace internal {
} // namespace stratus {

#endif // __RECONCILER_METRICS_HPP__
