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

#include <process/metrics/metrics.hpp>

#include "reconciler/metrics.hpp"

namespace stratus {
namespace internal {
namespace reconciler {

Metrics::Metrics()
  : reconciliations("reconciler/reconciliations"),
    conflicts("reconciler/conflicts"),
    lease_expirations("reconciler/lease_expirations"),
    pending("reconciler/pending")
{
  process::metrics::add(reconciliations);
  process::metrics::add(conflicts);
  process::metrics::add(lease_expirations);
  process::metrics::add(pending);
}


Metrics::~Metrics()
{
  process::metrics::remove(reconciliations);
  process::metrics::remove(conflicts);
  process::metrics::remove(lease_expirations);
  process::metrics::remove(pending);
}

} // namespace reconciler {
} // namespace internal {
} // namespace stratus {
