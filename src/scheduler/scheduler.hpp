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


#ifndef __SCHEDULER_SCHEDULER_HPP__
#define __SCHEDULER_SCHEDULER_HPP__

#include <ostream>
#include <string>
#include <vector>

#include <stratus/stratus.hpp>

#include <stratus/placement/backend.hpp>

#include <process/future.hpp>

#include <stout/error.hpp>
#include <stout/try.hpp>

namespace stratus {
namespace internal {
namespace scheduler {

// Forward declaration.
class SchedulerProcess;


// Instances provisioned for a resource by a single placement.
struct Placement
{
  std::string platform;
  AcceleratorAllocation allocation;
  std::vector<Instance> instances;
};


class PlacementError : public Error
{
public:
  enum Type
  {
    // No candidate platform has enough capacity right now. Expected
    // to clear up eventually; retried without consuming retries.
    NO_CAPACITY,

    // The request can never be satisfied as declared.
    INVALID,

    // The backend failed; subject to the retry policy.
    TRANSIENT
  };

  PlacementError(Type _type, const std::string& message)
    : Error(message), type(_type) {}

  const Type type;
};


std::ostream& operator<<(std::ostream& stream, const PlacementError& error);


// Selects a platform, accelerator option and zone for a resource and
// provisions its instances there.
//
// Candidate platforms are, in order: the pinned platform, else the
// platform preferences, else every platform offering one of the
// requested accelerator types. The first candidate (and accelerator
// option) with enough capacity in a single zone wins. Capacity query
// failures skip the candidate; provisioning failures do not fail over
// to the next candidate.
//
// A Cluster is placed as a whole, with all of its nodes co-located in
// one zone. Every other kind is placed one instance at a time.
class Scheduler
{
public:
  // The backend must outlive the scheduler.
  explicit Scheduler(stratus::placement::Backend* backend);

  virtual ~Scheduler();

  process::Future<Try<Placement, PlacementError>> place(
      const Resource& resource);

private:
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  SchedulerProcess* process;
};

} // namespace scheduler {
} // namespace internal {
} // namespace stratus {

#endif // __SCHEDULER_SCHEDULER_HPP__
