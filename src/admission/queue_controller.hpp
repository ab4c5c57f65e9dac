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


#ifndef __ADMISSION_QUEUE_CONTROLLER_HPP__
#define __ADMISSION_QUEUE_CONTROLLER_HPP__

#include <ostream>
#include <string>
#include <vector>

#include <stratus/stratus.hpp>

#include <process/future.hpp>

#include <stout/nothing.hpp>
#include <stout/option.hpp>

namespace stratus {
namespace internal {
namespace admission {

// Forward declaration.
class QueueAdmissionControllerProcess;


struct Admission
{
  enum Status
  {
    ADMITTED,
    WAITING
  };

  static Admission admitted() { return Admission(ADMITTED, 0); }
  static Admission waiting(size_t position)
  {
    return Admission(WAITING, position);
  }

  Admission() : status(WAITING), position(0) {}

  Admission(Status _status, size_t _position)
    : status(_status), position(_position) {}

  Status status;

  // 1-based position among the waiters; zero once admitted.
  size_t position;
};


inline bool operator==(const Admission& left, const Admission& right)
{
  return left.status == right.status && left.position == right.position;
}


std::ostream& operator<<(std::ostream& stream, const Admission& admission);


// Snapshot of a single queue.
struct QueueState
{
  Option<ResourceID> holder;
  std::vector<ResourceID> waiters;
};


// Serializes access to named FIFO queues: at most one resource holds
// a queue at a time, the others wait in arrival order. All operations
// on all queues are processed by a single actor, which is what gives
// each queue its strict FIFO order.
class QueueAdmissionController
{
public:
  QueueAdmissionController();
  virtual ~QueueAdmissionController();

  // Admits the resource if the queue is free (or already held by the
  // resource), otherwise appends it to the waiters unless it waits
  // already. Fails if the resource is a member of another queue.
  process::Future<Admission> enqueue(
      const std::string& queue,
      const ResourceID& resourceId);

  // Releases the queue if the resource holds it and promotes the next
  // waiter (if any), which is returned. Releasing a queue that the
  // resource does not hold is a no-op.
  process::Future<Option<ResourceID>> release(
      const std::string& queue,
      const ResourceID& resourceId);

  // Removes the resource from the queue: a holder releases it, a
  // waiter leaves without disturbing the order of the others. Returns
  // the promoted waiter, if any.
  process::Future<Option<ResourceID>> withdraw(
      const std::string& queue,
      const ResourceID& resourceId);

  // Re-establishes the holder of a queue after a restart.
  process::Future<Nothing> recover(
      const std::string& queue,
      const ResourceID& resourceId);

  process::Future<QueueState> state(const std::string& queue);

private:
  QueueAdmissionController(const QueueAdmissionController&) = delete;
  QueueAdmissionController& operator=(
      const QueueAdmissionController&) = delete;

  QueueAdmissionControllerProcess* process;
};

} // namespace admission {
} // namespace internal {
} // namespace stratus {

#endif // __ADMISSION_QUEUE_CONTROLLER_HPP__
