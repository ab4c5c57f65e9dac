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

#include <glog/logging.h>

#include <process/clock.hpp>

#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/unreachable.hpp>

#include "common/protobuf_utils.hpp"

using std::string;

using process::Clock;
using process::Time;

namespace stratus {
namespace internal {
namespace protobuf {

UnionValidator::UnionValidator(const google::protobuf::Descriptor* descriptor)
{
  const auto* kindFieldDescriptor = descriptor->FindFieldByName("kind");
  CHECK_NOTNULL(kindFieldDescriptor);

  kindDescriptor_ = kindFieldDescriptor->enum_type();
  CHECK_NOTNULL(kindDescriptor_);

  const auto* unknownKindValueDescriptor =
    kindDescriptor_->FindValueByNumber(0);
  if (unknownKindValueDescriptor != nullptr) {
    CHECK_EQ(unknownKindValueDescriptor->name(), "UNKNOWN");
  }

  for (int index = 0; index < kindDescriptor_->value_count(); index++) {
    const auto* kindValueDescriptor = kindDescriptor_->value(index);
    if (kindValueDescriptor->number() == 0) {
      // We are skipping the "UNKNOWN" value of the enum.
      continue;
    }

    const auto* fieldDescriptor =
      descriptor->FindFieldByName(strings::lower(kindValueDescriptor->name()));

    CHECK_NOTNULL(fieldDescriptor);
    unionFieldDescriptors_.emplace_back(
        kindValueDescriptor->number(), fieldDescriptor);
  }
}


Option<Error> UnionValidator::validate(
  const int messageTypeNumber, const google::protobuf::Message& message) const
{
  const auto* descr = kindDescriptor_->FindValueByNumber(messageTypeNumber);
  const string kind =
    descr == nullptr ? string("<UNKNOWN>") : string(descr->name());

  if (descr == nullptr || messageTypeNumber == 0) {
    return Error(
        "Protobuf union `" + string(message.GetDescriptor()->full_name()) +
        "` has an unknown kind " + stringify(messageTypeNumber));
  }

  const auto* reflection = message.GetReflection();
  for (const auto& item : unionFieldDescriptors_) {
    const auto kindNumber = item.first;
    const auto* fieldDescriptor = item.second;
    const bool set = reflection->HasField(message, fieldDescriptor);

    if (messageTypeNumber == kindNumber && !set) {
      return Error(
          "Protobuf union `" + string(message.GetDescriptor()->full_name()) +
          "` with `Kind == " + kind + "` must have the field `" +
          string(fieldDescriptor->name()) + "` set.");
    }

    if (messageTypeNumber != kindNumber && set) {
      return Error(
          "Protobuf union `" + string(message.GetDescriptor()->full_name()) +
          "` with `Kind == " + kind + "` should not have the field `" +
          string(fieldDescriptor->name()) + "` set.");
    }
  }

  return None();
}


TimeInfo getCurrentTime()
{
  return createTimeInfo(Clock::now());
}


TimeInfo createTimeInfo(const Time& time)
{
  TimeInfo timeInfo;
  timeInfo.set_nanoseconds(time.duration().ns());
  return timeInfo;
}


Time getTime(const TimeInfo& timeInfo)
{
  return Time::epoch() + Nanoseconds(timeInfo.nanoseconds());
}


DurationInfo createDurationInfo(const Duration& duration)
{
  DurationInfo durationInfo;
  durationInfo.set_nanoseconds(duration.ns());
  return durationInfo;
}


Duration getDuration(const DurationInfo& durationInfo)
{
  return Nanoseconds(durationInfo.nanoseconds());
}


bool isTerminalPhase(const ResourceStatus::Phase& phase)
{
  switch (phase) {
    case ResourceStatus::TERMINATED:
    case ResourceStatus::FAILED:
      return true;
    case ResourceStatus::UNKNOWN:
    case ResourceStatus::PENDING:
    case ResourceStatus::QUEUED:
    case ResourceStatus::SCHEDULING:
    case ResourceStatus::PROVISIONING:
    case ResourceStatus::RUNNING:
    case ResourceStatus::DRAINING:
    case ResourceStatus::TERMINATING:
      return false;
  }

  UNREACHABLE();
}

} // namespace protobuf {
} // namespace internal {
} // namespace stratus {
