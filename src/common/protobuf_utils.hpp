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


#ifndef __PROTOBUF_UTILS_HPP__
#define __PROTOBUF_UTILS_HPP__

#include <string>
#include <utility>
#include <vector>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

#include <stratus/stratus.hpp>

#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/error.hpp>
#include <stout/option.hpp>

namespace stratus {
namespace internal {
namespace protobuf {

// Internal helper class for protobuf union validation.
class UnionValidator
{
public:
  UnionValidator(const google::protobuf::Descriptor*);
  Option<Error> validate(
      const int messageTypeNumber, const google::protobuf::Message&) const;

private:
  std::vector<std::pair<int, const google::protobuf::FieldDescriptor*>>
    unionFieldDescriptors_;
  const google::protobuf::EnumDescriptor* kindDescriptor_;
};

//
// A message is a "protobuf union" if, and only if,
// the following requirements are satisfied:
// 1. It has a required field named `kind` of an enum type.
// 2. A member of this enum with a number (not index!) of 0
//    either is named "UNKNOWN" or does not exist.
// 3. For each other member of this enum there is an optional field
//    in the message with an exactly matching name in lowercase.
//
// A "protobuf union" is valid if, and only if, the field matching
// the value of `kind` is set and none of the other union fields are.
//
template <typename Message>
Option<Error> validateProtobufUnion(const Message& message)
{
  static const UnionValidator validator(Message::descriptor());
  return validator.validate(message.kind(), message);
}


// Returns the current time as known by the libprocess clock, which
// lets tests control every timestamp the engine writes.
TimeInfo getCurrentTime();


TimeInfo createTimeInfo(const process::Time& time);


process::Time getTime(const TimeInfo& timeInfo);


DurationInfo createDurationInfo(const Duration& duration);


Duration getDuration(const DurationInfo& durationInfo);


// Returns true if the phase is `TERMINATED` or `FAILED`.
bool isTerminalPhase(const ResourceStatus::Phase& phase);

} // namespace protobuf {
} // namespace internal {
} // namespace stratus {

#endif // __PROTOBUF_UTILS_HPP__
