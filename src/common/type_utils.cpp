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


#include <ostream>

#include <google/protobuf/util/message_differencer.h>

#include <stratus/stratus.hpp>
#include <stratus/type_utils.hpp>

using std::ostream;

using google::protobuf::util::MessageDifferencer;

namespace stratus {

bool operator==(
    const AcceleratorAllocation& left,
    const AcceleratorAllocation& right)
{
  return left.type() == right.type() &&
    left.count() == right.count() &&
    left.zone() == right.zone();
}


bool operator==(const ContainerTemplate& left, const ContainerTemplate& right)
{
  // NOTE: The order of accelerator requests and platform preferences
  // is significant, so a plain field-by-field comparison is what we
  // want here.
  return MessageDifferencer::Equals(left, right);
}


bool operator==(const ResourceInfo& left, const ResourceInfo& right)
{
  return MessageDifferencer::Equals(left, right);
}


bool operator==(const ResourceStatus& left, const ResourceStatus& right)
{
  return MessageDifferencer::Equals(left, right);
}


ostream& operator<<(ostream& stream, const ResourceID& resourceId)
{
  return stream << resourceId.value();
}


ostream& operator<<(ostream& stream, const InstanceID& instanceId)
{
  return stream << instanceId.value();
}


ostream& operator<<(ostream& stream, const AcceleratorAllocation& allocation)
{
  if (allocation.count() == 0) {
    stream << "cpu";
  } else {
    stream << allocation.count() << ":" << allocation.type();
  }

  if (allocation.has_zone()) {
    stream << "@" << allocation.zone();
  }

  return stream;
}


ostream& operator<<(ostream& stream, const ResourceInfo::Kind& kind)
{
  return stream << ResourceInfo::Kind_Name(kind);
}


ostream& operator<<(ostream& stream, const ResourceStatus::Phase& phase)
{
  return stream << ResourceStatus::Phase_Name(phase);
}


ostream& operator<<(ostream& stream, const Instance::Phase& phase)
{
  return stream << Instance::Phase_Name(phase);
}


ostream& operator<<(ostream& stream, const HealthStatus& health)
{
  return stream << HealthStatus_Name(health);
}

} // namespace stratus {
