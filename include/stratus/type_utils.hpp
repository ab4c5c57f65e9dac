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


#ifndef __STRATUS_TYPE_UTILS_HPP__
#define __STRATUS_TYPE_UTILS_HPP__

#include <ostream>

#include <boost/functional/hash.hpp>

#include <stratus/stratus.pb.h>

// This file includes definitions for operators on public protobuf
// classes (defined in stratus.proto) that don't have these operators
// generated by the protobuf compiler.

namespace stratus {

bool operator==(const AcceleratorAllocation& left,
                const AcceleratorAllocation& right);
bool operator==(const ContainerTemplate& left, const ContainerTemplate& right);
bool operator==(const ResourceInfo& left, const ResourceInfo& right);
bool operator==(const ResourceStatus& left, const ResourceStatus& right);


inline bool operator==(const ResourceID& left, const ResourceID& right)
{
  return left.value() == right.value();
}


inline bool operator==(const InstanceID& left, const InstanceID& right)
{
  return left.value() == right.value();
}


inline bool operator==(const TimeInfo& left, const TimeInfo& right)
{
  return left.nanoseconds() == right.nanoseconds();
}


inline bool operator==(const DurationInfo& left, const DurationInfo& right)
{
  return left.nanoseconds() == right.nanoseconds();
}


inline bool operator!=(const ResourceID& left, const ResourceID& right)
{
  return !(left == right);
}


inline bool operator!=(const InstanceID& left, const InstanceID& right)
{
  return !(left == right);
}


inline bool operator!=(const ResourceInfo& left, const ResourceInfo& right)
{
  return !(left == right);
}


inline bool operator!=(const ResourceStatus& left, const ResourceStatus& right)
{
  return !(left == right);
}


inline bool operator<(const ResourceID& left, const ResourceID& right)
{
  return left.value() < right.value();
}


inline bool operator<(const InstanceID& left, const InstanceID& right)
{
  return left.value() < right.value();
}


std::ostream& operator<<(std::ostream& stream, const ResourceID& resourceId);
std::ostream& operator<<(std::ostream& stream, const InstanceID& instanceId);


std::ostream& operator<<(
    std::ostream& stream,
    const AcceleratorAllocation& allocation);


std::ostream& operator<<(
    std::ostream& stream,
    const ResourceInfo::Kind& kind);


std::ostream& operator<<(
    std::ostream& stream,
    const ResourceStatus::Phase& phase);


std::ostream& operator<<(
    std::ostream& stream,
    const Instance::Phase& phase);


std::ostream& operator<<(std::ostream& stream, const HealthStatus& health);

} // namespace stratus {

namespace std {

template <>
struct hash<stratus::ResourceID>
{
  typedef size_t result_type;

  typedef stratus::ResourceID argument_type;

  result_type operator()(const argument_type& resourceId) const
  {
    size_t seed = 0;
    boost::hash_combine(seed, resourceId.value());
    return seed;
  }
};


template <>
struct hash<stratus::InstanceID>
{
  typedef size_t result_type;

  typedef stratus::InstanceID argument_type;

  result_type operator()(const argument_type& instanceId) const
  {
    size_t seed = 0;
    boost::hash_combine(seed, instanceId.value());
    return seed;
  }
};

} // namespace std {

#endif // __STRATUS_TYPE_UTILS_HPP__
