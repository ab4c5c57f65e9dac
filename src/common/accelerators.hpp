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


#ifndef __COMMON_ACCELERATORS_HPP__
#define __COMMON_ACCELERATORS_HPP__

#include <ostream>
#include <string>
#include <vector>

#include <stratus/stratus.hpp>

#include <stout/error.hpp>
#include <stout/hashmap.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "messages/flags.pb.h"

namespace stratus {
namespace internal {
namespace accelerators {

// A single accelerator option of a container template. A CPU-only
// request has a zero count and an empty type.
struct Request
{
  Request() : count(0) {}

  Request(uint32_t _count, const std::string& _type)
    : count(_count), type(_type) {}

  bool cpuOnly() const { return count == 0; }

  uint32_t count;
  std::string type;
};


inline bool operator==(const Request& left, const Request& right)
{
  return left.count == right.count && left.type == right.type;
}


std::ostream& operator<<(std::ostream& stream, const Request& request);


// Parses a request formatted as "<count>:<type>", e.g. "2:A100_SXM".
Try<Request> parse(const std::string& value);


// Returns the accelerator options of `container` in preference order.
// A template that requests no accelerators yields one CPU-only option.
Try<std::vector<Request>> parse(const ContainerTemplate& container);


// The accelerator types known to the engine along with their device
// memory (in GB).
class Catalog
{
public:
  // Returns the catalog shipped with the engine.
  static const AcceleratorCatalog& builtin();

  Catalog();
  explicit Catalog(const AcceleratorCatalog& catalog);

  bool contains(const std::string& type) const;

  Option<uint32_t> memory(const std::string& type) const;

  // Returns an error if the request is malformed for this catalog,
  // i.e. it names an unknown type.
  Option<Error> validate(const Request& request) const;

  size_t size() const { return memory_.size(); }

private:
  hashmap<std::string, uint32_t> memory_;
};

} // namespace accelerators {
} // namespace internal {
} // namespace stratus {

#endif // __COMMON_ACCELERATORS_HPP__
