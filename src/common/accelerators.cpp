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


#include <ctype.h>

#include <ostream>
#include <string>
#include <vector>

#include <stout/foreach.hpp>
#include <stout/numify.hpp>
#include <stout/strings.hpp>

#include "common/accelerators.hpp"

using std::ostream;
using std::string;
using std::vector;

namespace stratus {
namespace internal {
namespace accelerators {

namespace {

struct Accelerator
{
  const char* name;
  uint32_t memory;
};


// NVIDIA and AMD parts offered by the common GPU clouds.
const Accelerator ACCELERATORS[] = {
  {"A100_PCIe", 80},
  {"A100_SXM", 80},
  {"A30", 24},
  {"A40", 48},
  {"H100_NVL", 94},
  {"H100_PCIe", 80},
  {"H100_SXM", 80},
  {"H200_SXM", 143},
  {"L4", 24},
  {"L40", 48},
  {"L40S", 48},
  {"MI300X", 192},
  {"RTX_2000_Ada", 16},
  {"RTX_3070", 8},
  {"RTX_3080", 10},
  {"RTX_3080_Ti", 12},
  {"RTX_3090", 24},
  {"RTX_3090_Ti", 24},
  {"RTX_4000_Ada", 20},
  {"RTX_4070_Ti", 12},
  {"RTX_4080", 16},
  {"RTX_4080_SUPER", 16},
  {"RTX_4090", 24},
  {"RTX_5000_Ada", 32},
  {"RTX_6000_Ada", 48},
  {"RTX_A2000", 6},
  {"RTX_A4000", 16},
  {"RTX_A4500", 20},
  {"RTX_A5000", 24},
  {"RTX_A6000", 48},
  {"V100", 16},
  {"V100_FHHL", 16},
  {"V100_SXM2", 16},
  {"V100_SXM2_32GB", 32},
};

} // namespace {


ostream& operator<<(ostream& stream, const Request& request)
{
  if (request.cpuOnly()) {
    return stream << "cpu";
  }

  return stream << request.count << ":" << request.type;
}


Try<Request> parse(const string& value)
{
  const vector<string> tokens = strings::split(value, ":");
  if (tokens.size() != 2) {
    return Error(
        "Accelerator request '" + value + "' must be of the form"
        " '<count>:<type>'");
  }

  const string type = strings::trim(tokens[1]);
  if (type.empty()) {
    return Error("Accelerator request '" + value + "' is missing a type");
  }

  const string digits = strings::trim(tokens[0]);

  // NOTE: Checked here since numify accepts a leading '-' for unsigned
  // types and wraps around.
  if (digits.empty() || !isdigit(static_cast<unsigned char>(digits[0]))) {
    return Error(
        "Accelerator request '" + value + "' has an invalid count");
  }

  Try<uint32_t> count = numify<uint32_t>(digits);
  if (count.isError()) {
    return Error(
        "Accelerator request '" + value + "' has an invalid count: " +
        count.error());
  }

  if (count.get() == 0) {
    return Error(
        "Accelerator request '" + value + "' must ask for at least one"
        " accelerator");
  }

  return Request(count.get(), type);
}


Try<vector<Request>> parse(const ContainerTemplate& container)
{
  vector<Request> requests;

  foreach (const string& accelerator, container.accelerators()) {
    Try<Request> request = parse(accelerator);
    if (request.isError()) {
      return Error(request.error());
    }

    requests.push_back(request.get());
  }

  if (requests.empty()) {
    requests.push_back(Request());
  }

  return requests;
}


const AcceleratorCatalog& Catalog::builtin()
{
  static const AcceleratorCatalog* catalog = []() {
    AcceleratorCatalog* catalog = new AcceleratorCatalog();
    foreach (const Accelerator& accelerator, ACCELERATORS) {
      AcceleratorCatalog::Accelerator* entry = catalog->add_accelerators();
      entry->set_name(accelerator.name);
      entry->set_memory(accelerator.memory);
    }
    return catalog;
  }();

  return *catalog;
}


Catalog::Catalog() : Catalog(builtin()) {}


Catalog::Catalog(const AcceleratorCatalog& catalog)
{
  foreach (const AcceleratorCatalog::Accelerator& accelerator,
           catalog.accelerators()) {
    memory_[accelerator.name()] = accelerator.memory();
  }
}


bool Catalog::contains(const string& type) const
{
  return memory_.contains(type);
}


Option<uint32_t> Catalog::memory(const string& type) const
{
  return memory_.get(type);
}


Option<Error> Catalog::validate(const Request& request) const
{
  if (request.cpuOnly()) {
    return None();
  }

  if (!contains(request.type)) {
    return Error("Unknown accelerator type '" + request.type + "'");
  }

  return None();
}

} // namespace accelerators {
} // namespace internal {
} // namespace stratus {
