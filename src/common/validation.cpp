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

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

#include <stout/check.hpp>
#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include "common/protobuf_utils.hpp"
#include "common/validation.hpp"

using std::string;
using std::vector;

namespace stratus {
namespace internal {
namespace validation {

namespace {

const size_t MAX_NAME_LENGTH = 256;


Option<Error> validateRule(const string& name, const ScaleRule& rule)
{
  if (rule.has_dwell() && rule.dwell().nanoseconds() < 0) {
    return Error("Scale rule '" + name + "' has a negative dwell duration");
  }

  if (rule.has_step() && rule.step() == 0) {
    return Error("Scale rule '" + name + "' has a zero step");
  }

  return None();
}


Option<Error> validateBounds(
    uint32_t min,
    uint32_t max,
    const string& what)
{
  if (max == 0) {
    return Error("Maximum number of " + what + " must be at least 1");
  }

  if (min > max) {
    return Error(
        "Minimum number of " + what + " (" + stringify(min) + ") exceeds"
        " the maximum (" + stringify(max) + ")");
  }

  return None();
}

} // namespace {


Option<Error> validateName(const string& name)
{
  if (name.empty()) {
    return Error("Name must not be empty");
  }

  if (name.length() > MAX_NAME_LENGTH) {
    return Error(
        "Name must not be greater than " +
        stringify(MAX_NAME_LENGTH) + " characters");
  }

  auto invalidCharacter = [](char c) {
    return !(isascii(c) && isalnum(c)) && c != '.' && c != '_' && c != '-';
  };

  if (std::any_of(name.begin(), name.end(), invalidCharacter)) {
    return Error("'" + name + "' contains invalid characters");
  }

  return None();
}


Option<Error> validateQueue(const string& queue)
{
  Option<Error> error = validateName(queue);
  if (error.isSome()) {
    return Error("Invalid queue name: " + error->message);
  }

  if (queue == "default" ||
      queue == "system" ||
      strings::startsWith(queue, "__")) {
    return Error("Queue name '" + queue + "' is reserved");
  }

  return None();
}


Option<Error> validateContainer(
    const ContainerTemplate& container,
    const accelerators::Catalog& catalog)
{
  Try<vector<accelerators::Request>> requests =
    accelerators::parse(container);

  if (requests.isError()) {
    return Error(requests.error());
  }

  foreach (const accelerators::Request& request, requests.get()) {
    Option<Error> error = catalog.validate(request);
    if (error.isSome()) {
      return error;
    }
  }

  if (container.has_platform() && container.platform().empty()) {
    return Error("Platform must not be empty");
  }

  hashset<string> preferences;
  foreach (const string& platform, container.platform_preferences()) {
    if (platform.empty()) {
      return Error("Platform preferences must not contain empty entries");
    }

    if (preferences.contains(platform)) {
      return Error(
          "Platform preference '" + platform + "' is listed more than once");
    }

    preferences.insert(platform);
  }

  foreach (const ContainerTemplate::Environment& variable,
           container.environment()) {
    if (variable.name().empty()) {
      return Error("Environment variable names must not be empty");
    }

    if (variable.has_value() && variable.has_secret()) {
      return Error(
          "Environment variable '" + variable.name() + "' must not have"
          " both a value and a secret set");
    }
  }

  if (container.has_timeout() && container.timeout().nanoseconds() <= 0) {
    return Error("Timeout must be positive");
  }

  return None();
}


Option<Error> validateScalePolicy(const ScalePolicy& policy)
{
  if (policy.has_up()) {
    Option<Error> error = validateRule("up", policy.up());
    if (error.isSome()) {
      return error;
    }
  }

  if (policy.has_down()) {
    Option<Error> error = validateRule("down", policy.down());
    if (error.isSome()) {
      return error;
    }
  }

  if (policy.has_zero()) {
    Option<Error> error = validateRule("zero", policy.zero());
    if (error.isSome()) {
      return error;
    }
  }

  // Overlapping thresholds would make the policy oscillate between
  // scaling up and down.
  if (policy.has_up() && policy.up().has_threshold() &&
      policy.has_down() && policy.down().has_threshold() &&
      policy.down().threshold() >= policy.up().threshold()) {
    return Error(
        "Scale down threshold (" + stringify(policy.down().threshold()) +
        ") must be below the scale up threshold (" +
        stringify(policy.up().threshold()) + ")");
  }

  if (policy.has_cooldown() && policy.cooldown().nanoseconds() < 0) {
    return Error("Scale cooldown must not be negative");
  }

  return None();
}


Option<Error> validateResourceInfo(
    const ResourceInfo& info,
    const accelerators::Catalog& catalog)
{
  Option<Error> error = validateName(info.name());
  if (error.isSome()) {
    return Error("Invalid resource name: " + error->message);
  }

  error = validateName(info.namespace_());
  if (error.isSome()) {
    return Error("Invalid namespace: " + error->message);
  }

  if (info.owner().empty()) {
    return Error("Owner must not be empty");
  }

  error = protobuf::validateProtobufUnion(info);
  if (error.isSome()) {
    return error;
  }

  if (info.has_queue()) {
    error = validateQueue(info.queue());
    if (error.isSome()) {
      return error;
    }
  }

  if (info.has_drain_timeout() && info.drain_timeout().nanoseconds() < 0) {
    return Error("Drain timeout must not be negative");
  }

  switch (info.kind()) {
    case ResourceInfo::CONTAINER:
      return validateContainer(info.container(), catalog);

    case ResourceInfo::PROCESSOR: {
      const Processor& processor = info.processor();

      if (processor.stream().empty()) {
        return Error("Processor stream must not be empty");
      }

      error = validateBounds(
          processor.min_workers(), processor.max_workers(), "workers");
      if (error.isSome()) {
        return error;
      }

      if (processor.has_scale()) {
        if (processor.scale().has_metric() &&
            processor.scale().metric() != ScalePolicy::PRESSURE) {
          return Error("Processors can only scale on stream pressure");
        }

        error = validateScalePolicy(processor.scale());
        if (error.isSome()) {
          return error;
        }
      }

      return validateContainer(processor.container(), catalog);
    }

    case ResourceInfo::SERVICE: {
      const Service& service = info.service();

      error = validateBounds(
          service.min_containers(), service.max_containers(), "containers");
      if (error.isSome()) {
        return error;
      }

      if (service.has_scale()) {
        if (service.scale().has_metric() &&
            service.scale().metric() != ScalePolicy::LATENCY) {
          return Error("Services can only scale on request latency");
        }

        error = validateScalePolicy(service.scale());
        if (error.isSome()) {
          return error;
        }
      }

      return validateContainer(service.container(), catalog);
    }

    case ResourceInfo::CLUSTER: {
      const Cluster& cluster = info.cluster();

      if (cluster.num_nodes() == 0) {
        return Error("Cluster must have at least one node");
      }

      Option<Error> error = validateContainer(cluster.container(), catalog);
      if (error.isSome()) {
        return error;
      }

      // All nodes are placed in one zone, which counts its accelerators
      // in 32 bits.
      Try<vector<accelerators::Request>> requests =
        accelerators::parse(cluster.container());

      CHECK_SOME(requests);

      foreach (const accelerators::Request& request, requests.get()) {
        const uint64_t total =
          static_cast<uint64_t>(request.count) * cluster.num_nodes();

        if (total > std::numeric_limits<uint32_t>::max()) {
          return Error(
              "Accelerator request '" + stringify(request) + "' for " +
              stringify(cluster.num_nodes()) + " nodes asks for more"
              " accelerators than a zone can hold");
        }
      }

      return None();
    }

    case ResourceInfo::UNKNOWN:
      break;
  }

  return Error("Unknown resource kind");
}

} // namespace validation {
} // namespace internal {
} // namespace stratus {
