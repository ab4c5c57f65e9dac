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


#ifndef __COMMON_VALIDATION_HPP__
#define __COMMON_VALIDATION_HPP__

#include <string>

#include <stratus/stratus.hpp>

#include <stout/error.hpp>
#include <stout/option.hpp>

#include "common/accelerators.hpp"

namespace stratus {
namespace internal {
namespace validation {

// Validates that `name` is 1 to 256 characters long and only consists
// of ASCII letters, digits, '.', '_' and '-'.
Option<Error> validateName(const std::string& name);

// Rejects queue names reserved by the engine: "default", "system"
// and anything starting with "__".
Option<Error> validateQueue(const std::string& queue);

Option<Error> validateContainer(
    const ContainerTemplate& container,
    const accelerators::Catalog& catalog);

Option<Error> validateScalePolicy(const ScalePolicy& policy);

// Validates a declared resource. Any error returned here is
// non-retryable: the resource fails without consuming retries.
Option<Error> validateResourceInfo(
    const ResourceInfo& info,
    const accelerators::Catalog& catalog);

} // namespace validation {
} // namespace internal {
} // namespace stratus {

#endif // __COMMON_VALIDATION_HPP__
