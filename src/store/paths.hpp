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


#ifndef __STORE_PATHS_HPP__
#define __STORE_PATHS_HPP__

#include <list>
#include <string>

#include <stratus/stratus.hpp>

#include <stout/try.hpp>

namespace stratus {
namespace internal {
namespace store {
namespace paths {

// The Resource Store checkpoints every record under the work
// directory so that the engine can restart without losing track of
// the instances it provisioned. The layout is as follows:
//
//   root ('--work_dir' flag)
//   |-- resources
//       |-- <resource_id> (serialized Resource)

constexpr char RESOURCES_DIR[] = "resources";


std::string getResourcesDir(const std::string& rootDir);


std::string getResourcePath(
    const std::string& rootDir,
    const ResourceID& resourceId);


// Returns the paths of all checkpointed resources.
Try<std::list<std::string>> getResourcePaths(const std::string& rootDir);

} // namespace paths {
} // namespace store {
} // namespace internal {
} // namespace stratus {

#endif // __STORE_PATHS_HPP__
