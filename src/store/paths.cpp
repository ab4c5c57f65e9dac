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


#include <list>
#include <string>

#include <stout/foreach.hpp>
#include <stout/fs.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

#include "store/paths.hpp"

using std::list;
using std::string;

namespace stratus {
namespace internal {
namespace store {
namespace paths {

string getResourcesDir(const string& rootDir)
{
  return path::join(rootDir, RESOURCES_DIR);
}


string getResourcePath(const string& rootDir, const ResourceID& resourceId)
{
  return path::join(getResourcesDir(rootDir), resourceId.value());
}


Try<list<string>> getResourcePaths(const string& rootDir)
{
  const string dir = getResourcesDir(rootDir);

  if (!os::exists(dir)) {
    return list<string>();
  }

  Try<list<string>> entries = os::ls(dir);
  if (entries.isError()) {
    return Error("Failed to list '" + dir + "': " + entries.error());
  }

  list<string> result;
  foreach (const string& entry, entries.get()) {
    // Skip temporary files left behind by an interrupted checkpoint,
    // see `checkpoint()`.
    if (strings::startsWith(entry, ".")) {
      continue;
    }

    result.push_back(path::join(dir, entry));
  }

  return result;
}

} // namespace paths {
} // namespace store {
} // namespace internal {
} // namespace stratus {
