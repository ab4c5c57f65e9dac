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

#include "messages/messages.hpp"

using std::ostream;

namespace stratus {
namespace internal {

ostream& operator<<(ostream& stream, const StatusUpdate& update)
{
  stream << "status update #" << update.sequence()
         << " (" << update.phase() << ") for resource "
         << update.resource_id() << " at version " << update.version();

  if (update.has_message() && !update.message().empty()) {
    stream << ": " << update.message();
  }

  return stream;
}

} // namespace internal {
} // namespace stratus {
