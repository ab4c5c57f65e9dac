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

#include <iostream>
#include <string>

#include <stratus/stratus.hpp>

#include <process/future.hpp>
#include <process/process.hpp>

#include <stout/exit.hpp>
#include <stout/foreach.hpp>
#include <stout/path.hpp>
#include <stout/try.hpp>

#include "admission/queue_controller.hpp"

#include "autoscaler/autoscaler.hpp"

#include "common/accelerators.hpp"

#include "engine/flags.hpp"

#include "feed/in_memory.hpp"

#include "logging/logging.hpp"

#include "placement/local.hpp"

#include "reconciler/reconciler.hpp"

#include "scheduler/scheduler.hpp"

#include "store/resource_store.hpp"

using namespace stratus::internal;

using stratus::internal::admission::QueueAdmissionController;
using stratus::internal::autoscaler::Autoscaler;
using stratus::internal::feed::InMemoryMetricFeed;
using stratus::internal::placement::LocalBackend;
using stratus::internal::reconciler::Reconciler;
using stratus::internal::scheduler::Scheduler;
using stratus::internal::store::ResourceStore;

using process::Future;

using std::cerr;
using std::cout;
using std::endl;
using std::string;


int main(int argc, char** argv)
{
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  engine::Flags flags;

  flags.setUsageMessage(
      "Usage: " + Path(argv[0]).basename() + " [...]\n\n" +
      "Reconciles declared resources against the configured platforms.");

  Try<flags::Warnings> load = flags.load("STRATUS_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  if (flags.platforms.isNone()) {
    cerr << flags.usage("Missing required option --platforms") << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], true, flags);

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  process::initialize("stratus");

  const accelerators::Catalog catalog = flags.accelerators.isSome()
    ? accelerators::Catalog(flags.accelerators.get())
    : accelerators::Catalog();

  LOG(INFO) << "Using a catalog of " << catalog.size() << " accelerator(s)";

  ResourceStore store(flags.work_dir, flags.max_status_history);

  Future<Nothing> recover = store.recover();
  recover.await();

  if (!recover.isReady()) {
    EXIT(EXIT_FAILURE)
      << "Failed to recover the resource store: "
      << (recover.isFailed() ? recover.failure() : "discarded");
  }

  Try<LocalBackend*> backend = LocalBackend::create(flags.platforms.get());
  if (backend.isError()) {
    EXIT(EXIT_FAILURE)
      << "Failed to create the placement backend: " << backend.error();
  }

  QueueAdmissionController queues;
  Scheduler scheduler(backend.get());
  Autoscaler autoscaler(
      flags.metric_window,
      flags.autoscale_step,
      flags.autoscale_cooldown);
  InMemoryMetricFeed feed;

  Reconciler* reconciler = new Reconciler(
      flags,
      &store,
      &queues,
      &scheduler,
      &autoscaler,
      backend.get(),
      &feed,
      catalog);

  Future<Nothing> started = reconciler->start();
  started.await();

  if (!started.isReady()) {
    EXIT(EXIT_FAILURE)
      << "Failed to start the reconciler: "
      << (started.isFailed() ? started.failure() : "discarded");
  }

  if (flags.resources.isSome()) {
    foreach (const stratus::ResourceInfo& info,
             flags.resources->resources()) {
      Future<stratus::Resource> resource = store.putSpec(info);
      resource.await();

      if (!resource.isReady()) {
        LOG(ERROR) << "Failed to declare resource '" << info.name() << "': "
                   << (resource.isFailed() ? resource.failure() : "discarded");
        continue;
      }

      LOG(INFO) << "Declared resource " << resource.get().id()
                << " at generation " << resource.get().generation();
    }
  }

  process::wait(reconciler->pid());

  delete reconciler;
  delete backend.get();

  return EXIT_SUCCESS;
}
