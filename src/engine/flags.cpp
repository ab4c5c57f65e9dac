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

#include <stout/error.hpp>
#include <stout/flags.hpp>
#include <stout/option.hpp>

#include "common/parse.hpp"

#include "engine/constants.hpp"
#include "engine/flags.hpp"

stratus::internal::engine::Flags::Flags()
{
  add(&Flags::work_dir,
      "work_dir",
      "Path of the engine work directory. Every resource record is\n"
      "checkpointed there and recovered when the engine restarts.\n"
      "If left unset the records only live in memory.");

  add(&Flags::workers,
      "workers",
      "Number of resources reconciled in parallel.",
      DEFAULT_WORKERS,
      [](size_t value) -> Option<Error> {
        if (value == 0) {
          return Error("Expected `--workers` to be positive");
        }
        return None();
      });

  add(&Flags::resync_interval,
      "resync_interval",
      "Period of the sweep that reconciles every non-terminal resource,\n"
      "whether or not it changed.",
      DEFAULT_RESYNC_INTERVAL);

  add(&Flags::autoscale_interval,
      "autoscale_interval",
      "Period at which the metric of every running Processor and\n"
      "Service is sampled and handed to the autoscaler.",
      DEFAULT_AUTOSCALE_INTERVAL);

  add(&Flags::poll_interval,
      "poll_interval",
      "Period at which resources waiting for capacity, healthy\n"
      "instances or drains are reconciled again.",
      DEFAULT_POLL_INTERVAL);

  add(&Flags::lease_timeout,
      "lease_timeout",
      "Time a worker may hold the execution lease of a resource\n"
      "before the lease is reclaimed and the resource reconciled again.",
      DEFAULT_LEASE_TIMEOUT);

  add(&Flags::max_retries,
      "max_retries",
      "Number of consecutive transient failures a resource tolerates\n"
      "before it fails.",
      DEFAULT_MAX_RETRIES);

  add(&Flags::retry_backoff_factor,
      "retry_backoff_factor",
      "Backoff after the first transient failure of a resource. The\n"
      "backoff doubles with every consecutive failure.",
      DEFAULT_RETRY_BACKOFF_FACTOR);

  add(&Flags::max_retry_backoff,
      "max_retry_backoff",
      "Maximum backoff between two attempts.",
      DEFAULT_MAX_RETRY_BACKOFF);

  add(&Flags::drain_timeout,
      "drain_timeout",
      "Time a draining instance is given to finish its in-flight work\n"
      "before it is terminated anyway. Resources may override this.",
      DEFAULT_DRAIN_TIMEOUT);

  add(&Flags::provision_timeout,
      "provision_timeout",
      "Time after which a provisioned instance that is not reported\n"
      "healthy is considered failed.",
      DEFAULT_PROVISION_TIMEOUT);

  add(&Flags::autoscale_step,
      "autoscale_step",
      "Number of instances added or removed by a scale rule that does\n"
      "not specify a step.",
      DEFAULT_AUTOSCALE_STEP,
      [](uint32_t value) -> Option<Error> {
        if (value == 0) {
          return Error("Expected `--autoscale_step` to be positive");
        }
        return None();
      });

  add(&Flags::autoscale_cooldown,
      "autoscale_cooldown",
      "Minimum time between two scale actions on a resource whose\n"
      "scale policy does not specify a cooldown.",
      DEFAULT_AUTOSCALE_COOLDOWN);

  add(&Flags::metric_window,
      "metric_window",
      "Amount of metric history the autoscaler retains per resource.",
      DEFAULT_METRIC_WINDOW);

  add(&Flags::max_status_history,
      "max_status_history",
      "Number of status updates retained per resource.",
      DEFAULT_MAX_STATUS_HISTORY);

  add(&Flags::accelerators,
      "accelerators",
      "JSON catalog of accelerator types replacing the built-in one,\n"
      "as a string or a path to a file (`file:///path/to/file`).\n"
      "\n"
      "Example:\n"
      "{\n"
      "  \"accelerators\": [\n"
      "    { \"name\": \"A100_SXM\", \"memory\": 80 },\n"
      "    { \"name\": \"L4\", \"memory\": 24 }\n"
      "  ]\n"
      "}");

  add(&Flags::platforms,
      "platforms",
      "JSON description of the platforms of the local placement\n"
      "backend, as a string or a path to a file.\n"
      "\n"
      "Example:\n"
      "{\n"
      "  \"platforms\": [\n"
      "    {\n"
      "      \"name\": \"ec2\",\n"
      "      \"zones\": [\n"
      "        {\n"
      "          \"name\": \"us-east-1a\",\n"
      "          \"accelerators\": [\n"
      "            { \"type\": \"A100_SXM\", \"count\": 8 }\n"
      "          ],\n"
      "          \"cpus\": 16\n"
      "        }\n"
      "      ]\n"
      "    }\n"
      "  ]\n"
      "}");

  add(&Flags::resources,
      "resources",
      "JSON object listing the resources to declare at startup, as a\n"
      "string or a path to a file.\n"
      "\n"
      "Example:\n"
      "{\n"
      "  \"resources\": [\n"
      "    {\n"
      "      \"name\": \"train\",\n"
      "      \"namespace\": \"default\",\n"
      "      \"owner\": \"alice\",\n"
      "      \"kind\": \"CONTAINER\",\n"
      "      \"queue\": \"gpu-train\",\n"
      "      \"container\": {\n"
      "        \"image\": \"trainer:latest\",\n"
      "        \"accelerators\": [ \"8:A100_SXM\" ]\n"
      "      }\n"
      "    }\n"
      "  ]\n"
      "}");
}
