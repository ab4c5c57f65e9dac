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

#include <signal.h> // For sigaction(), sigemptyset().

#include <glog/logging.h>
#include <glog/raw_logging.h>

#include <string>

#include <process/once.hpp>

#include <stout/exit.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include <stout/os/signals.hpp>

#include "logging/logging.hpp"

using process::Once;

using std::string;

namespace stratus {
namespace internal {
namespace logging {

// glog keeps a pointer to the program name.
static string* programName = nullptr;


// A terminated engine exits quietly instead of dumping the stack
// trace glog prints for fatal signals. Only RAW_LOG is safe here.
static void terminated(int signal, siginfo_t* siginfo, void*)
{
  if (siginfo->si_code <= 0) {
    RAW_LOG(WARNING, "Terminated by process %d of user %d",
            siginfo->si_pid, siginfo->si_uid);
  } else {
    RAW_LOG(WARNING, "Terminated");
  }

  os::signals::reset(signal);
  raise(signal);
}


Try<google::LogSeverity> getLogSeverity(const string& level)
{
  if (level == "INFO") {
    return google::INFO;
  } else if (level == "WARNING") {
    return google::WARNING;
  } else if (level == "ERROR") {
    return google::ERROR;
  }

  return Error(
      "'" + level + "' is not a valid logging level; expected one of "
      "'INFO', 'WARNING' or 'ERROR'");
}


void initialize(
    const string& argv0,
    bool installFailureSignalHandler,
    const Option<Flags>& _flags)
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return;
  }

  const Flags flags = _flags.isSome() ? _flags.get() : Flags();

  Try<google::LogSeverity> severity = getLogSeverity(flags.logging_level);
  if (severity.isError()) {
    EXIT(EXIT_FAILURE) << severity.error();
  }

  FLAGS_minloglevel = severity.get();
  FLAGS_logbufsecs = flags.logbufsecs;

  if (flags.log_dir.isSome()) {
    Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
    if (mkdir.isError()) {
      EXIT(EXIT_FAILURE)
        << "Failed to create log directory '" << flags.log_dir.get()
        << "': " << mkdir.error();
    }

    FLAGS_log_dir = flags.log_dir.get();
    FLAGS_logtostderr = false;
  } else {
    FLAGS_logtostderr = true;
  }

  if (flags.quiet) {
    // Without log files glog ignores the stderr threshold.
    FLAGS_stderrthreshold = google::FATAL;
    if (FLAGS_logtostderr) {
      FLAGS_minloglevel = google::FATAL;
    }
  } else {
    FLAGS_stderrthreshold = FLAGS_minloglevel;
  }

  programName = new string(argv0);
  google::InitGoogleLogging(programName->c_str());

  VLOG(1) << "Logging to "
          << (flags.log_dir.isSome() ? flags.log_dir.get() : "stderr");

  if (installFailureSignalHandler) {
    google::InstallFailureSignalHandler();

    struct sigaction action;
    action.sa_sigaction = terminated;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_SIGINFO;

    if (sigaction(SIGTERM, &action, nullptr) < 0) {
      PLOG(FATAL) << "Failed to install the SIGTERM handler";
    }
  }

  initialized->done();
}

} // namespace logging {
} // namespace internal {
} // namespace stratus {
