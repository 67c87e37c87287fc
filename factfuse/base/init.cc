// Copyright 2017 Google Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "factfuse/base/init.h"

#include <stdlib.h>
#include <string.h>
#include <string>

#include "factfuse/base/flags.h"
#include "factfuse/base/logging.h"
#include "factfuse/base/types.h"

namespace factfuse {

void InitProgram(int *argc, char ***argv) {
  if (*argc == 0) return;

  // Usage message with program name stripped of its directory.
  const char *program = (*argv)[0];
  const char *slash = strrchr(program, '/');
  if (slash != nullptr) program = slash + 1;
  Flag::SetUsageMessage(string("Usage: ") + program + " [OPTIONS]\n");

  if (Flag::ParseCommandLineFlags(argc, *argv) != 0) exit(1);
  VLOG(1) << program << " started with " << (*argc - 1) << " arguments";
}

}  // namespace factfuse
