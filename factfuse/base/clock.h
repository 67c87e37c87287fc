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

#ifndef FACTFUSE_BASE_CLOCK_H_
#define FACTFUSE_BASE_CLOCK_H_

#include <time.h>

#include "factfuse/base/types.h"

namespace factfuse {

// Monotonic wall clock for performance measurements.
class Clock {
 public:
  // Timestamp in nanoseconds.
  typedef int64 Timestamp;

  // Return current timestamp.
  static inline Timestamp now() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<Timestamp>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
  }

  // Start clock.
  void start() { start_ = now(); }

  // Stop clock.
  void stop() { end_ = now(); }

  // Return time in milliseconds.
  double ms() const { return (end_ - start_) / 1e6; }

 private:
  Timestamp start_ = 0;  // start timestamp
  Timestamp end_ = 0;    // end timestamp
};

}  // namespace factfuse

#endif  // FACTFUSE_BASE_CLOCK_H_
