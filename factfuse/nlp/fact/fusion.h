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

#ifndef FACTFUSE_NLP_FACT_FUSION_H_
#define FACTFUSE_NLP_FACT_FUSION_H_

#include "factfuse/base/status.h"

namespace factfuse {
namespace nlp {

// Fusion parameters.
struct FusionOptions {
  // Weight of the logic score relative to the model probability.
  float weight = 0.1;
};

// Combines the ensemble fact probability with the rule-based logic score:
//
//   adjusted = clamp(probability + weight * logic, 0, 1)
//
// The result is always a valid probability, however large the logic score.
class FusionEngine {
 public:
  explicit FusionEngine(const FusionOptions &options = FusionOptions())
      : options_(options) {}

  // Check that the fusion options are usable. The weight must be finite and
  // non-negative.
  static Status Validate(const FusionOptions &options);

  // Compute adjusted fact probability.
  float Fuse(float probability, float logic) const;

  float weight() const { return options_.weight; }

 private:
  FusionOptions options_;
};

}  // namespace nlp
}  // namespace factfuse

#endif  // FACTFUSE_NLP_FACT_FUSION_H_
