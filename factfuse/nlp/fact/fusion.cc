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

#include "factfuse/nlp/fact/fusion.h"

#include <cmath>
#include <string>

#include "factfuse/nlp/fact/fact-errors.h"

namespace factfuse {
namespace nlp {

Status FusionEngine::Validate(const FusionOptions &options) {
  if (!std::isfinite(options.weight) || options.weight < 0.0) {
    return ConfigError("fusion weight must be finite and non-negative, got " +
                       std::to_string(options.weight));
  }
  return Status::OK;
}

float FusionEngine::Fuse(float probability, float logic) const {
  // An undefined logic score leaves the model probability unchanged.
  if (std::isnan(logic)) logic = 0.0;
  float adjusted = probability + options_.weight * logic;
  if (std::isnan(adjusted)) adjusted = probability;
  if (!(adjusted > 0.0)) return 0.0;
  if (adjusted > 1.0) return 1.0;
  return adjusted;
}

}  // namespace nlp
}  // namespace factfuse
