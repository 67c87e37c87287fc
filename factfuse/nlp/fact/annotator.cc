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

#include "factfuse/nlp/fact/annotator.h"

REGISTER_COMPONENT_REGISTRY("annotator", factfuse::nlp::Annotator);

namespace factfuse {
namespace nlp {

bool AnnotatedWord::HasFeature(Text feature) const {
  if (features.empty() || features == "_") return false;
  for (Text f : SplitText(features, '|')) {
    if (f == feature) return true;
  }
  return false;
}

// Annotator without syntactic analysis. Only the lexical cues contribute to
// the logic score when this annotator is used.
class NullAnnotator : public Annotator {
 public:
  Status Annotate(Text sentence,
                  std::vector<AnnotatedWord> *words) const override {
    words->clear();
    return Status::OK;
  }
};

REGISTER_ANNOTATOR("none", NullAnnotator);

}  // namespace nlp
}  // namespace factfuse
