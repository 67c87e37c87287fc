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

#ifndef FACTFUSE_NLP_FACT_ANNOTATOR_H_
#define FACTFUSE_NLP_FACT_ANNOTATOR_H_

#include <string>
#include <vector>

#include "factfuse/base/registry.h"
#include "factfuse/base/status.h"
#include "factfuse/base/types.h"
#include "factfuse/string/text.h"

namespace factfuse {
namespace nlp {

// Word of a sentence with the syntactic information produced by a dependency
// parser. Tags follow the Universal Dependencies conventions.
struct AnnotatedWord {
  AnnotatedWord() = default;
  AnnotatedWord(const string &text, const string &pos,
                const string &relation, const string &features)
      : text(text), pos(pos), relation(relation), features(features) {}

  // Check if the word has a morphological feature, e.g. "Mood=Pot". The
  // features are a '|'-separated list of attribute=value pairs.
  bool HasFeature(Text feature) const;

  string text;      // surface form
  string pos;       // universal part-of-speech tag, e.g. VERB
  string relation;  // dependency relation to head, e.g. nsubj
  string features;  // morphological features, e.g. Mood=Pot|Aspect=Prog
};

// Dependency annotator interface. Implementations must be safe for
// concurrent calls to Annotate() once loaded, since sentences are scored in
// parallel without locking.
class Annotator : public Component<Annotator> {
 public:
  virtual ~Annotator() = default;

  // Load annotator resources.
  virtual Status Load(const string &resource) { return Status::OK; }

  // Annotate the words of a sentence. Returns ANNOTATION_FAILURE if the
  // sentence cannot be annotated.
  virtual Status Annotate(Text sentence,
                          std::vector<AnnotatedWord> *words) const = 0;
};

#define REGISTER_ANNOTATOR(type, component) \
    REGISTER_COMPONENT_TYPE(factfuse::nlp::Annotator, type, component)

}  // namespace nlp
}  // namespace factfuse

#endif  // FACTFUSE_NLP_FACT_ANNOTATOR_H_
