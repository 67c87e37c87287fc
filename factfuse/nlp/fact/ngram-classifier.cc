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

#include <stdlib.h>
#include <cmath>
#include <string>
#include <unordered_map>
#include <vector>

#include "factfuse/base/logging.h"
#include "factfuse/file/textmap.h"
#include "factfuse/nlp/fact/classifier.h"
#include "factfuse/nlp/fact/fact-errors.h"
#include "factfuse/util/utf8.h"

namespace factfuse {
namespace nlp {

// Feature name for the intercept.
static const char kBias[] = "<bias>";

// Logistic regression classifier over character n-gram features. The model
// is a text map with one feature weight per line. Features are "u:" followed
// by a character for unigrams and "b:" followed by two adjacent characters
// for bigrams. The "<bias>" entry holds the intercept. Whitespace characters
// are ignored and unknown features have weight zero.
class NGramLogisticClassifier : public Classifier {
 public:
  Status Load(const string &model) override {
    TextMapInput input;
    Status st = input.Open(model);
    if (!st.ok()) return st;

    weights_.clear();
    bias_ = 0.0;
    while (input.Next()) {
      const string &feature = input.key();
      if (feature.empty() || feature[0] == '#') continue;

      char *end;
      double weight = strtod(input.value().c_str(), &end);
      if (input.value().empty() || *end != 0 || !std::isfinite(weight)) {
        return ConfigError(model + " line " + std::to_string(input.id() + 1) +
                           ": bad weight for feature " + feature);
      }

      if (feature == kBias) {
        bias_ = weight;
      } else {
        weights_[feature] = weight;
      }
    }
    if (!input.status().ok()) return input.status();

    VLOG(1) << "Loaded " << weights_.size() << " feature weights from "
            << model;
    return Status::OK;
  }

  Status Classify(Text sentence, ClassProbabilities *probs) const override {
    if (!UTF8::Valid(sentence)) {
      return ClassifierFailure("sentence is not valid UTF-8");
    }

    // Collect characters.
    std::vector<Text> chars;
    const char *p = sentence.data();
    const char *end = p + sentence.size();
    while (p < end) {
      int len = UTF8::CharLen(p);
      if (!UTF8::IsSpace(UTF8::Decode(p, end - p))) {
        chars.emplace_back(p, len);
      }
      p += len;
    }

    // Sum feature weights.
    double score = bias_;
    string feature;
    for (int i = 0; i < chars.size(); ++i) {
      feature = "u:";
      chars[i].AppendToString(&feature);
      score += Weight(feature);
      if (i + 1 < chars.size()) {
        feature = "b:";
        chars[i].AppendToString(&feature);
        chars[i + 1].AppendToString(&feature);
        score += Weight(feature);
      }
    }

    float fact = 1.0 / (1.0 + std::exp(-score));
    probs->resize(NUM_FACT_CLASSES);
    (*probs)[NOT_FACT] = 1.0 - fact;
    (*probs)[FACT] = fact;
    return Status::OK;
  }

 private:
  // Look up feature weight.
  double Weight(const string &feature) const {
    auto f = weights_.find(feature);
    return f == weights_.end() ? 0.0 : f->second;
  }

  std::unordered_map<string, double> weights_;
  double bias_ = 0.0;
};

REGISTER_CLASSIFIER("ngram-logistic", NGramLogisticClassifier);

}  // namespace nlp
}  // namespace factfuse
