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

#ifndef FACTFUSE_NLP_FACT_FACT_ERRORS_H_
#define FACTFUSE_NLP_FACT_FACT_ERRORS_H_

#include <string>

#include "factfuse/base/status.h"
#include "factfuse/base/types.h"

namespace factfuse {
namespace nlp {

// Error codes for fact/opinion scoring. The codes are kept above the errno
// range so they do not collide with file errors.
enum FactErrorCode {
  INVALID_INPUT = 1001,       // empty or malformed input text
  ANNOTATION_FAILURE = 1002,  // annotator could not process a sentence
  CLASSIFIER_FAILURE = 1003,  // ensemble member failed or returned garbage
  DISPATCH_FAILURE = 1004,    // batch could not be dispatched
  CONFIG_ERROR = 1005,        // invalid configuration or resource
};

inline Status InvalidInput(const string &message) {
  return Status(INVALID_INPUT, "Invalid input", message);
}

inline Status AnnotationFailure(const string &message) {
  return Status(ANNOTATION_FAILURE, "Annotation failure", message);
}

inline Status ClassifierFailure(const string &message) {
  return Status(CLASSIFIER_FAILURE, "Classifier failure", message);
}

inline Status DispatchFailure(const string &message) {
  return Status(DISPATCH_FAILURE, "Dispatch failure", message);
}

inline Status ConfigError(const string &message) {
  return Status(CONFIG_ERROR, "Configuration error", message);
}

}  // namespace nlp
}  // namespace factfuse

#endif  // FACTFUSE_NLP_FACT_FACT_ERRORS_H_
