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

#ifndef FACTFUSE_NLP_FACT_SENTENCE_SPLITTER_H_
#define FACTFUSE_NLP_FACT_SENTENCE_SPLITTER_H_

#include <string>
#include <unordered_set>
#include <vector>

#include "factfuse/base/status.h"
#include "factfuse/base/types.h"
#include "factfuse/string/text.h"

namespace factfuse {
namespace nlp {

// Splits text into sentences at sentence-final punctuation. The punctuation
// stays with the sentence it ends, together with any directly following
// terminators and closing quotes or brackets, e.g. "真的吗？！" or
// "他说：“好。”" are single sentences. Sentences are trimmed for whitespace
// and empty sentences are dropped. Identical sentences are kept as separate
// entries in input order.
class SentenceSplitter {
 public:
  // Default sentence terminators.
  static const char kDefaultTerminators[];

  // Initialize splitter with default terminators.
  SentenceSplitter();

  // Initialize splitter with the characters in the UTF-8 string as
  // terminators.
  explicit SentenceSplitter(Text terminators);

  // Split text into sentences. Returns INVALID_INPUT if the text is empty,
  // is not valid UTF-8, or does not contain any non-whitespace characters.
  Status Split(Text text, std::vector<string> *sentences) const;

  // Check if character is a sentence terminator.
  bool IsTerminator(int ch) const { return terminators_.count(ch) > 0; }

  // Check if character is a closing quote or bracket.
  bool IsCloser(int ch) const { return closers_.count(ch) > 0; }

 private:
  // Add trimmed sentence to output if it is not empty.
  static void Emit(const char *begin, const char *end,
                   std::vector<string> *sentences);

  // Sentence terminator characters.
  std::unordered_set<int> terminators_;

  // Closing characters that attach to a preceding terminator.
  std::unordered_set<int> closers_;
};

}  // namespace nlp
}  // namespace factfuse

#endif  // FACTFUSE_NLP_FACT_SENTENCE_SPLITTER_H_
