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

#include "factfuse/nlp/fact/sentence-splitter.h"

#include "factfuse/base/logging.h"
#include "factfuse/nlp/fact/fact-errors.h"
#include "factfuse/util/utf8.h"

namespace factfuse {
namespace nlp {

const char SentenceSplitter::kDefaultTerminators[] = "。！？!?";

// Closing quotes and brackets.
static const char kClosers[] = "”’」』）》〉】\")'";

// Add all characters in UTF-8 string to set.
static void AddCharacters(Text chars, std::unordered_set<int> *set) {
  const char *p = chars.data();
  const char *end = p + chars.size();
  while (p < end) {
    int n = UTF8::CharLen(p);
    if (n > end - p) break;
    int code = UTF8::Decode(p, n);
    if (code >= 0) set->insert(code);
    p += n;
  }
}

SentenceSplitter::SentenceSplitter()
    : SentenceSplitter(Text(kDefaultTerminators)) {}

SentenceSplitter::SentenceSplitter(Text terminators) {
  AddCharacters(terminators, &terminators_);
  AddCharacters(Text(kClosers), &closers_);
  CHECK(!terminators_.empty()) << "No sentence terminators";
}

void SentenceSplitter::Emit(const char *begin, const char *end,
                            std::vector<string> *sentences) {
  Text sentence = UTF8::Trim(Text(begin, end - begin));
  if (!sentence.empty()) sentences->push_back(sentence.str());
}

Status SentenceSplitter::Split(Text text,
                               std::vector<string> *sentences) const {
  sentences->clear();
  if (text.empty()) return InvalidInput("empty text");
  if (!UTF8::Valid(text)) return InvalidInput("text is not valid UTF-8");

  const char *p = text.data();
  const char *end = p + text.size();
  const char *start = p;
  while (p < end) {
    int n = UTF8::CharLen(p);
    int ch = UTF8::Decode(p, n);
    p += n;
    if (!IsTerminator(ch)) continue;

    // Attach trailing terminators and closing punctuation.
    while (p < end) {
      n = UTF8::CharLen(p);
      ch = UTF8::Decode(p, n);
      if (!IsTerminator(ch) && !IsCloser(ch)) break;
      p += n;
    }

    Emit(start, p, sentences);
    start = p;
  }

  // Remaining text without terminator.
  Emit(start, end, sentences);

  if (sentences->empty()) return InvalidInput("text has no sentences");
  VLOG(2) << "Split text into " << sentences->size() << " sentences";
  return Status::OK;
}

}  // namespace nlp
}  // namespace factfuse
