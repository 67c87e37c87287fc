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

#ifndef FACTFUSE_NLP_FACT_CONLLU_H_
#define FACTFUSE_NLP_FACT_CONLLU_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "factfuse/base/status.h"
#include "factfuse/base/types.h"
#include "factfuse/nlp/fact/annotator.h"
#include "factfuse/string/text.h"

namespace factfuse {
namespace nlp {

// Sentence read from a CoNLL-U file.
struct ConlluSentence {
  // Sentence text from the "# text = ..." comment. If there is no text
  // comment, the text is the concatenation of the word forms.
  string text;

  // Syntactic words of the sentence. Multi-word token lines and empty nodes
  // are not included.
  std::vector<AnnotatedWord> words;
};

// Reader for dependency parses in CoNLL-U format. Each word line has ten
// tab-separated columns: ID FORM LEMMA UPOS XPOS FEATS HEAD DEPREL DEPS MISC.
// Sentences are separated by blank lines.
class ConlluReader {
 public:
  // Parse CoNLL-U contents. Returns CONFIG_ERROR with the line number for
  // malformed lines.
  static Status Parse(Text contents, std::vector<ConlluSentence> *sentences);

  // Read CoNLL-U file.
  static Status Read(const string &filename,
                     std::vector<ConlluSentence> *sentences);
};

// Annotator serving precomputed parses from a CoNLL-U file. Sentences are
// looked up by their text, so the file must contain every sentence that will
// be scored.
class ConlluAnnotator : public Annotator {
 public:
  // Load parses from CoNLL-U file.
  Status Load(const string &resource) override;

  // Add parsed sentence. Later entries for the same text are ignored.
  void Add(const ConlluSentence &sentence);

  // Look up the parse for the sentence.
  Status Annotate(Text sentence,
                  std::vector<AnnotatedWord> *words) const override;

  // Number of parsed sentences.
  int size() const { return parses_.size(); }

 private:
  // Parsed words for each sentence text.
  std::unordered_map<string, std::vector<AnnotatedWord>> parses_;
};

}  // namespace nlp
}  // namespace factfuse

#endif  // FACTFUSE_NLP_FACT_CONLLU_H_
