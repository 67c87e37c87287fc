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

#ifndef FACTFUSE_NLP_FACT_CUE_LEXICON_H_
#define FACTFUSE_NLP_FACT_CUE_LEXICON_H_

#include <string>
#include <unordered_set>
#include <vector>

#include "factfuse/base/status.h"
#include "factfuse/base/types.h"
#include "factfuse/string/text.h"

namespace factfuse {
namespace nlp {

// List of cue phrases. Phrases are kept in the order they were added and
// duplicates are ignored.
class PhraseList {
 public:
  // Add phrase to list. Surrounding whitespace is removed and empty phrases
  // are ignored. Returns true if the phrase was added.
  bool Add(Text phrase);

  // Add phrases from a UTF-8 text file with one phrase per line. Blank lines
  // and lines starting with '#' are skipped.
  Status Load(const string &filename);

  // Find the phrases that occur as literal substrings of the text. Each
  // phrase counts once no matter how often it occurs. Returns the number of
  // matching phrases and optionally the matching phrases themselves.
  int Match(Text text, std::vector<string> *matches) const;

  // Check if word is exactly one of the phrases.
  bool Contains(Text word) const { return index_.count(word.str()) > 0; }

  // Number of phrases.
  int size() const { return phrases_.size(); }
  bool empty() const { return phrases_.empty(); }

  // All phrases in insertion order.
  const std::vector<string> &phrases() const { return phrases_; }

 private:
  std::vector<string> phrases_;
  std::unordered_set<string> index_;
};

// Lexical cue lists used for rule-based scoring.
struct CueLexicon {
  // Subjective stance markers, e.g. hedges and modal expressions.
  PhraseList opinion_cues;

  // Citation and evidence markers.
  PhraseList fact_cues;

  // Degree and intensity adverbs.
  PhraseList degree_adverbs;

  // Load all cue lists from files.
  Status Load(const string &opinion_file, const string &fact_file,
              const string &adverb_file);
};

}  // namespace nlp
}  // namespace factfuse

#endif  // FACTFUSE_NLP_FACT_CUE_LEXICON_H_
