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

#include "factfuse/nlp/fact/cue-lexicon.h"

#include "factfuse/base/logging.h"
#include "factfuse/file/file.h"
#include "factfuse/nlp/fact/fact-errors.h"
#include "factfuse/util/utf8.h"

namespace factfuse {
namespace nlp {

bool PhraseList::Add(Text phrase) {
  Text trimmed = UTF8::Trim(phrase);
  if (trimmed.empty()) return false;
  string key = trimmed.str();
  if (!index_.insert(key).second) return false;
  phrases_.push_back(key);
  return true;
}

Status PhraseList::Load(const string &filename) {
  string contents;
  Status st = File::ReadContents(filename, &contents);
  if (!st.ok()) return st;
  if (!UTF8::Valid(contents)) {
    return ConfigError(filename + " is not valid UTF-8");
  }

  int added = 0;
  for (Text line : SplitText(contents, '\n')) {
    Text phrase = UTF8::Trim(line);
    if (phrase.empty() || phrase[0] == '#') continue;
    if (Add(phrase)) added++;
  }
  VLOG(1) << "Loaded " << added << " phrases from " << filename;
  return Status::OK;
}

int PhraseList::Match(Text text, std::vector<string> *matches) const {
  int count = 0;
  for (const string &phrase : phrases_) {
    if (text.contains(phrase)) {
      count++;
      if (matches != nullptr) matches->push_back(phrase);
    }
  }
  return count;
}

Status CueLexicon::Load(const string &opinion_file, const string &fact_file,
                        const string &adverb_file) {
  Status st = opinion_cues.Load(opinion_file);
  if (!st.ok()) return st;
  st = fact_cues.Load(fact_file);
  if (!st.ok()) return st;
  st = degree_adverbs.Load(adverb_file);
  if (!st.ok()) return st;
  LOG(INFO) << "Cue lexicon: " << opinion_cues.size() << " opinion cues, "
            << fact_cues.size() << " fact cues, "
            << degree_adverbs.size() << " degree adverbs";
  return Status::OK;
}

}  // namespace nlp
}  // namespace factfuse
