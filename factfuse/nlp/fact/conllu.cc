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

#include "factfuse/nlp/fact/conllu.h"

#include <utility>

#include "factfuse/base/logging.h"
#include "factfuse/file/file.h"
#include "factfuse/nlp/fact/fact-errors.h"
#include "factfuse/util/utf8.h"

namespace factfuse {
namespace nlp {

// Number of columns in CoNLL-U word lines.
static const size_t kConlluColumns = 10;

// Column indices.
enum ConlluColumn {
  CONLLU_ID = 0,
  CONLLU_FORM = 1,
  CONLLU_UPOS = 3,
  CONLLU_FEATS = 5,
  CONLLU_DEPREL = 7,
};

// Column value with "_" meaning unspecified.
static string Field(Text value) {
  if (value == "_") return string();
  return value.str();
}

Status ConlluReader::Parse(Text contents,
                           std::vector<ConlluSentence> *sentences) {
  sentences->clear();
  ConlluSentence current;
  bool has_text = false;
  bool open = false;
  int lineno = 0;

  // Finish the current sentence.
  auto flush = [&]() {
    if (open) {
      if (!has_text) {
        for (const AnnotatedWord &word : current.words) {
          current.text.append(word.text);
        }
      }
      sentences->push_back(std::move(current));
    }
    current = ConlluSentence();
    has_text = false;
    open = false;
  };

  for (Text line : SplitText(contents, '\n')) {
    lineno++;
    if (line.ends_with("\r")) line.remove_suffix(1);

    // Blank line ends sentence.
    if (line.trim().empty()) {
      flush();
      continue;
    }

    // Comment lines.
    if (line[0] == '#') {
      open = true;
      Text comment = line.substr(1).trim();
      if (comment.starts_with("text")) {
        Text rest = comment.substr(4).trim();
        if (!rest.empty() && rest[0] == '=') {
          current.text = UTF8::Trim(rest.substr(1)).str();
          has_text = true;
        }
      }
      continue;
    }

    // Word line.
    std::vector<Text> columns = SplitText(line, '\t');
    if (columns.size() != kConlluColumns) {
      return ConfigError("CoNLL-U line " + std::to_string(lineno) + " has " +
                         std::to_string(columns.size()) + " columns");
    }
    open = true;

    // Skip multi-word tokens (1-2) and empty nodes (1.1).
    Text id = columns[CONLLU_ID];
    if (id.find('-') != -1 || id.find('.') != -1) continue;

    current.words.emplace_back(columns[CONLLU_FORM].str(),
                               Field(columns[CONLLU_UPOS]),
                               Field(columns[CONLLU_DEPREL]),
                               Field(columns[CONLLU_FEATS]));
  }
  flush();

  return Status::OK;
}

Status ConlluReader::Read(const string &filename,
                          std::vector<ConlluSentence> *sentences) {
  string contents;
  Status st = File::ReadContents(filename, &contents);
  if (!st.ok()) return st;
  return Parse(contents, sentences).WithContext(filename);
}

Status ConlluAnnotator::Load(const string &resource) {
  std::vector<ConlluSentence> sentences;
  Status st = ConlluReader::Read(resource, &sentences);
  if (!st.ok()) return st;
  for (const ConlluSentence &sentence : sentences) Add(sentence);
  LOG(INFO) << "Loaded " << parses_.size() << " parsed sentences from "
            << resource;
  return Status::OK;
}

void ConlluAnnotator::Add(const ConlluSentence &sentence) {
  parses_.emplace(UTF8::Trim(sentence.text).str(), sentence.words);
}

Status ConlluAnnotator::Annotate(Text sentence,
                                 std::vector<AnnotatedWord> *words) const {
  auto f = parses_.find(UTF8::Trim(sentence).str());
  if (f == parses_.end()) {
    return AnnotationFailure("no parse for sentence: " + sentence.str());
  }
  *words = f->second;
  return Status::OK;
}

REGISTER_ANNOTATOR("conllu", ConlluAnnotator);

}  // namespace nlp
}  // namespace factfuse
