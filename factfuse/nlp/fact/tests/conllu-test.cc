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

#include <iostream>
#include <string>
#include <vector>

#include "factfuse/base/flags.h"
#include "factfuse/base/init.h"
#include "factfuse/base/logging.h"
#include "factfuse/nlp/fact/annotator.h"
#include "factfuse/nlp/fact/conllu.h"
#include "factfuse/nlp/fact/fact-errors.h"

DEFINE_string(testdata, "data/testdata", "Test data directory");

using namespace factfuse;
using namespace factfuse::nlp;

static void TestRead() {
  std::vector<ConlluSentence> sentences;
  CHECK(ConlluReader::Read(FLAGS_testdata + "/sample.conllu", &sentences));
  CHECK_EQ(sentences.size(), 4);

  const ConlluSentence &first = sentences[0];
  CHECK_EQ(first.text, "根据最新的数据，他们的市场份额正在扩大。");
  CHECK_EQ(first.words.size(), 12);
  CHECK_EQ(first.words[8].text, "份额");
  CHECK_EQ(first.words[8].pos, "NOUN");
  CHECK_EQ(first.words[8].relation, "nsubj");
  CHECK(first.words[8].features.empty());
  CHECK(first.words[9].HasFeature("Aspect=Prog"));

  // Multi-word token line is skipped.
  const ConlluSentence &second = sentences[1];
  CHECK_EQ(second.words.size(), 8);
  CHECK_EQ(second.words[2].text, "这");
  CHECK_EQ(second.words[3].text, "个");

  // Empty node is skipped.
  const ConlluSentence &third = sentences[2];
  CHECK_EQ(third.words.size(), 5);
  CHECK_EQ(third.words[3].text, "出发");
  CHECK(third.words[3].HasFeature("Mood=Pot"));
  CHECK(!third.words[3].HasFeature("Mood"));

  // Text is reconstructed from the forms without a text comment.
  CHECK_EQ(sentences[3].text, "数据公布了。");
  CHECK_EQ(sentences[3].words[0].relation, "nsubj:pass");
}

static void TestParseErrors() {
  std::vector<ConlluSentence> sentences;
  Status st = ConlluReader::Parse("# text = 好。\n1\t好\t好\tADJ\n", &sentences);
  CHECK_EQ(st.code(), CONFIG_ERROR);

  CHECK(ConlluReader::Parse("", &sentences));
  CHECK(sentences.empty());

  std::vector<ConlluSentence> missing;
  CHECK(!ConlluReader::Read(FLAGS_testdata + "/missing.conllu", &missing).ok());
}

static void TestFeatures() {
  AnnotatedWord word("会", "VERB", "root", "Mood=Pot|Tense=Fut");
  CHECK(word.HasFeature("Mood=Pot"));
  CHECK(word.HasFeature("Tense=Fut"));
  CHECK(!word.HasFeature("Mood=Sub"));
  AnnotatedWord plain("书", "NOUN", "obj", "");
  CHECK(!plain.HasFeature("Mood=Pot"));
}

static void TestAnnotator() {
  CHECK(Annotator::Has("conllu"));
  Annotator *annotator = Annotator::Create("conllu");
  CHECK(annotator->Load(FLAGS_testdata + "/sample.conllu"));

  std::vector<AnnotatedWord> words;
  CHECK(annotator->Annotate("  我觉得这个产品很棒。 ", &words));
  CHECK_EQ(words.size(), 8);
  CHECK_EQ(words[6].text, "棒");
  CHECK_EQ(words[6].pos, "ADJ");

  Status st = annotator->Annotate("没有分析的句子。", &words);
  CHECK_EQ(st.code(), ANNOTATION_FAILURE);

  delete annotator;
}

static void TestNullAnnotator() {
  CHECK(Annotator::Has("none"));
  CHECK(!Annotator::Has("spacy"));
  Annotator *annotator = Annotator::Create("none");
  CHECK(annotator->Load(""));
  std::vector<AnnotatedWord> words;
  words.emplace_back("x", "X", "dep", "");
  CHECK(annotator->Annotate("任何句子。", &words));
  CHECK(words.empty());
  delete annotator;
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestRead();
  TestParseErrors();
  TestFeatures();
  TestAnnotator();
  TestNullAnnotator();

  std::cout << "PASS\n";
  return 0;
}
