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

#include <unistd.h>
#include <iostream>
#include <string>
#include <vector>

#include "factfuse/base/flags.h"
#include "factfuse/base/init.h"
#include "factfuse/base/logging.h"
#include "factfuse/file/file.h"
#include "factfuse/nlp/fact/cue-lexicon.h"
#include "factfuse/nlp/fact/fact-errors.h"

DEFINE_string(lexicon, "data/lexicon", "Directory with cue lexicon files");

using namespace factfuse;
using namespace factfuse::nlp;

// Write temporary file and return its name.
static string TempFile(const string &name, const string &contents) {
  string filename = "/tmp/cue-lexicon-test-" + std::to_string(getpid()) +
                    "-" + name;
  CHECK(File::WriteContents(filename, contents));
  return filename;
}

static void TestAdd() {
  PhraseList list;
  CHECK(list.Add("觉得"));
  CHECK(list.Add("  我觉得 "));
  CHECK(!list.Add("觉得"));
  CHECK(!list.Add("　"));
  CHECK_EQ(list.size(), 2);
  CHECK_EQ(list.phrases()[0], "觉得");
  CHECK_EQ(list.phrases()[1], "我觉得");
  CHECK(list.Contains("我觉得"));
  CHECK(!list.Contains("我"));
}

static void TestMatchCountsPhrasesOnce() {
  PhraseList list;
  list.Add("我觉得");
  list.Add("觉得");
  list.Add("可能");

  std::vector<string> matches;
  CHECK_EQ(list.Match("我觉得我觉得这样不对。", &matches), 2);
  CHECK_EQ(matches.size(), 2);
  CHECK_EQ(matches[0], "我觉得");
  CHECK_EQ(matches[1], "觉得");

  CHECK_EQ(list.Match("这是事实。", nullptr), 0);
  CHECK_EQ(list.Match("可能可能可能", nullptr), 1);
}

static void TestLoad() {
  string filename = TempFile("phrases.txt",
                             "# comment\n"
                             "根据\n"
                             "\n"
                             "  据悉  \r\n"
                             "根据\n"
                             "#据报道\n");
  PhraseList list;
  CHECK(list.Load(filename));
  CHECK_EQ(list.size(), 2);
  CHECK(list.Contains("根据"));
  CHECK(list.Contains("据悉"));
  CHECK(!list.Contains("#据报道"));
  CHECK(File::Delete(filename));
}

static void TestLoadErrors() {
  PhraseList list;
  CHECK(!list.Load("/tmp/no-such-cue-lexicon-file.txt").ok());

  string filename = TempFile("broken.txt", "根据\n\xfe\xff\n");
  Status st = list.Load(filename);
  CHECK_EQ(st.code(), CONFIG_ERROR);
  CHECK(File::Delete(filename));
}

static void TestDefaultLexicon() {
  CueLexicon lexicon;
  CHECK(lexicon.Load(FLAGS_lexicon + "/opinion-cues.txt",
                     FLAGS_lexicon + "/fact-cues.txt",
                     FLAGS_lexicon + "/degree-adverbs.txt"));
  CHECK(lexicon.opinion_cues.Contains("我觉得"));
  CHECK(lexicon.fact_cues.Contains("根据"));
  CHECK(lexicon.degree_adverbs.Contains("很"));
  CHECK(!lexicon.opinion_cues.Contains("根据"));
  CHECK_EQ(lexicon.fact_cues.Match("根据最新的数据，他们的市场份额正在扩大。",
                                   nullptr), 1);
  CHECK_EQ(lexicon.opinion_cues.Match(
               "根据最新的数据，他们的市场份额正在扩大。", nullptr), 0);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestAdd();
  TestMatchCountsPhrasesOnce();
  TestLoad();
  TestLoadErrors();
  TestDefaultLexicon();

  std::cout << "PASS\n";
  return 0;
}
