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

// Score Chinese text for fact/opinion leaning, one output line per sentence:
//
//   index<TAB>probability<TAB>model<TAB>logic<TAB>sentence

#include <stdio.h>
#include <iostream>
#include <string>
#include <vector>

#include "factfuse/base/clock.h"
#include "factfuse/base/flags.h"
#include "factfuse/base/init.h"
#include "factfuse/base/logging.h"
#include "factfuse/base/registry.h"
#include "factfuse/base/types.h"
#include "factfuse/file/file.h"
#include "factfuse/nlp/fact/annotator.h"
#include "factfuse/nlp/fact/classifier.h"
#include "factfuse/nlp/fact/cue-lexicon.h"
#include "factfuse/nlp/fact/fact-errors.h"
#include "factfuse/nlp/fact/fact-pipeline.h"
#include "factfuse/nlp/fact/sentence-splitter.h"
#include "factfuse/string/text.h"

DEFINE_string(text, "", "Text to score");
DEFINE_string(input, "", "File with text to score");
DEFINE_string(output, "", "Output file (default stdout)");
DEFINE_string(opinion_cues, "data/lexicon/opinion-cues.txt",
              "Opinion cue phrases");
DEFINE_string(fact_cues, "data/lexicon/fact-cues.txt", "Fact cue phrases");
DEFINE_string(degree_adverbs, "data/lexicon/degree-adverbs.txt",
              "Degree adverbs");
DEFINE_string(annotator, "conllu", "Dependency annotator type");
DEFINE_string(annotations, "", "Annotator resource, e.g. CoNLL-U file");
DEFINE_string(classifier, "ngram-logistic", "Classifier type");
DEFINE_string(models, "", "Comma-separated classifier models in ensemble");
DEFINE_double(fusion_weight, 0.1, "Weight of logic score in fusion");
DEFINE_int32(workers, 4, "Number of worker threads");
DEFINE_string(terminators,
              factfuse::nlp::SentenceSplitter::kDefaultTerminators,
              "Sentence terminators");
DEFINE_bool(explain, false, "Log the rules that fired for each sentence");
DEFINE_bool(list_components, false, "List registered components and exit");

DECLARE_bool(logtostderr);

using namespace factfuse;
using namespace factfuse::nlp;

// Output line for scored sentence.
static string FormatResult(const ScoredSentence &s) {
  char buf[128];
  snprintf(buf, sizeof(buf), "%d\t%.4f\t%.4f\t%.2f\t", s.index,
           s.probability, s.model_probability, s.logic_score);
  return buf + s.text + "\n";
}

// Output registered annotators and classifiers.
static void ListComponents() {
  std::vector<const RegistryMetadata *> registries;
  RegistryMetadata::GetRegistries(&registries);
  for (const RegistryMetadata *registry : registries) {
    std::cout << registry->name() << " (" << registry->class_name() << "):\n";
    std::vector<const ComponentMetadata *> components;
    registry->GetComponents(&components);
    for (const ComponentMetadata *component : components) {
      std::cout << "  " << component->name() << "  " << component->class_name()
                << "  " << component->file() << ":" << component->line()
                << "\n";
    }
  }
}

// Create annotator of the requested type.
static Status CreateAnnotator(Annotator **annotator) {
  *annotator = nullptr;
  if (!Annotator::Has(FLAGS_annotator)) {
    return ConfigError("unknown annotator type: " + FLAGS_annotator);
  }
  Annotator *a = Annotator::Create(FLAGS_annotator);
  Status st = a->Load(FLAGS_annotations);
  if (!st.ok()) {
    delete a;
    return st;
  }
  *annotator = a;
  return Status::OK;
}

// Load lexicon and collaborators, then score the input text and write the
// results.
static Status Run() {
  // Get input text.
  string text;
  Status st;
  if (!FLAGS_input.empty()) {
    st = File::ReadContents(FLAGS_input, &text);
    if (!st.ok()) return st;
  } else {
    text = FLAGS_text;
  }

  // Load cue lexicon.
  CueLexicon lexicon;
  st = lexicon.Load(FLAGS_opinion_cues, FLAGS_fact_cues, FLAGS_degree_adverbs);
  if (!st.ok()) return st;

  // Load collaborators. The pipeline owns them from Init() on.
  Annotator *annotator;
  st = CreateAnnotator(&annotator);
  if (!st.ok()) return st;

  std::vector<string> models;
  for (Text model : SplitText(FLAGS_models, ',')) {
    model = model.trim();
    if (!model.empty()) models.push_back(model.str());
  }
  Ensemble *ensemble = new Ensemble();
  st = LoadEnsemble(FLAGS_classifier, models, ensemble);
  if (!st.ok()) {
    delete annotator;
    delete ensemble;
    return st;
  }

  // Set up pipeline.
  FactPipelineOptions options;
  options.terminators = FLAGS_terminators;
  options.fusion.weight = FLAGS_fusion_weight;
  options.dispatcher.num_workers = FLAGS_workers;
  options.trace_rules = FLAGS_explain;
  FactPipeline pipeline;
  st = pipeline.Init(lexicon, annotator, ensemble, options);
  if (!st.ok()) return st;

  // Score text.
  Clock clock;
  clock.start();
  std::vector<ScoredSentence> results;
  st = pipeline.Score(text, &results);
  clock.stop();
  if (!st.ok()) return st;
  LOG(INFO) << "Scored " << results.size() << " sentences in "
            << clock.ms() << " ms";

  // Output results.
  string output;
  for (const ScoredSentence &s : results) {
    if (FLAGS_explain) {
      for (const RuleHit &hit : s.hits) {
        LOG(INFO) << "sentence " << s.index << ": " << hit.rule << " '"
                  << hit.text << "' " << hit.contribution;
      }
    }
    output.append(FormatResult(s));
  }
  if (!FLAGS_output.empty()) return File::WriteContents(FLAGS_output, output);
  std::cout << output;
  std::cout.flush();
  return Status::OK;
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);
  if (FLAGS_list_components) {
    ListComponents();
    return 0;
  }

  // Keep log messages out of the results on stdout.
  if (FLAGS_output.empty()) FLAGS_logtostderr = true;

  Status st = Run();
  if (!st.ok()) {
    LOG(ERROR) << "fact-scorer failed: " << st;
    return 1;
  }
  return 0;
}
