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

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "factfuse/base/flags.h"
#include "factfuse/base/init.h"
#include "factfuse/base/logging.h"
#include "factfuse/nlp/fact/classifier.h"
#include "factfuse/nlp/fact/fact-errors.h"
#include "factfuse/nlp/fact/tests/fake-collaborators.h"

DEFINE_string(testdata, "data/testdata", "Test data directory");

using namespace factfuse;
using namespace factfuse::nlp;

static void CheckNear(float actual, float expected) {
  CHECK_LT(std::fabs(actual - expected), 1e-5)
      << "expected " << expected << ", got " << actual;
}

static void TestAveraging() {
  Ensemble ensemble;
  ensemble.Add(new FixedClassifier(0.2));
  ensemble.Add(new FixedClassifier(0.6));
  ensemble.Add(new FixedClassifier(0.7));
  CHECK_EQ(ensemble.size(), 3);

  ClassProbabilities probs;
  CHECK(ensemble.Classify("句子。", &probs));
  CHECK_EQ(probs.size(), 2);
  CheckNear(probs[FACT], 0.5);
  CheckNear(probs[NOT_FACT], 0.5);

  float fact;
  CHECK(ensemble.FactProbability("句子。", &fact));
  CheckNear(fact, 0.5);
}

static void TestSingleMember() {
  Ensemble ensemble;
  FixedClassifier *member = new FixedClassifier(0.8);
  member->Set("意见。", 0.1);
  ensemble.Add(member);

  float fact;
  CHECK(ensemble.FactProbability("事实。", &fact));
  CheckNear(fact, 0.8);
  CHECK(ensemble.FactProbability("意见。", &fact));
  CheckNear(fact, 0.1);
  CHECK_EQ(member->calls(), 2);
}

static void TestEmptyEnsemble() {
  Ensemble ensemble;
  CHECK(ensemble.empty());
  float fact;
  CHECK_EQ(ensemble.FactProbability("句子。", &fact).code(),
           CLASSIFIER_FAILURE);
}

static void TestMemberFailures() {
  FailingClassifier::Mode modes[] = {
    FailingClassifier::RETURN_ERROR,
    FailingClassifier::WRONG_SIZE,
    FailingClassifier::NOT_NORMALIZED,
    FailingClassifier::NOT_FINITE,
  };
  for (FailingClassifier::Mode mode : modes) {
    Ensemble ensemble;
    ensemble.Add(new FixedClassifier(0.5));
    ensemble.Add(new FailingClassifier("坏", mode));

    float fact;
    CHECK(ensemble.FactProbability("好句子。", &fact));
    CheckNear(fact, 0.5);
    CHECK_EQ(ensemble.FactProbability("坏句子。", &fact).code(),
             CLASSIFIER_FAILURE);
  }
}

static void TestValidate() {
  CHECK(Ensemble::Validate({0.25, 0.75}));
  CHECK(Ensemble::Validate({0.0, 1.0}));
  CHECK(Ensemble::Validate({0.3, 0.7005}));
  CHECK_EQ(Ensemble::Validate({1.0}).code(), CLASSIFIER_FAILURE);
  CHECK_EQ(Ensemble::Validate({0.6, 0.6}).code(), CLASSIFIER_FAILURE);
  CHECK_EQ(Ensemble::Validate({-0.5, 1.5}).code(), CLASSIFIER_FAILURE);
  CHECK_EQ(Ensemble::Validate({NAN, 1.0}).code(), CLASSIFIER_FAILURE);
}

static void TestNGramClassifier() {
  CHECK(Classifier::Has("ngram-logistic"));
  Ensemble ensemble;
  CHECK(LoadEnsemble("ngram-logistic", {FLAGS_testdata + "/ngram-model.tsv"},
                     &ensemble));
  CHECK_EQ(ensemble.size(), 1);

  ClassProbabilities probs;
  CHECK(ensemble.Classify("根据", &probs));
  CheckNear(probs[FACT], 1.0 / (1.0 + std::exp(-1.0)));
  CheckNear(probs[NOT_FACT] + probs[FACT], 1.0);

  float fact;
  CHECK(ensemble.FactProbability("觉得", &fact));
  CheckNear(fact, 1.0 / (1.0 + std::exp(1.7)));
  CHECK(ensemble.FactProbability("你好", &fact));
  CheckNear(fact, 1.0 / (1.0 + std::exp(0.2)));

  // Whitespace between characters is ignored.
  CHECK(ensemble.FactProbability("根 据", &fact));
  CheckNear(fact, 1.0 / (1.0 + std::exp(-1.0)));
}

static void TestNGramEnsemble() {
  Ensemble ensemble;
  CHECK(LoadEnsemble("ngram-logistic",
                     {FLAGS_testdata + "/ngram-model.tsv",
                      FLAGS_testdata + "/ngram-uniform.tsv"},
                     &ensemble));
  CHECK_EQ(ensemble.size(), 2);
  float fact;
  CHECK(ensemble.FactProbability("根据", &fact));
  CheckNear(fact, (1.0 / (1.0 + std::exp(-1.0)) + 0.5) / 2);
}

static void TestLoadErrors() {
  Ensemble ensemble;
  CHECK_EQ(LoadEnsemble("bert", {"model"}, &ensemble).code(), CONFIG_ERROR);
  CHECK_EQ(LoadEnsemble("ngram-logistic", {}, &ensemble).code(),
           CONFIG_ERROR);
  CHECK_EQ(LoadEnsemble("ngram-logistic",
                        {FLAGS_testdata + "/ngram-bad.tsv"},
                        &ensemble).code(),
           CONFIG_ERROR);
  CHECK(!LoadEnsemble("ngram-logistic", {FLAGS_testdata + "/missing.tsv"},
                      &ensemble).ok());
  CHECK(ensemble.empty());
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestAveraging();
  TestSingleMember();
  TestEmptyEnsemble();
  TestMemberFailures();
  TestValidate();
  TestNGramClassifier();
  TestNGramEnsemble();
  TestLoadErrors();

  std::cout << "PASS\n";
  return 0;
}
