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

#ifndef FACTFUSE_BASE_MACROS_H_
#define FACTFUSE_BASE_MACROS_H_

// Branch prediction hints.
#define PREDICT_FALSE(x) (__builtin_expect(x, 0))
#define PREDICT_TRUE(x) (__builtin_expect(!!(x), 1))

// Function attributes.
#define FACTFUSE_ATTRIBUTE_COLD __attribute__((cold))
#define FACTFUSE_ATTRIBUTE_NORETURN __attribute__((noreturn))
#define FACTFUSE_ATTRIBUTE_NOINLINE __attribute__((noinline))

// Put this in the private: declarations for a class to disable the copy
// constructor and assignment operator.
#define DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName &) = delete;     \
  void operator=(const TypeName &) = delete

// Number of elements in a statically sized array.
#define ARRAYSIZE(a) (sizeof(a) / sizeof(*(a)))

#endif  // FACTFUSE_BASE_MACROS_H_
