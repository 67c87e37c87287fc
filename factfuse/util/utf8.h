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

#ifndef FACTFUSE_UTIL_UTF8_H_
#define FACTFUSE_UTIL_UTF8_H_

#include <string>

#include "factfuse/base/types.h"
#include "factfuse/string/text.h"

namespace factfuse {

// UTF-8 decoding and character classification.
class UTF8 {
 public:
  // Return the length in bytes of the UTF8 character starting with the lead
  // byte. Continuation and invalid lead bytes count as one byte.
  static int CharLen(const char *s);

  // Check if string is structurally valid, i.e. well-formed, shortest-form
  // encoding of Unicode scalar values.
  static bool Valid(const char *s, int len);
  static bool Valid(Text s) { return Valid(s.data(), s.size()); }

  // Return next UTF8 code point in string. Returns -1 on errors.
  static int Decode(const char *s, int len);

  // Check for Unicode whitespace, including no-break and ideographic space.
  static bool IsSpace(int c);

  // Return text with leading and trailing Unicode whitespace removed.
  static Text Trim(Text text);
};

}  // namespace factfuse

#endif  // FACTFUSE_UTIL_UTF8_H_
