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

#include "factfuse/string/text.h"

#include <string.h>
#include <algorithm>
#include <ostream>
#include <string>

#include "factfuse/base/logging.h"
#include "factfuse/base/types.h"

namespace factfuse {

const Text::size_type Text::npos = size_type(-1);

static const char *memmatch(const char *haystack, size_t hlen,
                            const char *needle, size_t nlen) {
  if (nlen == 0) return haystack;  // even if haylen is 0
  if (hlen < nlen) return nullptr;

  const char *match;
  const char *hayend = haystack + hlen - nlen + 1;
  while ((match = static_cast<const char *>(memchr(haystack, needle[0],
                                                   hayend - haystack)))) {
    if (memcmp(match, needle, nlen) == 0) return match;
    haystack = match + 1;
  }
  return nullptr;
}

static inline bool IsAsciiSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

ssize_t Text::find(Text t, size_type pos) const {
  if (length_ <= 0 || pos > static_cast<size_type>(length_)) {
    if (length_ == 0 && pos == 0 && t.length_ == 0) return 0;
    return npos;
  }
  const char *result = memmatch(ptr_ + pos, length_ - pos, t.ptr_, t.length_);
  return result ? result - ptr_ : npos;
}

ssize_t Text::find(char c, size_type pos) const {
  if (length_ <= 0 || pos >= static_cast<size_type>(length_)) {
    return npos;
  }
  const char *result =
    static_cast<const char *>(memchr(ptr_ + pos, c, length_ - pos));
  return result != nullptr ? result - ptr_ : npos;
}

Text Text::substr(size_type pos, size_type n) const {
  size_type length = length_;
  if (pos > length) pos = length;
  if (n > length - pos) n = length - pos;
  return Text(ptr_ + pos, n);
}

Text Text::trim() const {
  const char *begin = ptr_;
  const char *end = ptr_ + length_;
  while (begin < end && IsAsciiSpace(*begin)) begin++;
  while (end > begin && IsAsciiSpace(end[-1])) end--;
  return Text(begin, end - begin);
}

std::ostream &operator <<(std::ostream &o, Text t) {
  o.write(t.data(), t.size());
  return o;
}

std::vector<Text> SplitText(Text text, char delim) {
  std::vector<Text> fields;
  ssize_t start = 0;
  for (;;) {
    ssize_t pos = text.find(delim, start);
    if (pos == static_cast<ssize_t>(Text::npos)) {
      fields.emplace_back(text.data() + start, text.size() - start);
      break;
    }
    fields.emplace_back(text.data() + start, pos - start);
    start = pos + 1;
  }
  return fields;
}

}  // namespace factfuse
