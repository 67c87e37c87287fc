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

#include "factfuse/util/utf8.h"

#include <string>

#include "factfuse/base/logging.h"
#include "factfuse/base/types.h"

namespace factfuse {

int UTF8::CharLen(const char *s) {
  uint8 c = *reinterpret_cast<const uint8 *>(s);
  if (c < 0xc0) return 1;
  if (c < 0xe0) return 2;
  if (c < 0xf0) return 3;
  if (c < 0xf8) return 4;
  return 1;
}

bool UTF8::Valid(const char *s, int len) {
  const char *end = s + len;
  while (s < end) {
    int n = CharLen(s);
    if (end - s < n || Decode(s, n) < 0) return false;
    s += n;
  }
  return true;
}

int UTF8::Decode(const char *s, int len) {
  // No more data.
  if (len <= 0) return -1;

  // One character sequence (7-bit value).
  int c0 = *reinterpret_cast<const uint8 *>(s);
  if (c0 < 0x80) return c0;
  if (len <= 1) return -1;

  // Two character sequence (11-bit value).
  int c1 = *reinterpret_cast<const uint8 *>(s + 1) ^ 0x80;
  if (c1 & 0xc0) return -1;
  if (c0 < 0xe0) {
    if (c0 < 0xc0) return -1;
    int code = ((c0 << 6) | c1) & 0x07ff;
    if (code <= 0x7f) return -1;
    return code;
  }
  if (len <= 2) return -1;

  // Three character sequence (16-bit value). Surrogates are not scalar
  // values.
  int c2 = *reinterpret_cast<const uint8 *>(s + 2) ^ 0x80;
  if (c2 & 0xc0) return -1;
  if (c0 < 0xf0) {
    int code = ((((c0 << 6) | c1) << 6) | c2) & 0xffff;
    if (code <= 0x07ff) return -1;
    if (code >= 0xd800 && code <= 0xdfff) return -1;
    return code;
  }
  if (len <= 3) return -1;

  // Four character sequence (21-bit value).
  int c3 = *reinterpret_cast<const uint8 *>(s + 3) ^ 0x80;
  if (c3 & 0xc0) return -1;
  if (c0 < 0xf8) {
    int code = ((((((c0 << 6) | c1) << 6) | c2) << 6) | c3) & 0x001fffff;
    if (code <= 0xffff || code > 0x10ffff) return -1;
    return code;
  }

  return -1;
}

bool UTF8::IsSpace(int c) {
  switch (c) {
    case ' ': case '\t': case '\n': case '\r': case '\f': case '\v':
    case 0x85:    // next line
    case 0xa0:    // no-break space
    case 0x2028:  // line separator
    case 0x2029:  // paragraph separator
    case 0x202f:  // narrow no-break space
    case 0x3000:  // ideographic space
    case 0xfeff:  // byte order mark
      return true;
    default:
      return c >= 0x2000 && c <= 0x200b;
  }
}

Text UTF8::Trim(Text text) {
  const char *begin = text.data();
  const char *end = begin + text.size();

  // Skip leading whitespace.
  while (begin < end) {
    int n = CharLen(begin);
    if (n > end - begin || !IsSpace(Decode(begin, n))) break;
    begin += n;
  }

  // Skip trailing whitespace. Step back over continuation bytes to find the
  // start of the last character.
  while (end > begin) {
    const char *last = end - 1;
    while (last > begin && (*last & 0xc0) == 0x80) last--;
    if (!IsSpace(Decode(last, end - last))) break;
    end = last;
  }

  return Text(begin, end - begin);
}

}  // namespace factfuse
