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

#ifndef FACTFUSE_STRING_TEXT_H_
#define FACTFUSE_STRING_TEXT_H_

#include <string.h>
#include <sys/types.h>
#include <iosfwd>
#include <string>
#include <vector>

#include "factfuse/base/logging.h"
#include "factfuse/base/types.h"

namespace factfuse {

// Non-owning reference to a sequence of bytes, usually UTF-8 encoded text.
class Text {
 private:
  const char *ptr_;
  ssize_t length_;

 public:
  // Constructors.
  Text() : ptr_(nullptr), length_(0) {}
  Text(const char *str) : ptr_(str), length_(str ? strlen(str) : 0) {}
  Text(const string &str) : ptr_(str.data()), length_(str.size()) {}
  Text(const char *str, ssize_t len) : ptr_(str), length_(len) {}

  // Access to string buffer.
  const char *data() const { return ptr_; }
  ssize_t size() const { return length_; }
  ssize_t length() const { return length_; }
  bool empty() const { return length_ == 0; }

  // Clear text.
  void clear() {
    ptr_ = nullptr;
    length_ = 0;
  }

  // Index operator.
  char operator[](ssize_t index) const {
    DCHECK_GE(index, 0);
    DCHECK_LT(index, length_);
    return ptr_[index];
  }

  // Remove suffix from text.
  void remove_suffix(ssize_t n) {
    DCHECK_GE(length_, n);
    length_ -= n;
  }

  // Return text as string.
  string str() const {
    if (ptr_ == nullptr) return string();
    return string(data(), size());
  }

  // Append text to string.
  void AppendToString(string *target) const {
    if (length_ > 0) target->append(ptr_, length_);
  }

  // Prefix check.
  bool starts_with(Text t) const {
    return (length_ >= t.length_) && (memcmp(ptr_, t.ptr_, t.length_) == 0);
  }

  // Suffix check.
  bool ends_with(Text t) const {
    return ((length_ >= t.length_) &&
            (memcmp(ptr_ + (length_ - t.length_), t.ptr_, t.length_) == 0));
  }

  // Iterators.
  typedef const char *const_iterator;
  typedef const char *iterator;
  typedef size_t size_type;
  static const size_type npos;

  iterator begin() const { return ptr_; }
  iterator end() const { return ptr_ + length_; }

  // Checks if text contains another text.
  bool contains(Text t) const { return find(t, 0) != npos; }

  // Find operations. Returns npos if not found.
  ssize_t find(Text t, size_type pos = 0) const;
  ssize_t find(char c, size_type pos = 0) const;

  // Substring.
  Text substr(size_type pos, size_type n = npos) const;

  // Returns text with leading and trailing ASCII whitespace removed.
  Text trim() const;
};

inline bool operator ==(Text x, Text y) {
  return x.size() == y.size() && memcmp(x.data(), y.data(), x.size()) == 0;
}

inline bool operator !=(Text x, Text y) {
  return !(x == y);
}

inline bool operator <(Text x, Text y) {
  const ssize_t min_size = x.size() < y.size() ? x.size() : y.size();
  const int r = memcmp(x.data(), y.data(), min_size);
  return (r < 0) || (r == 0 && x.size() < y.size());
}

extern std::ostream &operator <<(std::ostream &o, Text t);

// Split text into fields separated by delimiter. Empty fields are kept.
std::vector<Text> SplitText(Text text, char delim);

}  // namespace factfuse

#endif  // FACTFUSE_STRING_TEXT_H_
