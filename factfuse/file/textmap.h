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

#ifndef FACTFUSE_FILE_TEXTMAP_H_
#define FACTFUSE_FILE_TEXTMAP_H_

#include <string>

#include "factfuse/base/macros.h"
#include "factfuse/base/status.h"
#include "factfuse/base/types.h"
#include "factfuse/file/file.h"

namespace factfuse {

// A text map file is a text file with one entry per line. The key and
// value are separated by a tab character.
class TextMapInput {
 public:
  explicit TextMapInput(int buffer_size = 1 << 16);
  ~TextMapInput();

  // Open text map file for reading.
  Status Open(const string &filename);

  // Read next entry from file. Returns false if there are no more entries or
  // if a read error occurred, in which case status() holds the error.
  bool Next();

  // Return current entry id, i.e. the zero-based line number.
  int id() const { return id_; }

  // Return current key and value.
  const string &key() const { return key_; }
  const string &value() const { return value_; }

  // Status of the last read.
  const Status &status() const { return status_; }

 private:
  // Get next character from input. Returns -1 on end of file.
  int NextChar() {
    if (next_ < end_) {
      return static_cast<uint8>(*next_++);
    } else {
      return Fill();
    }
  }

  // Fill buffer and return first character or -1 if end of file.
  int Fill();

  // Input file.
  File *file_ = nullptr;

  // Input buffer.
  int buffer_size_;
  char *buffer_;
  char *next_;
  char *end_;

  // Current entry.
  int id_ = -1;

  // Current key and value.
  string key_;
  string value_;

  // Read status.
  Status status_;

  DISALLOW_COPY_AND_ASSIGN(TextMapInput);
};

}  // namespace factfuse

#endif  // FACTFUSE_FILE_TEXTMAP_H_
