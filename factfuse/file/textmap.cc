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

#include "factfuse/file/textmap.h"

#include <stdlib.h>

#include "factfuse/base/logging.h"
#include "factfuse/base/status.h"
#include "factfuse/base/types.h"
#include "factfuse/file/file.h"

namespace factfuse {

TextMapInput::TextMapInput(int buffer_size) : buffer_size_(buffer_size) {
  // Allocate input buffer.
  buffer_ = static_cast<char *>(malloc(buffer_size));
  CHECK(buffer_ != nullptr);
  next_ = end_ = buffer_;
}

TextMapInput::~TextMapInput() {
  free(buffer_);
  if (file_ != nullptr) {
    Status st = file_->Close();
    if (!st.ok()) LOG(WARNING) << st;
  }
}

Status TextMapInput::Open(const string &filename) {
  CHECK(file_ == nullptr) << "Text map already open";
  return File::Open(filename, "r", &file_);
}

bool TextMapInput::Next() {
  if (file_ == nullptr) return false;
  key_.clear();
  value_.clear();

  // Read key.
  int c;
  while ((c = NextChar()) != -1) {
    if (c == '\t' || c == '\n') break;
    key_.push_back(c);
  }

  // Read value.
  if (c == '\t') {
    while ((c = NextChar()) != -1) {
      if (c == '\n') break;
      value_.push_back(c);
    }
  }

  // Strip carriage return from DOS line endings.
  string &last = value_.empty() ? key_ : value_;
  if (!last.empty() && last.back() == '\r') last.pop_back();

  if (c == -1 && key_.empty() && value_.empty()) {
    // No more lines in file.
    Status st = file_->Close();
    file_ = nullptr;
    if (status_.ok()) status_ = st;
    return false;
  }

  id_++;
  return true;
}

int TextMapInput::Fill() {
  DCHECK(next_ == end_);
  DCHECK(file_ != nullptr);
  uint64 bytes;
  Status st = file_->Read(buffer_, buffer_size_, &bytes);
  if (!st.ok()) {
    status_ = st;
    return -1;
  }
  if (bytes == 0) return -1;
  next_ = buffer_;
  end_ = buffer_ + bytes;
  return static_cast<uint8>(*next_++);
}

}  // namespace factfuse
