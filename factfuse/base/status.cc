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

#include "factfuse/base/status.h"

#include <stdlib.h>
#include <string.h>
#include <string>

#include "factfuse/base/logging.h"
#include "factfuse/base/types.h"

namespace factfuse {

const Status &Status::OK = Status();

Status::State *Status::CopyState(const State *s) {
  if (s == nullptr) return nullptr;
  int size = sizeof(State) + s->length + 1;
  State *result = static_cast<State *>(malloc(size));
  CHECK(result != nullptr);
  memcpy(result, s, size);
  return result;
}

Status::State *Status::NewState(int code, const char *prefix,
                                const char *msg) {
  DCHECK_NE(code, 0);
  int prefix_length = prefix == nullptr ? 0 : strlen(prefix);
  int msg_length = strlen(msg);

  // Prefix and message are separated by ": ".
  int length = msg_length;
  if (prefix_length > 0) length += prefix_length + 2;

  State *state = static_cast<State *>(malloc(sizeof(State) + length + 1));
  CHECK(state != nullptr);
  state->length = length;
  state->code = code;
  char *p = state->message();
  if (prefix_length > 0) {
    memcpy(p, prefix, prefix_length);
    p += prefix_length;
    *p++ = ':';
    *p++ = ' ';
  }
  memcpy(p, msg, msg_length + 1);
  return state;
}

Status::Status(int code, const char *msg)
    : state_(NewState(code, nullptr, msg)) {}

Status::Status(int code, const char *msg1, const char *msg2)
    : state_(NewState(code, msg1, msg2)) {}

Status::Status(int code, const char *msg1, const string &msg2)
    : state_(NewState(code, msg1, msg2.c_str())) {}

Status::Status(int code, const string &msg)
    : state_(NewState(code, nullptr, msg.c_str())) {}

Status Status::WithContext(const string &context) const {
  if (ok()) return Status();
  Status result;
  result.state_ = NewState(code(), context.c_str(), message());
  return result;
}

string Status::ToString() const {
  if (state_ == nullptr) {
    return "OK";
  } else {
    return "ERROR " + std::to_string(state_->code) + ": " + state_->message();
  }
}

}  // namespace factfuse
