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

#include "factfuse/file/file.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#include <string>

#include "factfuse/base/logging.h"
#include "factfuse/base/status.h"
#include "factfuse/base/types.h"

namespace factfuse {

namespace {

Status IOError(const string &context, int error) {
  return Status(error, context.c_str(), strerror(error));
}

int OpenFlags(const char *mode) {
  int flags = 0;
  switch (*mode++) {
    case 'r': flags = O_RDONLY; break;
    case 'w': flags = O_WRONLY | O_CREAT | O_TRUNC; break;
    case 'a': flags = O_WRONLY | O_CREAT | O_APPEND; break;
  }

  if (*mode == '+') {
    flags &= ~(O_RDONLY | O_WRONLY);
    flags |= O_RDWR;
  }

  return flags;
}

}  // namespace

File::~File() {
  if (fd_ != -1) close(fd_);
}

Status File::Read(void *buffer, size_t size, uint64 *read) {
  ssize_t rc;
  do {
    rc = ::read(fd_, buffer, size);
  } while (rc < 0 && errno == EINTR);
  if (rc < 0) return IOError(filename_, errno);
  if (read) *read = rc;
  return Status::OK;
}

Status File::ReadToString(string *contents) {
  contents->clear();
  char buffer[1 << 16];
  for (;;) {
    uint64 bytes;
    Status st = Read(buffer, sizeof(buffer), &bytes);
    if (!st.ok()) return st;
    if (bytes == 0) break;
    contents->append(buffer, bytes);
  }
  return Status::OK;
}

Status File::Write(const void *buffer, size_t size) {
  const char *data = static_cast<const char *>(buffer);
  while (size > 0) {
    ssize_t rc = ::write(fd_, data, size);
    if (rc < 0) {
      if (errno == EINTR) continue;
      return IOError(filename_, errno);
    }
    if (rc == 0) return IOError(filename_, EIO);
    data += rc;
    size -= rc;
  }
  return Status::OK;
}

Status File::Close() {
  Status st;
  if (fd_ != -1) {
    if (close(fd_) != 0) st = IOError(filename_, errno);
    fd_ = -1;
  }
  delete this;
  return st;
}

Status File::Open(const string &name, const char *mode, File **f) {
  int fd = open(name.c_str(), OpenFlags(mode), 0644);
  if (fd == -1) return IOError(name, errno);
  *f = new File(fd, name);
  return Status::OK;
}

Status File::Delete(const string &name) {
  if (unlink(name.c_str()) != 0) return IOError(name, errno);
  return Status::OK;
}

Status File::ReadContents(const string &filename, string *data) {
  File *f;
  Status st = Open(filename, "r", &f);
  if (!st.ok()) return st;
  st = f->ReadToString(data);
  Status closed = f->Close();
  if (!st.ok()) return st;
  return closed;
}

Status File::WriteContents(const string &filename,
                           const void *data, size_t size) {
  File *f;
  Status st = Open(filename, "w", &f);
  if (!st.ok()) return st;
  st = f->Write(data, size);
  Status closed = f->Close();
  if (!st.ok()) return st;
  return closed;
}

}  // namespace factfuse
