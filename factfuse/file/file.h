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

#ifndef FACTFUSE_FILE_FILE_H_
#define FACTFUSE_FILE_FILE_H_

#include <string>

#include "factfuse/base/logging.h"
#include "factfuse/base/macros.h"
#include "factfuse/base/status.h"
#include "factfuse/base/types.h"

namespace factfuse {

// POSIX file. Errors are returned as Status objects with the errno value as
// the error code.
class File {
 public:
  // Read up to "size" bytes from the file at the current position.
  Status Read(void *buffer, size_t size, uint64 *read);

  // Reads the whole remaining file to a string.
  Status ReadToString(string *contents);

  // Write data to the file at the current position.
  Status Write(const void *buffer, size_t size);

  // Close the file and delete the file object.
  Status Close();

  // Open file. Modes are "r", "r+", "w", "w+", "a", and "a+".
  static Status Open(const string &name, const char *mode, File **f);

  // Delete a file.
  static Status Delete(const string &name);

  // Read contents of file.
  static Status ReadContents(const string &filename, string *data);

  // Write contents of file.
  static Status WriteContents(const string &filename,
                              const void *data, size_t size);
  static Status WriteContents(const string &filename, const string &data) {
    return WriteContents(filename, data.data(), data.size());
  }

 private:
  // Use Open() to create and Close() to close and delete the file object.
  File(int fd, const string &filename) : fd_(fd), filename_(filename) {}
  ~File();

  // File descriptor.
  int fd_;

  // File name.
  string filename_;

  DISALLOW_COPY_AND_ASSIGN(File);
};

}  // namespace factfuse

#endif  // FACTFUSE_FILE_FILE_H_
