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

#ifndef FACTFUSE_BASE_FLAGS_H_
#define FACTFUSE_BASE_FLAGS_H_

#include <string>

#include "factfuse/base/types.h"

namespace factfuse {

// Command line flag. Flags are defined with the DEFINE_* macros at namespace
// scope and are linked into a global flag list during static initialization,
// so they can be set before main() parses the command line.
class Flag {
 public:
  // Value types supported for flags.
  enum Type {BOOL, INT32, DOUBLE, STRING};

  Flag(const char *name, Type type, const char *help, void *storage);

  const char *name() const { return name_; }
  Type type() const { return type_; }
  const char *help() const { return help_; }

  // Name of the flag value type.
  const char *type_name() const;

  // Parse value and assign it to the flag. A boolean flag without value is
  // set to true, or to false if negated. Returns false if the value cannot
  // be parsed.
  bool Set(const char *value, bool negate = false);

  // Current flag value as text.
  string Value() const;

  // Find flag by name. Returns null if there is no such flag.
  static Flag *Find(const char *name);

  // Set program usage message printed by --help.
  static void SetUsageMessage(const string &usage);

  // Parse and remove flags from the command line. Positional arguments are
  // kept. Returns the index of the offending argument on errors and zero on
  // success.
  static int ParseCommandLineFlags(int *argc, char **argv);

  // Set flags from a file with one --name=value flag per line. Blank lines
  // and lines starting with '#' are skipped. Returns false on the first bad
  // line.
  static bool ParseFlagFile(const string &filename);

  // Print usage message and all flags with their defaults.
  static void PrintHelp();

 private:
  template<typename T> T &value() { return *static_cast<T *>(storage_); }
  template<typename T> const T &value() const {
    return *static_cast<const T *>(storage_);
  }

  const char *name_;
  Type type_;
  const char *help_;
  void *storage_;

  // Next flag in the global flag list.
  Flag *next_ = nullptr;

  static Flag *head_;
  static Flag *tail_;
};

#define FACTFUSE_DEFINE_FLAG(type, fltype, name, value, help) \
  type FLAGS_##name = value; \
  static ::factfuse::Flag flag_##name(#name, ::factfuse::Flag::fltype, help, \
                                      &FLAGS_##name);

#define DEFINE_bool(name, value, help) \
  FACTFUSE_DEFINE_FLAG(bool, BOOL, name, value, help)
#define DEFINE_int32(name, value, help) \
  FACTFUSE_DEFINE_FLAG(int32, INT32, name, value, help)
#define DEFINE_double(name, value, help) \
  FACTFUSE_DEFINE_FLAG(double, DOUBLE, name, value, help)
#define DEFINE_string(name, value, help) \
  FACTFUSE_DEFINE_FLAG(string, STRING, name, value, help)

#define DECLARE_bool(name) extern bool FLAGS_##name;
#define DECLARE_int32(name) extern int32 FLAGS_##name;
#define DECLARE_double(name) extern double FLAGS_##name;
#define DECLARE_string(name) extern std::string FLAGS_##name;

}  // namespace factfuse

#endif  // FACTFUSE_BASE_FLAGS_H_
