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

#include "factfuse/base/flags.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <iostream>
#include <sstream>

#include "factfuse/base/macros.h"

DEFINE_bool(help, false, "Print help message");
DEFINE_string(flagfile, "", "File with command line flags, one per line");

namespace factfuse {

Flag *Flag::head_ = nullptr;
Flag *Flag::tail_ = nullptr;

// Program usage message.
static string usage_message;

Flag::Flag(const char *name, Type type, const char *help, void *storage)
    : name_(name), type_(type), help_(help), storage_(storage) {
  if (head_ == nullptr) {
    head_ = this;
  } else {
    tail_->next_ = this;
  }
  tail_ = this;
}

const char *Flag::type_name() const {
  static const char *names[] = {"bool", "int32", "double", "string"};
  return names[type_];
}

bool Flag::Set(const char *value, bool negate) {
  if (type_ == BOOL) {
    bool enabled = true;
    if (value != nullptr) {
      static const char *yes[] = {"1", "t", "true", "y", "yes"};
      static const char *no[] = {"0", "f", "false", "n", "no"};
      int parsed = -1;
      for (int i = 0; i < ARRAYSIZE(yes) && parsed == -1; ++i) {
        if (strcasecmp(value, yes[i]) == 0) parsed = 1;
        if (strcasecmp(value, no[i]) == 0) parsed = 0;
      }
      if (parsed == -1) return false;
      enabled = parsed == 1;
    }
    this->value<bool>() = negate ? !enabled : enabled;
    return true;
  }

  if (value == nullptr || negate) return false;
  if (type_ == STRING) {
    this->value<string>() = value;
    return true;
  }

  // Numbers must be parsed completely.
  char *end = nullptr;
  if (type_ == INT32) {
    long number = strtol(value, &end, 10);
    if (end == value || *end != '\0') return false;
    if (number < INT32_MIN || number > INT32_MAX) return false;
    this->value<int32>() = number;
  } else {
    double number = strtod(value, &end);
    if (end == value || *end != '\0') return false;
    this->value<double>() = number;
  }
  return true;
}

string Flag::Value() const {
  std::ostringstream out;
  switch (type_) {
    case BOOL: out << (value<bool>() ? "true" : "false"); break;
    case INT32: out << value<int32>(); break;
    case DOUBLE: out << value<double>(); break;
    case STRING: out << '"' << value<string>() << '"'; break;
  }
  return out.str();
}

Flag *Flag::Find(const char *name) {
  for (Flag *f = head_; f != nullptr; f = f->next_) {
    if (strcmp(name, f->name_) == 0) return f;
  }
  return nullptr;
}

void Flag::SetUsageMessage(const string &usage) {
  usage_message = usage;
}

namespace {

// Command line argument split into flag name and value. The argument is
// modified in place.
struct Argument {
  // Returns false if the argument is not a flag. A bare "--" gives a flag
  // argument with no name.
  bool Split(char *arg) {
    if (arg == nullptr || arg[0] != '-') return false;
    if (arg[1] == '-') {
      arg += 2;
      if (*arg == '\0') return true;
    } else {
      arg++;
    }
    name = arg;
    char *eq = strchr(arg, '=');
    if (eq != nullptr) {
      *eq = '\0';
      value = eq + 1;
    }
    return true;
  }

  // Look up the flag, also accepting a "no" prefix for boolean flags.
  Flag *Lookup() {
    Flag *flag = Flag::Find(name);
    if (flag == nullptr && strncmp(name, "no", 2) == 0) {
      flag = Flag::Find(name + 2);
      if (flag != nullptr && flag->type() != Flag::BOOL) flag = nullptr;
      negate = flag != nullptr;
    }
    return flag;
  }

  const char *name = nullptr;
  const char *value = nullptr;
  bool negate = false;
};

}  // namespace

bool Flag::ParseFlagFile(const string &filename) {
  FILE *f = fopen(filename.c_str(), "r");
  if (f == nullptr) {
    std::cerr << "Error: cannot open flag file " << filename << "\n";
    return false;
  }

  bool ok = true;
  char *line = nullptr;
  size_t capacity = 0;
  ssize_t length;
  int lineno = 0;
  while (ok && (length = getline(&line, &capacity, f)) != -1) {
    lineno++;
    while (length > 0 && strchr("\r\n \t", line[length - 1]) != nullptr) {
      line[--length] = '\0';
    }
    char *text = line + strspn(line, " \t");
    if (*text == '\0' || *text == '#') continue;

    Argument arg;
    Flag *flag = nullptr;
    if (arg.Split(text) && arg.name != nullptr) flag = arg.Lookup();
    if (flag == nullptr) {
      std::cerr << "Error: " << filename << ":" << lineno
                << ": unrecognized flag " << text << "\n";
      ok = false;
    } else if (!flag->Set(arg.value, arg.negate)) {
      std::cerr << "Error: " << filename << ":" << lineno
                << ": bad value for " << flag->type_name() << " flag "
                << flag->name() << "\n";
      ok = false;
    }
  }
  free(line);
  fclose(f);
  return ok;
}

int Flag::ParseCommandLineFlags(int *argc, char **argv) {
  int rc = 0;
  int i = 1;
  while (i < *argc) {
    int first = i;
    Argument arg;
    if (!arg.Split(argv[i++])) continue;

    // Everything after "--" is positional.
    if (arg.name == nullptr) {
      argv[first] = nullptr;
      break;
    }

    Flag *flag = arg.Lookup();
    if (flag == nullptr) {
      std::cerr << "Error: unrecognized flag --" << arg.name << "\n"
                << "Try --help for options\n";
      rc = first;
      break;
    }

    // Non-boolean flags can take their value from the next argument.
    if (arg.value == nullptr && flag->type() != BOOL && i < *argc) {
      arg.value = argv[i++];
    }
    if (!flag->Set(arg.value, arg.negate)) {
      std::cerr << "Error: bad value for " << flag->type_name() << " flag --"
                << flag->name() << "\nTry --help for options\n";
      rc = first;
      break;
    }

    // Flags from a flag file are applied right away so that later command
    // line flags override them.
    if (flag->storage_ == &FLAGS_flagfile && !FLAGS_flagfile.empty()) {
      if (!ParseFlagFile(FLAGS_flagfile)) {
        rc = first;
        break;
      }
    }

    while (first < i) argv[first++] = nullptr;
  }

  // Remove the parsed flags from the argument list.
  int kept = 1;
  for (int j = 1; j < *argc; ++j) {
    if (argv[j] != nullptr) argv[kept++] = argv[j];
  }
  *argc = kept;

  if (FLAGS_help) {
    PrintHelp();
    exit(0);
  }
  return rc;
}

void Flag::PrintHelp() {
  if (!usage_message.empty()) std::cout << usage_message << "\n";
  if (head_ == nullptr) return;
  std::cout << "Options:\n";
  for (Flag *f = head_; f != nullptr; f = f->next_) {
    std::cout << "  --" << f->name_ << " (" << f->help_ << ")\n"
              << "        type: " << f->type_name()
              << "  default: " << f->Value() << "\n";
  }
}

}  // namespace factfuse
