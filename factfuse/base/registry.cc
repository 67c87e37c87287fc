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

#include "factfuse/base/registry.h"

#include <string.h>
#include <algorithm>

namespace factfuse {

RegistryMetadata *RegistryMetadata::global_registry_list = nullptr;

// Order metadata by name. Registration order depends on static
// initialization order, so listings are sorted to be reproducible.
template <class T> static void SortByName(std::vector<const T *> *list) {
  std::sort(list->begin(), list->end(), [](const T *a, const T *b) {
    return strcmp(a->name(), b->name()) < 0;
  });
}

void RegistryMetadata::GetComponents(
    std::vector<const ComponentMetadata *> *components) const {
  components->clear();
  for (ComponentMetadata *c = *components_; c != nullptr; c = c->link()) {
    components->push_back(c);
  }
  SortByName(components);
}

void RegistryMetadata::Register(RegistryMetadata *registry) {
  registry->set_link(global_registry_list);
  global_registry_list = registry;
}

void RegistryMetadata::GetRegistries(
    std::vector<const RegistryMetadata *> *registries) {
  registries->clear();
  for (RegistryMetadata *r = global_registry_list; r != nullptr;
       r = r->next()) {
    registries->push_back(r);
  }
  SortByName(registries);
}

}  // namespace factfuse
