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

// Registry for component registration. These classes can be used for creating
// registries of components conforming to the same interface, so that the
// implementation class can be selected by name at runtime.
//
// Example:
//  scorer.h:
//
//   class Scorer : public Component<Scorer> {
//    public:
//     virtual float Score(const string &text) = 0;
//   };
//
//   #define REGISTER_SCORER(type, component)
//     REGISTER_COMPONENT_TYPE(Scorer, type, component);
//
//  scorer.cc:
//
//   REGISTER_COMPONENT_REGISTRY("scorer", Scorer);
//
//   class LengthScorer : public Scorer {
//    public:
//     float Score(const string &text) override { return text.size(); }
//   };
//
//   REGISTER_SCORER("length", LengthScorer);
//
//   Scorer *s = Scorer::Create("length");
//   float score = s->Score(text);
//   delete s;

#ifndef FACTFUSE_BASE_REGISTRY_H_
#define FACTFUSE_BASE_REGISTRY_H_

#include <string.h>
#include <functional>
#include <string>
#include <vector>

#include "factfuse/base/logging.h"
#include "factfuse/base/types.h"

namespace factfuse {

// Component metadata with information about name, class, and code location.
class ComponentMetadata {
 public:
  ComponentMetadata(const char *name, const char *class_name, const char *file,
                    int line)
      : name_(name),
        class_name_(class_name),
        file_(file),
        line_(line),
        link_(nullptr) {}

  // Returns component name.
  const char *name() const { return name_; }

  // Returns class name.
  const char *class_name() const { return class_name_; }

  // Returns file name.
  const char *file() const { return file_; }

  // Returns line.
  int line() const { return line_; }

  // Metadata objects can be linked in a list.
  ComponentMetadata *link() const { return link_; }
  void set_link(ComponentMetadata *link) { link_ = link; }

 private:
  const char *name_;
  const char *class_name_;
  const char *file_;
  int line_;
  ComponentMetadata *link_;
};

// The master registry contains all registered component registries. A registry
// is not registered in the master registry until the first component of that
// type is registered.
class RegistryMetadata : public ComponentMetadata {
 public:
  RegistryMetadata(const char *name, const char *class_name, const char *file,
                   int line, ComponentMetadata **components)
      : ComponentMetadata(name, class_name, file, line),
        components_(components) {}

  // Returns the components in the registry sorted by name.
  void GetComponents(std::vector<const ComponentMetadata *> *components) const;

  // Returns the next registry in the registry list.
  RegistryMetadata *next() const {
    return static_cast<RegistryMetadata *>(link());
  }

  // Registers a component registry in the master registry.
  static void Register(RegistryMetadata *registry);

  // Returns all registries sorted by name.
  static void GetRegistries(std::vector<const RegistryMetadata *> *registries);

 private:
  // Location of list of components in registry.
  ComponentMetadata **components_;

  // List of all component registries.
  static RegistryMetadata *global_registry_list;
};

// Registry for components. The components in the registry are put into a
// linked list that can be statically initialized, so registration does not
// depend on initialization order.
template <class T> struct ComponentRegistry {
  typedef ComponentRegistry<T> Self;

  // Component registration class.
  class Registrar : public ComponentMetadata {
   public:
    // Registers new component by linking itself into the component list of
    // the registry.
    Registrar(Self *registry, const char *type, const char *class_name,
              const char *file, int line, T *object)
        : ComponentMetadata(type, class_name, file, line), object_(object) {
      // Register registry in master registry if this is the first registered
      // component of this type.
      if (registry->components == nullptr) {
        RegistryMetadata::Register(new RegistryMetadata(
            registry->name, registry->class_name, registry->file,
            registry->line,
            reinterpret_cast<ComponentMetadata **>(&registry->components)));
      }

      // Register component in registry.
      set_link(registry->components);
      registry->components = this;
    }

    // Returns component type.
    const char *type() const { return name(); }

    // Returns component object.
    T *object() const { return object_; }

    // Returns the next component in the component list.
    Registrar *next() const { return static_cast<Registrar *>(link()); }

   private:
    T *object_;
  };

  // Finds registrar for named component. Returns null if not found.
  const Registrar *Find(const char *type) const {
    Registrar *r = components;
    while (r != nullptr && strcmp(type, r->type()) != 0) r = r->next();
    return r;
  }

  // Finds registrar for named component and fails if it is not found.
  const Registrar *GetComponent(const char *type) const {
    const Registrar *r = Find(type);
    if (r == nullptr) {
      LOG(FATAL) << "Unknown " << name << " component: " << type;
    }
    return r;
  }

  // Finds a named component in the registry.
  T *Lookup(const char *type) const { return GetComponent(type)->object(); }
  T *Lookup(const string &type) const { return Lookup(type.c_str()); }

  // Textual description of the kind of components in the registry.
  const char *name;

  // Base class name of component type.
  const char *class_name;

  // File and line where the registry is defined.
  const char *file;
  int line;

  // Linked list of registered components.
  Registrar *components;
};

// Base class for registerable components.
template <class T> class Component {
 public:
  // Factory function type.
  typedef std::function<T *()> Factory;

  // Registry type.
  typedef ComponentRegistry<Factory> Registry;

  // Creates a new component instance. Fails if the type is unknown.
  static T *Create(const string &type) {
    return (*registry()->Lookup(type))();
  }

  // Checks if a component type has been registered.
  static bool Has(const string &type) {
    return registry()->Find(type.c_str()) != nullptr;
  }

  // Returns registry for class.
  static Registry *registry() { return &registry_; }

 private:
  // Registry for class.
  static Registry registry_;
};

#define REGISTER_COMPONENT_TYPE(base, type, component) \
  static base::Factory __##component##_factory = [] { return new component; }; \
  __attribute__((init_priority(800))) \
  static base::Registry::Registrar __##component##__##registrar( \
      base::registry(), type, #component, __FILE__, __LINE__, \
      &__##component##_factory)

#define REGISTER_COMPONENT_REGISTRY(type, classname) \
  template <> __attribute__((init_priority(900))) \
  classname::Registry factfuse::Component<classname>::registry_ = { \
      type, #classname, __FILE__, __LINE__, nullptr}

}  // namespace factfuse

#endif  // FACTFUSE_BASE_REGISTRY_H_
