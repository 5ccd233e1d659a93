#include <erlflow/component_registry.h>

#include <erlflow/documentation_providers.h>
#include <erlflow/jsonl_record_sink.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kDefaultDocumentationProvider[] = "edoc";
constexpr const char kNoDocumentationProvider[] = "none";
constexpr const char kDefaultSink[] = "jsonl";

} // namespace

namespace erlflow {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string ComponentRegistry::JoinNames(const ComponentSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Interface, typename Factory, typename... Args>
std::unique_ptr<Interface>
ComponentRegistry::CreateComponent(const std::string &name,
                                   const ComponentSet<Factory> &set,
                                   const std::string &kind,
                                   Args &&...args) const {
  const auto target_name = name.empty() ? set.default_name : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default " + kind + " registered");
  }
  const auto found = set.factories.find(target_name);
  if (found == set.factories.end()) {
    throw std::invalid_argument("Unknown " + kind + " '" + target_name +
                                "'. Registered: " + JoinNames(set));
  }
  auto instance = found->second(std::forward<Args>(args)...);
  if (!instance) {
    throw std::runtime_error("Factory for " + kind + " '" + target_name +
                             "' returned null");
  }
  return instance;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory,
                                          bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

void ComponentRegistry::RegisterDocumentationProvider(
    const std::string &name, DocumentationFactory factory,
    bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default,
                    documentation_providers_);
}

void ComponentRegistry::RegisterSink(const std::string &name,
                                     SinkFactory factory,
                                     bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, sinks_);
}

std::unique_ptr<DocumentationProvider>
ComponentRegistry::CreateDocumentationProvider(const std::string &name) const {
  return CreateComponent<DocumentationProvider>(name, documentation_providers_,
                                                "documentation provider");
}

std::unique_ptr<RecordSink>
ComponentRegistry::CreateSink(const std::string &name,
                              const std::string &target) const {
  return CreateComponent<RecordSink>(name, sinks_, "emitter", target);
}

std::vector<std::string>
ComponentRegistry::DocumentationProviderNames() const {
  return RegisteredNames(documentation_providers_);
}

std::vector<std::string> ComponentRegistry::SinkNames() const {
  return RegisteredNames(sinks_);
}

const std::string &
ComponentRegistry::DefaultDocumentationProviderName() const {
  return documentation_providers_.default_name;
}

const std::string &ComponentRegistry::DefaultSinkName() const {
  return sinks_.default_name;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterDocumentationProvider(
      kDefaultDocumentationProvider,
      []() { return std::make_unique<EdocDocumentationProvider>(); }, true);
  registry.RegisterDocumentationProvider(kNoDocumentationProvider, []() {
    return std::make_unique<NoDocumentationProvider>();
  });
  registry.RegisterSink(
      kDefaultSink,
      [](const std::string &path) {
        return std::make_unique<JsonlRecordSink>(path);
      },
      true);
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace erlflow
