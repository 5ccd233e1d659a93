#pragma once

#include <erlflow/interfaces.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace erlflow {

class ComponentRegistry {
public:
  using DocumentationFactory =
      std::function<std::unique_ptr<DocumentationProvider>()>;
  using SinkFactory =
      std::function<std::unique_ptr<RecordSink>(const std::string &)>;

  void RegisterDocumentationProvider(const std::string &name,
                                     DocumentationFactory factory,
                                     bool set_as_default = false);
  void RegisterSink(const std::string &name, SinkFactory factory,
                    bool set_as_default = false);

  std::unique_ptr<DocumentationProvider>
  CreateDocumentationProvider(const std::string &name = "") const;
  // `target` is the output path handed to the sink factory.
  std::unique_ptr<RecordSink> CreateSink(const std::string &name,
                                         const std::string &target) const;

  std::vector<std::string> DocumentationProviderNames() const;
  std::vector<std::string> SinkNames() const;

  const std::string &DefaultDocumentationProviderName() const;
  const std::string &DefaultSinkName() const;

  template <typename Factory>
  struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const ComponentSet<Factory> &set);

  template <typename Interface, typename Factory, typename... Args>
  std::unique_ptr<Interface>
  CreateComponent(const std::string &name, const ComponentSet<Factory> &set,
                  const std::string &kind, Args &&...args) const;

  template <typename Factory>
  void RegisterComponent(const std::string &name, Factory factory,
                         bool set_as_default, ComponentSet<Factory> &set);

  ComponentSet<DocumentationFactory> documentation_providers_;
  ComponentSet<SinkFactory> sinks_;
};

ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace erlflow
