#include <surveyor/visitor_registry.h>

#include <surveyor/error_surveyor.h>
#include <surveyor/identifier_surveyor.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kErrorsVisitor[] = "errors";
constexpr const char kIdentifiersVisitor[] = "identifiers";

std::ostream &OutputOf(const surveyor::VisitorOptions &options) {
  return options.out != nullptr ? *options.out : std::cout;
}

} // namespace

namespace surveyor {

void VisitorRegistry::RegisterVisitor(const std::string &name,
                                      VisitorFactory factory,
                                      bool set_as_default) {
  if (name.empty()) {
    throw std::invalid_argument("Visitor name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (factories_.count(name) != 0) {
    throw std::invalid_argument("Visitor with name '" + name +
                                "' already registered");
  }
  factories_.emplace(name, std::move(factory));
  if (set_as_default || default_name_.empty()) {
    default_name_ = name;
  }
}

std::shared_ptr<Visitor>
VisitorRegistry::CreateVisitor(const std::string &name,
                               const VisitorOptions &options) const {
  const auto target_name = name.empty() ? default_name_ : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default visitor registered");
  }
  const auto found = factories_.find(target_name);
  if (found == factories_.end()) {
    throw std::invalid_argument("Unknown visitor '" + target_name +
                                "'. Registered: " + JoinNames());
  }
  auto instance = found->second(options);
  if (!instance) {
    throw std::runtime_error("Factory for visitor '" + target_name +
                             "' returned null");
  }
  return instance;
}

std::vector<std::string> VisitorRegistry::VisitorNames() const {
  std::vector<std::string> names;
  names.reserve(factories_.size());
  for (const auto &entry : factories_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::string VisitorRegistry::JoinNames() const {
  const auto names = VisitorNames();
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

VisitorRegistry MakeVisitorRegistryWithDefaults() {
  VisitorRegistry registry;
  registry.RegisterVisitor(
      kErrorsVisitor,
      [](const VisitorOptions &options) {
        return std::make_shared<ErrorSurveyor>(
            OutputOf(options), options.display_base, Severity::kWarning,
            options.stop_after);
      },
      true);
  registry.RegisterVisitor(
      kIdentifiersVisitor, [](const VisitorOptions &options) {
        auto identifiers = options.identifiers.empty()
                               ? IdentifierSurveyor::DefaultIdentifiers()
                               : options.identifiers;
        return std::make_shared<IdentifierSurveyor>(
            OutputOf(options), std::move(identifiers), options.display_base,
            options.stop_after);
      });
  return registry;
}

const VisitorRegistry &GlobalVisitorRegistry() {
  static const VisitorRegistry registry = MakeVisitorRegistryWithDefaults();
  return registry;
}

} // namespace surveyor
