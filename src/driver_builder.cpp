#include <surveyor/driver_builder.h>

#include <surveyor/clang_analysis_engine.h>
#include <surveyor/cmake_project_preparer.h>

#include <utility>

namespace surveyor {

DriverBuilder::DriverBuilder(const VisitorRegistry &registry)
    : registry_(&registry) {}

DriverBuilder &
DriverBuilder::WithEngine(std::unique_ptr<AnalysisEngine> engine) {
  components_.engine = std::move(engine);
  return *this;
}

DriverBuilder &
DriverBuilder::WithPreparer(std::unique_ptr<ProjectPreparer> preparer) {
  components_.preparer = std::move(preparer);
  return *this;
}

DriverBuilder &DriverBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

DriverBuilder &DriverBuilder::WithManifestName(std::string manifest_name) {
  components_.manifest_name = std::move(manifest_name);
  return *this;
}

DriverBuilder &DriverBuilder::WithDiscoveryListener(
    std::function<void(const DiscoveryResult &)> listener) {
  components_.on_discovered = std::move(listener);
  return *this;
}

DriverBuilder &DriverBuilder::WithVisitor(std::shared_ptr<Visitor> visitor) {
  components_.visitors.push_back(std::move(visitor));
  return *this;
}

DriverBuilder &DriverBuilder::WithVisitorName(std::string name) {
  visitor_names_.push_back(std::move(name));
  return *this;
}

DriverBuilder &DriverBuilder::WithVisitorOptions(VisitorOptions options) {
  visitor_options_ = std::move(options);
  return *this;
}

Driver DriverBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  if (!components_.engine) {
    components_.engine =
        std::make_unique<ClangAnalysisEngine>(components_.logger);
  }
  if (!components_.preparer) {
    components_.preparer = std::make_unique<CMakeProjectPreparer>(
        components_.logger, nullptr, components_.manifest_name);
  }

  if (components_.visitors.empty() && visitor_names_.empty()) {
    visitor_names_.push_back(registry_->DefaultVisitorName());
  }
  for (const auto &name : visitor_names_) {
    components_.visitors.push_back(
        registry_->CreateVisitor(name, visitor_options_));
  }
  visitor_names_.clear();
  return Driver(std::move(components_));
}

} // namespace surveyor
