#pragma once

#include <surveyor/driver.h>
#include <surveyor/interfaces.h>
#include <surveyor/logging.h>
#include <surveyor/visitor_registry.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace surveyor {

class DriverBuilder {
public:
  explicit DriverBuilder(
      const VisitorRegistry &registry = GlobalVisitorRegistry());

  DriverBuilder &WithEngine(std::unique_ptr<AnalysisEngine> engine);
  DriverBuilder &WithPreparer(std::unique_ptr<ProjectPreparer> preparer);
  DriverBuilder &WithLogger(std::shared_ptr<Logger> logger);
  DriverBuilder &WithManifestName(std::string manifest_name);
  DriverBuilder &WithDiscoveryListener(
      std::function<void(const DiscoveryResult &)> listener);
  DriverBuilder &WithVisitor(std::shared_ptr<Visitor> visitor);
  DriverBuilder &WithVisitorName(std::string name);
  DriverBuilder &WithVisitorOptions(VisitorOptions options);

  // Instances passed to WithVisitor come first, then named visitors in the
  // order they were selected. With neither, the registry default is used.
  Driver Build();

private:
  const VisitorRegistry *registry_;
  std::vector<std::string> visitor_names_;
  VisitorOptions visitor_options_;
  DriverComponents components_;
};

} // namespace surveyor
