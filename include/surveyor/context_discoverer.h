#pragma once

#include <surveyor/logging.h>
#include <surveyor/models.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace surveyor {

struct DiscoveryError {
  std::filesystem::path path;
  std::string reason;
};

struct DiscoveryResult {
  std::vector<AnalysisRoot> roots;
  std::vector<DiscoveryError> errors;
  // Set when a single container path was expanded into its children.
  bool expanded = false;
  std::filesystem::path container;

  std::size_t Total() const { return roots.size(); }
};

class ContextDiscoverer {
public:
  explicit ContextDiscoverer(std::string manifest_name = "CMakeLists.txt",
                             std::shared_ptr<Logger> logger = nullptr);

  DiscoveryResult
  Discover(const std::vector<std::filesystem::path> &inputs) const;

  bool IsProject(const std::filesystem::path &directory) const;

private:
  std::string manifest_name_;
  std::shared_ptr<Logger> logger_;
};

} // namespace surveyor
