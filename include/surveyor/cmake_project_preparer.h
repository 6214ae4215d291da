#pragma once

#include <surveyor/interfaces.h>
#include <surveyor/logging.h>

#include <functional>
#include <memory>
#include <string>

namespace surveyor {

// Configures a CMake project so that compile_commands.json exists before
// analysis. Roots without the manifest file are left alone. Failures are
// logged and never abort the run.
class CMakeProjectPreparer : public ProjectPreparer {
public:
  using CommandRunner = std::function<int(const std::string &)>;

  explicit CMakeProjectPreparer(std::shared_ptr<Logger> logger = nullptr,
                                CommandRunner runner = nullptr,
                                std::string manifest_name = "CMakeLists.txt");

  void Prepare(const AnalysisRoot &root,
               const RunConfiguration &config) override;

  static std::string ConfigureCommand(const std::filesystem::path &root,
                                      const std::filesystem::path &build);

private:
  std::shared_ptr<Logger> logger_;
  CommandRunner runner_;
  std::string manifest_name_;
};

} // namespace surveyor
