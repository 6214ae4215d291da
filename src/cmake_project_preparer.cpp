#include <surveyor/cmake_project_preparer.h>

#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>

namespace surveyor {

namespace {
std::string Quote(const std::filesystem::path &path) {
  std::string quoted = "\"";
  for (const auto character : path.string()) {
    if (character == '"' || character == '\\') {
      quoted.push_back('\\');
    }
    quoted.push_back(character);
  }
  quoted.push_back('"');
  return quoted;
}
} // namespace

CMakeProjectPreparer::CMakeProjectPreparer(std::shared_ptr<Logger> logger,
                                           CommandRunner runner,
                                           std::string manifest_name)
    : logger_(EnsureLogger(std::move(logger))), runner_(std::move(runner)),
      manifest_name_(std::move(manifest_name)) {
  if (!runner_) {
    runner_ = [](const std::string &command) {
      return std::system(command.c_str());
    };
  }
}

std::string
CMakeProjectPreparer::ConfigureCommand(const std::filesystem::path &root,
                                       const std::filesystem::path &build) {
  return "cmake -S " + Quote(root) + " -B " + Quote(build) +
         " -DCMAKE_EXPORT_COMPILE_COMMANDS=ON > /dev/null 2>&1";
}

void CMakeProjectPreparer::Prepare(const AnalysisRoot &root,
                                   const RunConfiguration &config) {
  std::error_code error;
  if (!std::filesystem::exists(root.path / manifest_name_, error)) {
    logger_->Log(LogLevel::kDebug, "prepare.skip",
                 {{"root", root.path.string()}, {"reason", "no manifest"}});
    return;
  }

  auto build = config.build_directory;
  if (build.is_relative()) {
    build = root.path / build;
  }
  if (std::filesystem::exists(build / "compile_commands.json", error) ||
      std::filesystem::exists(root.path / "compile_commands.json", error)) {
    logger_->Log(LogLevel::kDebug, "prepare.skip",
                 {{"root", root.path.string()},
                  {"reason", "compile_commands.json present"}});
    return;
  }

  const auto command = ConfigureCommand(root.path, build);
  logger_->Log(LogLevel::kInfo, "prepare.configure",
               {{"root", root.path.string()}, {"command", command}});
  const int status = runner_(command);
  if (status != 0) {
    logger_->Log(LogLevel::kWarn, "prepare.failed",
                 {{"root", root.path.string()},
                  {"status", std::to_string(status)}});
  }
}

} // namespace surveyor
