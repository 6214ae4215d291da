#pragma once

#include <surveyor/logging.h>
#include <surveyor/models.h>
#include <surveyor/visitor_registry.h>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace surveyor {

struct SurveyOptions {
  std::vector<std::filesystem::path> paths;
  std::optional<bool> show_errors;
  std::optional<bool> resolve_units;
  std::optional<bool> skip_install;
  std::vector<std::string> excluded_paths;
  std::optional<std::size_t> limit;
  std::optional<std::size_t> stop_after;
  std::vector<std::string> visitors;
  std::vector<std::string> identifiers;
  std::optional<LogLevel> log_level;
  std::optional<std::filesystem::path> build_directory;
  std::optional<std::filesystem::path> config_file;
  bool show_help = false;
};

void PrintSurveyUsage(std::ostream &stream);

SurveyOptions ParseSurveyArguments(const std::vector<std::string> &arguments);
SurveyOptions ParseConfigFile(const std::filesystem::path &path);
SurveyOptions MergeOptions(const SurveyOptions &config_options,
                           const SurveyOptions &cli_options);
SurveyOptions ResolveSurveyOptions(const SurveyOptions &cli_options);

RunConfiguration BuildRunConfiguration(const SurveyOptions &options);
VisitorOptions BuildVisitorOptions(const SurveyOptions &options,
                                   std::ostream &out);

int RunSurvey(const std::vector<std::string> &arguments, std::ostream &out,
              std::ostream &log);

} // namespace surveyor
