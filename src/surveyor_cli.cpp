#include <surveyor/surveyor_cli.h>

#include <surveyor/cli_exit_codes.h>
#include <surveyor/diagnostic_formatter.h>
#include <surveyor/driver.h>
#include <surveyor/driver_builder.h>
#include <surveyor/visitors.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using surveyor::SurveyOptions;

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Expected a boolean value, got: " + value);
}

std::size_t ParseCount(const std::string &value, const std::string &name) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
      })) {
    throw std::invalid_argument(name + " requires a non-negative integer");
  }
  return static_cast<std::size_t>(std::stoull(trimmed));
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    value = Trim(value);
    if (value.empty()) {
      continue;
    }
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

// Excluded entries are path segments; separators are not allowed.
void AppendSegments(const std::string &raw_values,
                    std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    value = Trim(value);
    while (!value.empty() && (value.back() == '/' || value.back() == '\\')) {
      value.pop_back();
    }
    if (value.empty()) {
      continue;
    }
    if (value.find('/') != std::string::npos ||
        value.find('\\') != std::string::npos) {
      throw std::invalid_argument("Excluded path must be a single segment: " +
                                  value);
    }
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleToggle(const std::string &argument, SurveyOptions &options) {
  if (argument == "--show-errors") {
    options.show_errors = true;
    return true;
  }
  if (argument == "--no-show-errors") {
    options.show_errors = false;
    return true;
  }
  if (argument == "--resolve-units") {
    options.resolve_units = true;
    return true;
  }
  if (argument == "--syntax-only") {
    options.resolve_units = false;
    return true;
  }
  if (argument == "--skip-install") {
    options.skip_install = true;
    return true;
  }
  return false;
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, SurveyOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        surveyor::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = surveyor::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = surveyor::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool DispatchSurveyOption(const std::vector<std::string> &arguments,
                          std::size_t &index, SurveyOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (HandleToggle(argument, options) ||
      HandleLoggingOption(arguments, index, options)) {
    return true;
  }
  if (argument == "--exclude") {
    AppendSegments(RequireValue(arguments, index, argument),
                   options.excluded_paths);
    return true;
  }
  if (argument == "--limit") {
    options.limit = ParseCount(RequireValue(arguments, index, argument),
                               argument);
    return true;
  }
  if (argument == "--stop-after") {
    options.stop_after = ParseCount(RequireValue(arguments, index, argument),
                                    argument);
    return true;
  }
  if (argument == "--visitor") {
    AppendValues(RequireValue(arguments, index, argument), options.visitors);
    return true;
  }
  if (argument == "--identifiers") {
    AppendValues(RequireValue(arguments, index, argument),
                 options.identifiers);
    return true;
  }
  if (argument == "--build") {
    options.build_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  return false;
}

using ConfigValue = std::variant<std::string, bool, std::size_t,
                                 std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "paths",       "show_errors", "resolve_units", "skip_install",
      "excluded_paths", "limit",    "stop_after",    "visitors",
      "identifiers", "log_level",   "build_dir"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"path", "paths"},
      {"roots", "paths"},
      {"exclude", "excluded_paths"},
      {"excludes", "excluded_paths"},
      {"force_skip_install", "skip_install"},
      {"debug_limit", "limit"},
      {"visitor", "visitors"},
      {"build", "build_dir"},
      {"build_directory", "build_dir"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractScalar(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a scalar value");
  }
  return node.as<std::string>();
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

void AppendPath(const std::string &raw, std::vector<std::string> &target) {
  const auto value = Trim(raw);
  if (!value.empty()) {
    target.push_back(value);
  }
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "paths") {
    return ExtractList(node, key, AppendPath);
  }
  if (key == "excluded_paths") {
    return ExtractList(node, key, AppendSegments);
  }
  if (key == "visitors" || key == "identifiers") {
    return ExtractList(node, key, AppendValues);
  }
  if (key == "show_errors" || key == "resolve_units" ||
      key == "skip_install") {
    return ConfigValue{ParseBool(ExtractScalar(node, key))};
  }
  if (key == "limit" || key == "stop_after") {
    return ConfigValue{ParseCount(ExtractScalar(node, key), key)};
  }
  if (key == "log_level" || key == "build_dir") {
    return ConfigValue{ExtractScalar(node, key)};
  }
  ThrowUnknownKey(key);
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, SurveyOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "paths") {
      const auto &paths = std::get<std::vector<std::string>>(value);
      options.paths.assign(paths.begin(), paths.end());
    } else if (key == "excluded_paths") {
      options.excluded_paths = std::get<std::vector<std::string>>(value);
    } else if (key == "visitors") {
      options.visitors = std::get<std::vector<std::string>>(value);
    } else if (key == "identifiers") {
      options.identifiers = std::get<std::vector<std::string>>(value);
    } else if (key == "show_errors") {
      options.show_errors = std::get<bool>(value);
    } else if (key == "resolve_units") {
      options.resolve_units = std::get<bool>(value);
    } else if (key == "skip_install") {
      options.skip_install = std::get<bool>(value);
    } else if (key == "limit") {
      options.limit = std::get<std::size_t>(value);
    } else if (key == "stop_after") {
      options.stop_after = std::get<std::size_t>(value);
    } else if (key == "log_level") {
      options.log_level = surveyor::ParseLogLevel(std::get<std::string>(value));
    } else if (key == "build_dir") {
      options.build_directory = std::get<std::string>(value);
    } else {
      ThrowUnknownKey(key);
    }
  }
}

std::string FormatElapsed(std::chrono::milliseconds elapsed) {
  const auto total_ms = elapsed.count();
  const auto hours = total_ms / 3600000;
  const auto minutes = (total_ms / 60000) % 60;
  const auto seconds = (total_ms / 1000) % 60;
  const auto millis = total_ms % 1000;
  std::ostringstream stream;
  stream << hours << ":" << std::setw(2) << std::setfill('0') << minutes << ":"
         << std::setw(2) << seconds << "." << std::setw(3) << millis;
  return stream.str();
}

} // namespace

namespace surveyor {

void PrintSurveyUsage(std::ostream &stream) {
  stream
      << "Usage: surveyor [options] <path>...\n\n"
      << "Analyzes each project root. A single path without CMakeLists.txt\n"
      << "is treated as a container of projects.\n\n"
      << "Options:\n"
      << "  --visitor <list>      Visitors to run (registered: errors,\n"
      << "                        identifiers; default: errors)\n"
      << "  --show-errors         Report diagnostics (default)\n"
      << "  --no-show-errors      Do not report diagnostics\n"
      << "  --resolve-units       Full semantic parse and node traversal\n"
      << "                        (default)\n"
      << "  --syntax-only         Single-file parse reporting only parse and\n"
      << "                        lexical issues, no traversal\n"
      << "  --skip-install        Do not configure projects before analysis\n"
      << "  --exclude <list>      Path segments to skip (e.g. test,third_party)\n"
      << "  --limit <n>           Process at most n roots\n"
      << "  --stop-after <n>      Visitors stop the run after n roots\n"
      << "  --identifiers <list>  Identifiers counted by 'identifiers'\n"
      << "  --build <path>        Build directory relative to each root\n"
      << "                        (default: build)\n"
      << "  --config <file>       Optional YAML config file\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --help                Show this message\n";
}

SurveyOptions ParseSurveyArguments(const std::vector<std::string> &arguments) {
  SurveyOptions options;
  bool positional_only = false;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (positional_only || argument.empty() || argument.front() != '-') {
      options.paths.emplace_back(argument);
      continue;
    }
    if (argument == "--") {
      positional_only = true;
      continue;
    }
    if (!DispatchSurveyOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + argument);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

SurveyOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  SurveyOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

SurveyOptions MergeOptions(const SurveyOptions &config_options,
                           const SurveyOptions &cli_options) {
  SurveyOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };
  const auto override_list = [](auto &target, const auto &source) {
    if (!source.empty()) {
      target = source;
    }
  };

  override_list(merged.paths, cli_options.paths);
  override_list(merged.excluded_paths, cli_options.excluded_paths);
  override_list(merged.visitors, cli_options.visitors);
  override_list(merged.identifiers, cli_options.identifiers);
  override_value(merged.show_errors, cli_options.show_errors);
  override_value(merged.resolve_units, cli_options.resolve_units);
  override_value(merged.skip_install, cli_options.skip_install);
  override_value(merged.limit, cli_options.limit);
  override_value(merged.stop_after, cli_options.stop_after);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.build_directory, cli_options.build_directory);
  override_value(merged.config_file, cli_options.config_file);
  return merged;
}

SurveyOptions ResolveSurveyOptions(const SurveyOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  SurveyOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  if (merged.paths.empty()) {
    throw std::invalid_argument(
        "At least one path is required (or set 'paths' in the config file)");
  }
  return merged;
}

RunConfiguration BuildRunConfiguration(const SurveyOptions &options) {
  RunConfiguration config;
  config.paths = options.paths;
  config.show_errors = options.show_errors.value_or(true);
  config.resolve_units = options.resolve_units.value_or(true);
  config.force_skip_install = options.skip_install.value_or(false);
  config.excluded_paths.insert(options.excluded_paths.begin(),
                               options.excluded_paths.end());
  config.debug_limit = options.limit;
  if (options.build_directory) {
    config.build_directory = *options.build_directory;
  }
  return config;
}

VisitorOptions BuildVisitorOptions(const SurveyOptions &options,
                                   std::ostream &out) {
  VisitorOptions visitor_options;
  visitor_options.out = &out;
  visitor_options.display_base = std::filesystem::current_path();
  visitor_options.identifiers.insert(options.identifiers.begin(),
                                     options.identifiers.end());
  visitor_options.stop_after = options.stop_after;
  return visitor_options;
}

int RunSurvey(const std::vector<std::string> &arguments, std::ostream &out,
              std::ostream &log) {
  const auto cli_options = ParseSurveyArguments(arguments);
  if (cli_options.show_help) {
    PrintSurveyUsage(out);
    return kExitSuccess;
  }

  const auto options = ResolveSurveyOptions(cli_options);
  const auto config = BuildRunConfiguration(options);
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  auto logger = MakeLogger(logging, log);

  DriverBuilder builder;
  builder.WithLogger(logger);
  builder.WithVisitorOptions(BuildVisitorOptions(options, out));
  builder.WithDiscoveryListener([&out](const DiscoveryResult &discovery) {
    if (!discovery.expanded) {
      return;
    }
    out << "Recursing into '" << discovery.container.string() << "'...\n";
    out << "(Found " << discovery.Total() << " subdirectories.)\n";
  });
  for (const auto &name : options.visitors) {
    builder.WithVisitorName(name);
  }
  auto driver = builder.Build();

  if (config.debug_limit) {
    out << "Limiting analysis to " << *config.debug_limit << " roots.\n";
  }

  const auto start = std::chrono::steady_clock::now();
  RunResult result;
  try {
    result = driver.Run(config);
  } catch (const VisitorError &error) {
    logger->Log(LogLevel::kError, "survey.visitor.failed",
                {{"visitor", error.VisitorName()}, {"hook", error.Hook()}});
    PrintRunSummary(driver.Statistics(), out);
    log << "Error: " << error.what() << "\n";
    return kExitVisitorFailure;
  }

  for (const auto &error : result.discovery_errors) {
    out << "Skipped '" << error.path.string() << "': " << error.reason << "\n";
  }
  if (result.outcome == RunOutcome::kNoRoots) {
    out << "No analyzable roots found.\n";
  }
  PrintRunSummary(result.statistics, out);
  out << "(Elapsed time: "
      << FormatElapsed(std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start))
      << ")\n";
  return RunExitCode(result);
}

} // namespace surveyor
