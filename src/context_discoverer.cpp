#include <surveyor/context_discoverer.h>

#include <algorithm>
#include <optional>
#include <system_error>
#include <utility>

namespace surveyor {

namespace {
bool IsHidden(const std::filesystem::path &path) {
  const auto name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

std::filesystem::path Normalize(const std::filesystem::path &path) {
  std::error_code error;
  auto absolute = std::filesystem::absolute(path, error);
  if (error) {
    return path.lexically_normal();
  }
  absolute = absolute.lexically_normal();
  // Drop a trailing separator so filename() yields the directory name.
  if (!absolute.has_filename() && absolute.has_parent_path()) {
    absolute = absolute.parent_path();
  }
  return absolute;
}

// Returns nullopt when the container cannot be listed.
std::optional<std::vector<std::filesystem::path>>
ListSubdirectories(const std::filesystem::path &container) {
  std::vector<std::filesystem::path> children;
  std::error_code error;
  std::filesystem::directory_iterator it(container, error);
  const std::filesystem::directory_iterator end{};
  for (; !error && it != end; it.increment(error)) {
    std::error_code entry_error;
    if (!it->is_directory(entry_error) || entry_error ||
        IsHidden(it->path())) {
      continue;
    }
    children.push_back(it->path());
  }
  if (error) {
    return std::nullopt;
  }
  std::sort(children.begin(), children.end(),
            [](const auto &left, const auto &right) {
              return left.filename().string() < right.filename().string();
            });
  return children;
}
} // namespace

ContextDiscoverer::ContextDiscoverer(std::string manifest_name,
                                     std::shared_ptr<Logger> logger)
    : manifest_name_(std::move(manifest_name)),
      logger_(EnsureLogger(std::move(logger))) {}

bool ContextDiscoverer::IsProject(const std::filesystem::path &directory) const {
  std::error_code error;
  return std::filesystem::is_regular_file(directory / manifest_name_, error);
}

DiscoveryResult ContextDiscoverer::Discover(
    const std::vector<std::filesystem::path> &inputs) const {
  DiscoveryResult result;

  std::vector<std::filesystem::path> valid;
  for (const auto &input : inputs) {
    const auto path = Normalize(input);
    std::error_code error;
    if (!std::filesystem::exists(path, error)) {
      result.errors.push_back({path, "path does not exist"});
    } else if (!std::filesystem::is_directory(path, error)) {
      result.errors.push_back({path, "path is not a directory"});
    } else {
      valid.push_back(path);
      continue;
    }
    logger_->Log(LogLevel::kWarn, "discovery.error",
                 {{"path", path.string()},
                  {"reason", result.errors.back().reason}});
  }

  if (inputs.size() == 1 && valid.size() == 1 && !IsProject(valid.front())) {
    const auto container = valid.front();
    logger_->Log(LogLevel::kInfo, "discovery.expand",
                 {{"container", container.string()}});
    result.expanded = true;
    result.container = container;
    auto children = ListSubdirectories(container);
    if (!children) {
      result.errors.push_back({container, "cannot list directory"});
      logger_->Log(LogLevel::kWarn, "discovery.error",
                   {{"path", container.string()},
                    {"reason", result.errors.back().reason}});
      return result;
    }
    const auto parent_name = container.filename().string();
    for (auto &child : *children) {
      AnalysisRoot root;
      root.path = std::move(child);
      root.parent_name = parent_name;
      root.sub_root = true;
      result.roots.push_back(std::move(root));
    }
    logger_->Log(LogLevel::kInfo, "discovery.expanded",
                 {{"container", container.string()},
                  {"subdirectories", std::to_string(result.roots.size())}});
  } else {
    for (const auto &path : valid) {
      AnalysisRoot root;
      root.path = path;
      result.roots.push_back(std::move(root));
    }
  }

  for (std::size_t i = 0; i < result.roots.size(); ++i) {
    result.roots[i].index = i;
  }
  return result;
}

} // namespace surveyor
