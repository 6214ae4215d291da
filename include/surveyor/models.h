#pragma once

#include <surveyor/line_info.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace surveyor {

struct AnalysisRoot {
  std::filesystem::path path;
  // Container directory name when the root came from expanding a container.
  std::string parent_name;
  std::size_t index = 0;
  bool sub_root = false;

  std::string Name() const { return path.filename().string(); }
  std::string QualifiedName() const {
    if (!sub_root || parent_name.empty()) {
      return Name();
    }
    return parent_name + "/" + Name();
  }
};

struct RunConfiguration {
  std::vector<std::filesystem::path> paths;
  bool force_skip_install = false;
  bool resolve_units = false;
  bool show_errors = false;
  std::set<std::string> excluded_paths;
  std::optional<std::size_t> debug_limit;
  std::filesystem::path build_directory = "build";
};

enum class Severity { kIgnored = 0, kNote = 1, kWarning = 2, kError = 3, kFatal = 4 };

std::string SeverityName(Severity severity);

struct DiagnosticRecord {
  std::string file;
  std::size_t offset = 0;
  unsigned line = 0;
  unsigned column = 0;
  Severity severity = Severity::kError;
  std::string category;
  std::string message;
  std::shared_ptr<const LineInfo> line_info;
};

struct SyntaxNode {
  std::string kind;
  std::string spelling;
  std::size_t offset = 0;
  unsigned line = 0;
  unsigned column = 0;
  bool declaration = false;
  bool reference = false;
};

class SyntaxUnit {
public:
  virtual ~SyntaxUnit() = default;
  // Walks the unit depth-first in pre-order, in document order.
  virtual void Traverse(const std::function<void(const SyntaxNode &)> &visit)
      const = 0;
};

struct FileResult {
  std::string path;
  std::shared_ptr<const LineInfo> line_info;
  std::vector<DiagnosticRecord> diagnostics;
  std::shared_ptr<const SyntaxUnit> unit;
  std::optional<std::string> failure;

  bool Failed() const { return failure.has_value(); }
};

struct RunStatistics {
  std::size_t roots_discovered = 0;
  std::size_t roots_processed = 0;
  std::size_t roots_skipped = 0;
  std::size_t files_analyzed = 0;
  std::size_t files_failed = 0;
  std::size_t findings_reported = 0;
};

} // namespace surveyor
