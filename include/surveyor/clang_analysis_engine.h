#pragma once

#include <surveyor/interfaces.h>
#include <surveyor/logging.h>

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace surveyor {

bool IsSourceFile(const std::filesystem::path &path);

// Diagnostic categories a syntax-only parse can report reliably.
bool IsSyntaxCategory(const std::string &category);

// True when any component of `relative` equals one of the excluded segments.
bool IsExcludedPath(const std::filesystem::path &relative,
                    const std::set<std::string> &excluded_segments);

std::vector<std::filesystem::path>
CollectSourceFiles(const std::filesystem::path &root,
                   const std::filesystem::path &build_directory,
                   const std::set<std::string> &excluded_segments);

// Drops the compiler, the input file, -c and -o <file> from a compile
// command so the rest can be handed to libclang.
std::vector<std::string>
NormalizeCompileArguments(const std::vector<std::string> &arguments,
                          const std::filesystem::path &file);

std::vector<std::string>
DefaultCompileArguments(const std::filesystem::path &file);

class ClangAnalysisEngine : public AnalysisEngine {
public:
  explicit ClangAnalysisEngine(std::shared_ptr<Logger> logger = nullptr);

  std::unique_ptr<AnalysisContext>
  Open(const AnalysisRoot &root, const RunConfiguration &config) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace surveyor
