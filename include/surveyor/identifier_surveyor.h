#pragma once

#include <surveyor/visitors.h>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace surveyor {

struct Occurrences {
  std::size_t declarations = 0;
  std::size_t references = 0;
  std::set<std::string> projects;
};

// Counts uses of identifiers that would break if they became reserved words.
class IdentifierSurveyor : public Visitor,
                           public PreAnalysisCallback,
                           public FileContextCallback,
                           public NodeVisitor,
                           public PostAnalysisCallback,
                           public RunFinishedCallback {
public:
  IdentifierSurveyor(std::ostream &out, std::set<std::string> identifiers,
                     std::filesystem::path display_base = {},
                     std::optional<std::size_t> stop_after = std::nullopt);

  static std::set<std::string> DefaultIdentifiers();
  // "widgets-1.2.0" -> "widgets"
  static std::string ProjectName(const std::string &directory_name);

  std::string Name() const override { return "identifiers"; }

  void PreAnalysis(const PreAnalysisContext &context) override;
  void SetFilePath(const std::string &path) override;
  void SetLineInfo(std::shared_ptr<const LineInfo> line_info) override;
  void VisitNode(const SyntaxNode &node) override;
  AnalysisControl PostAnalysis(const AnalysisRoot &root) override;
  void OnRunFinished() override;

  const std::map<std::string, Occurrences> &AllOccurrences() const {
    return occurrences_;
  }
  const std::vector<std::string> &Reports() const { return reports_; }
  std::size_t RootHits() const { return root_hits_; }

private:
  std::ostream *out_;
  std::filesystem::path display_base_;
  std::optional<std::size_t> stop_after_;
  std::map<std::string, Occurrences> occurrences_;
  std::vector<std::string> reports_;
  std::set<std::string> projects_with_hits_;

  // Per-root state, reset in PreAnalysis.
  std::string current_project_;
  std::size_t root_hits_ = 0;
  std::size_t roots_seen_ = 0;

  // Per-file state.
  std::string file_path_;
  std::shared_ptr<const LineInfo> line_info_;
};

} // namespace surveyor
