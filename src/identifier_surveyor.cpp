#include <surveyor/identifier_surveyor.h>

#include <surveyor/diagnostic_formatter.h>

#include <ostream>
#include <utility>

namespace surveyor {

IdentifierSurveyor::IdentifierSurveyor(std::ostream &out,
                                       std::set<std::string> identifiers,
                                       std::filesystem::path display_base,
                                       std::optional<std::size_t> stop_after)
    : out_(&out), display_base_(std::move(display_base)),
      stop_after_(stop_after) {
  for (auto &identifier : identifiers) {
    occurrences_.emplace(identifier, Occurrences{});
  }
}

std::set<std::string> IdentifierSurveyor::DefaultIdentifiers() {
  return {"final", "import", "module", "override"};
}

std::string IdentifierSurveyor::ProjectName(const std::string &directory_name) {
  return directory_name.substr(0, directory_name.find('-'));
}

void IdentifierSurveyor::PreAnalysis(const PreAnalysisContext &context) {
  ++roots_seen_;
  current_project_ = ProjectName(context.root.Name());
  root_hits_ = 0;
  file_path_.clear();
  line_info_.reset();
  (*out_) << "Analyzing '" << context.root.Name() << "' • [" << context.progress
          << "/" << context.total << "]...\n";
}

void IdentifierSurveyor::SetFilePath(const std::string &path) {
  file_path_ = DisplayPath(path, display_base_);
}

void IdentifierSurveyor::SetLineInfo(std::shared_ptr<const LineInfo> line_info) {
  line_info_ = std::move(line_info);
}

void IdentifierSurveyor::VisitNode(const SyntaxNode &node) {
  if (!node.declaration && !node.reference) {
    return;
  }
  const auto found = occurrences_.find(node.spelling);
  if (found == occurrences_.end()) {
    return;
  }

  auto &occurrence = found->second;
  if (node.declaration) {
    ++occurrence.declarations;
  } else {
    ++occurrence.references;
  }
  occurrence.projects.insert(current_project_);
  projects_with_hits_.insert(current_project_);
  ++root_hits_;

  auto line = node.line;
  auto column = node.column;
  if (line_info_) {
    const auto location = line_info_->Location(node.offset);
    line = location.line;
    column = location.column;
  }
  auto report = file_path_ + ":" + std::to_string(line) + ":" +
                std::to_string(column);
  (*out_) << "found '" << node.spelling << "' "
          << (node.declaration ? "(decl) " : "") << "• " << report << "\n";
  reports_.push_back(std::move(report));
}

AnalysisControl IdentifierSurveyor::PostAnalysis(const AnalysisRoot &) {
  out_->flush();
  if (stop_after_ && roots_seen_ >= *stop_after_) {
    return AnalysisControl::kStop;
  }
  return AnalysisControl::kContinue;
}

void IdentifierSurveyor::OnRunFinished() {
  (*out_) << "Found " << reports_.size() << " occurrences in "
          << projects_with_hits_.size() << " projects:\n";
  for (const auto &report : reports_) {
    (*out_) << report << "\n";
  }
  for (const auto &[identifier, occurrence] : occurrences_) {
    (*out_) << identifier << ": [" << occurrence.declarations << " decl, "
            << occurrence.references << " ref]\n";
    for (const auto &project : occurrence.projects) {
      (*out_) << "  " << project << "\n";
    }
  }
  out_->flush();
}

} // namespace surveyor
