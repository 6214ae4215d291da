#include <surveyor/error_surveyor.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <utility>
#include <vector>

namespace surveyor {

ErrorSurveyor::ErrorSurveyor(std::ostream &out,
                             std::filesystem::path display_base,
                             Severity minimum_severity,
                             std::optional<std::size_t> stop_after)
    : out_(&out), printer_(out, std::move(display_base)),
      minimum_severity_(minimum_severity), stop_after_(stop_after) {}

void ErrorSurveyor::PreAnalysis(const PreAnalysisContext &context) {
  ++roots_seen_;
  (*out_) << "Analyzing '" << context.root.QualifiedName() << "' • ["
          << context.progress << "/" << context.total << "]...\n";
  out_->flush();
}

bool ErrorSurveyor::ShowError(const DiagnosticRecord &record) const {
  return static_cast<int>(record.severity) >=
         static_cast<int>(minimum_severity_);
}

std::size_t ErrorSurveyor::ReportErrors(const FileResult &result) {
  std::vector<DiagnosticRecord> shown;
  std::copy_if(result.diagnostics.begin(), result.diagnostics.end(),
               std::back_inserter(shown),
               [this](const auto &record) { return ShowError(record); });
  if (shown.empty()) {
    return 0;
  }
  printer_.PrintFile(result.path, shown);
  for (const auto &record : shown) {
    tally_.Add(record.severity);
  }
  return shown.size();
}

AnalysisControl ErrorSurveyor::PostAnalysis(const AnalysisRoot &) {
  if (stop_after_ && roots_seen_ >= *stop_after_) {
    return AnalysisControl::kStop;
  }
  return AnalysisControl::kContinue;
}

void ErrorSurveyor::OnRunFinished() {
  tally_.Print(*out_);
  out_->flush();
}

} // namespace surveyor
