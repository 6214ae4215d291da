#pragma once

#include <surveyor/diagnostic_formatter.h>
#include <surveyor/visitors.h>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace surveyor {

// Prints the diagnostics of every analyzed project, keeping only those at
// or above a minimum severity, and tallies them for the end of the run.
class ErrorSurveyor : public Visitor,
                      public PreAnalysisCallback,
                      public ErrorReporter,
                      public PostAnalysisCallback,
                      public RunFinishedCallback {
public:
  ErrorSurveyor(std::ostream &out, std::filesystem::path display_base = {},
                Severity minimum_severity = Severity::kWarning,
                std::optional<std::size_t> stop_after = std::nullopt);

  std::string Name() const override { return "errors"; }

  void PreAnalysis(const PreAnalysisContext &context) override;
  std::size_t ReportErrors(const FileResult &result) override;
  AnalysisControl PostAnalysis(const AnalysisRoot &root) override;
  void OnRunFinished() override;

  bool ShowError(const DiagnosticRecord &record) const;
  const SeverityTally &Tally() const { return tally_; }
  std::size_t RootsSeen() const { return roots_seen_; }

private:
  std::ostream *out_;
  DiagnosticPrinter printer_;
  Severity minimum_severity_;
  std::optional<std::size_t> stop_after_;
  SeverityTally tally_;
  std::size_t roots_seen_ = 0;
};

} // namespace surveyor
