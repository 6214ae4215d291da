#include <surveyor/diagnostic_formatter.h>

#include <ostream>
#include <utility>

namespace surveyor {
namespace {
std::string Plural(std::size_t count, const std::string &noun) {
  return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &parent) {
  const auto relative = candidate.lexically_relative(parent);
  return !relative.empty() && *relative.begin() != "..";
}
} // namespace

std::string SeverityName(Severity severity) {
  switch (severity) {
  case Severity::kIgnored:
    return "IGNORED";
  case Severity::kNote:
    return "NOTE";
  case Severity::kWarning:
    return "WARNING";
  case Severity::kError:
    return "ERROR";
  case Severity::kFatal:
    return "FATAL";
  }
  return "UNKNOWN";
}

std::string FormatDiagnostic(const DiagnosticRecord &record,
                             const std::string &display_path) {
  auto line = record.line;
  auto column = record.column;
  if (line == 0 && record.line_info) {
    const auto location = record.line_info->Location(record.offset);
    line = location.line;
    column = location.column;
  }
  return display_path + ":" + std::to_string(line) + ":" +
         std::to_string(column) + ": " + SeverityName(record.severity) + " " +
         record.message;
}

std::string DisplayPath(const std::string &path,
                        const std::filesystem::path &base) {
  if (base.empty()) {
    return path;
  }
  const std::filesystem::path candidate(path);
  if (!candidate.is_absolute() || !IsWithin(candidate, base)) {
    return path;
  }
  return candidate.lexically_relative(base).generic_string();
}

DiagnosticPrinter::DiagnosticPrinter(std::ostream &stream,
                                     std::filesystem::path base)
    : stream_(&stream), base_(std::move(base)) {}

void DiagnosticPrinter::PrintFile(
    const std::string &path, const std::vector<DiagnosticRecord> &records) {
  const auto display = DisplayPath(path, base_);
  for (const auto &record : records) {
    (*stream_) << FormatDiagnostic(record, display) << "\n";
  }
  stream_->flush();
}

void SeverityTally::Add(Severity severity, std::size_t count) {
  counts_[severity] += count;
}

std::size_t SeverityTally::Count(Severity severity) const {
  const auto found = counts_.find(severity);
  return found == counts_.end() ? 0 : found->second;
}

std::size_t SeverityTally::Total() const {
  std::size_t total = 0;
  for (const auto &entry : counts_) {
    total += entry.second;
  }
  return total;
}

void SeverityTally::Print(std::ostream &stream) const {
  const auto errors = Count(Severity::kError) + Count(Severity::kFatal);
  stream << Plural(errors, "error") << ", "
         << Plural(Count(Severity::kWarning), "warning") << " and "
         << Plural(Count(Severity::kNote), "note") << " found.\n";
}

void PrintRunSummary(const RunStatistics &statistics, std::ostream &stream) {
  stream << "Roots processed: " << statistics.roots_processed << "\n"
         << "Roots skipped: " << statistics.roots_skipped << "\n"
         << "Files analyzed: " << statistics.files_analyzed << " ("
         << statistics.files_failed << " failed)\n"
         << "Findings: " << statistics.findings_reported << "\n";
  stream.flush();
}

} // namespace surveyor
