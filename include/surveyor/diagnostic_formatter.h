#pragma once

#include <surveyor/models.h>

#include <filesystem>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace surveyor {

// Renders `path:line:column: <SEVERITY> <message>`.
std::string FormatDiagnostic(const DiagnosticRecord &record,
                             const std::string &display_path);

std::string DisplayPath(const std::string &path,
                        const std::filesystem::path &base);

class DiagnosticPrinter {
public:
  explicit DiagnosticPrinter(std::ostream &stream,
                             std::filesystem::path base = {});

  // Writes one line per record, then flushes.
  void PrintFile(const std::string &path,
                 const std::vector<DiagnosticRecord> &records);

private:
  std::ostream *stream_;
  std::filesystem::path base_;
};

class SeverityTally {
public:
  void Add(Severity severity, std::size_t count = 1);
  std::size_t Count(Severity severity) const;
  std::size_t Total() const;
  void Print(std::ostream &stream) const;

private:
  std::map<Severity, std::size_t> counts_;
};

void PrintRunSummary(const RunStatistics &statistics, std::ostream &stream);

} // namespace surveyor
