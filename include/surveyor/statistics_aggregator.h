#pragma once

#include <surveyor/models.h>

#include <cstddef>

namespace surveyor {

class StatisticsAggregator {
public:
  void RecordDiscovered(std::size_t count) { stats_.roots_discovered = count; }
  void RecordRootProcessed() { ++stats_.roots_processed; }
  void RecordRootsSkipped(std::size_t count = 1) {
    stats_.roots_skipped += count;
  }
  void RecordFileAnalyzed() { ++stats_.files_analyzed; }
  void RecordFileFailed() { ++stats_.files_failed; }
  void RecordFindings(std::size_t count) { stats_.findings_reported += count; }

  const RunStatistics &Statistics() const { return stats_; }

private:
  RunStatistics stats_;
};

} // namespace surveyor
