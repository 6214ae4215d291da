#pragma once

#include <surveyor/context_discoverer.h>
#include <surveyor/interfaces.h>
#include <surveyor/logging.h>
#include <surveyor/statistics_aggregator.h>
#include <surveyor/visitors.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace surveyor {

enum class DriverState {
  kIdle,
  kDiscovering,
  kPreRoot,
  kAnalyzing,
  kPostRoot,
  kFinished
};

enum class RunOutcome { kCompleted, kStopped, kLimitReached, kNoRoots };

struct RunResult {
  RunOutcome outcome = RunOutcome::kCompleted;
  RunStatistics statistics;
  std::vector<DiscoveryError> discovery_errors;
};

// Driver-owned counters. Visitors never see this.
struct RunState {
  std::size_t processed_roots = 0;
  std::optional<std::size_t> debug_limit;

  bool LimitReached() const {
    return debug_limit.has_value() && processed_roots >= *debug_limit;
  }
};

struct DriverComponents {
  std::unique_ptr<AnalysisEngine> engine;
  std::unique_ptr<ProjectPreparer> preparer;
  std::shared_ptr<Logger> logger;
  std::vector<std::shared_ptr<Visitor>> visitors;
  std::string manifest_name = "CMakeLists.txt";
  // Called once per run after discovery, before any root is entered.
  std::function<void(const DiscoveryResult &)> on_discovered;
};

class Driver {
public:
  explicit Driver(DriverComponents components);

  // Probes the visitor's capabilities once; hooks run in registration order.
  void AddVisitor(std::shared_ptr<Visitor> visitor);

  // Throws VisitorError when a visitor hook fails; the driver is left in
  // kFinished either way.
  RunResult Run(const RunConfiguration &config);

  DriverState State() const { return state_; }
  const RunStatistics &Statistics() const { return aggregator_.Statistics(); }
  std::size_t VisitorCount() const { return visitors_.size(); }

private:
  struct AnalysisPass {
    const AnalysisRoot &root;
    std::size_t file_index = 0;
    std::vector<std::string> failed_files;
  };

  RunResult Execute(const RunConfiguration &config);
  bool EnterRoot(const AnalysisRoot &root, const RunConfiguration &config,
                 std::size_t total,
                 std::unique_ptr<AnalysisContext> &context);
  void AnalyzeRoot(AnalysisContext &context, const RunConfiguration &config);
  void AnalyzeFile(AnalysisPass &pass, const FileResult &file,
                   const RunConfiguration &config);
  AnalysisControl LeaveRoot(const AnalysisRoot &root);
  void Finish();

  template <typename Hook>
  void Invoke(const VisitorCapabilities &capabilities, const char *hook_name,
              const AnalysisRoot *root, Hook &&hook);

  std::unique_ptr<AnalysisEngine> engine_;
  std::unique_ptr<ProjectPreparer> preparer_;
  std::shared_ptr<Logger> logger_;
  ContextDiscoverer discoverer_;
  std::function<void(const DiscoveryResult &)> on_discovered_;
  std::vector<VisitorCapabilities> visitors_;
  StatisticsAggregator aggregator_;
  RunState run_state_;
  DriverState state_ = DriverState::kIdle;
};

} // namespace surveyor
