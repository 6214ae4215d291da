#include <surveyor/driver.h>

#include <chrono>
#include <stdexcept>
#include <utility>

namespace surveyor {

Driver::Driver(DriverComponents components)
    : engine_(std::move(components.engine)),
      preparer_(std::move(components.preparer)),
      logger_(EnsureLogger(std::move(components.logger))),
      discoverer_(std::move(components.manifest_name), logger_),
      on_discovered_(std::move(components.on_discovered)) {
  if (!engine_) {
    throw std::invalid_argument("Driver requires an analysis engine");
  }
  for (auto &visitor : components.visitors) {
    AddVisitor(std::move(visitor));
  }
}

void Driver::AddVisitor(std::shared_ptr<Visitor> visitor) {
  if (state_ != DriverState::kIdle && state_ != DriverState::kFinished) {
    throw std::logic_error("Visitors cannot be added during a run");
  }
  auto capabilities = ProbeCapabilities(std::move(visitor));
  logger_->Log(
      LogLevel::kDebug, "driver.visitor.registered",
      {{"visitor", capabilities.visitor->Name()},
       {"pre_analysis", capabilities.pre_analysis ? "true" : "false"},
       {"file_context", capabilities.file_context ? "true" : "false"},
       {"nodes", capabilities.node_visitor ? "true" : "false"},
       {"errors", capabilities.error_reporter ? "true" : "false"},
       {"post_analysis", capabilities.post_analysis ? "true" : "false"},
       {"run_finished", capabilities.run_finished ? "true" : "false"}});
  visitors_.push_back(std::move(capabilities));
}

template <typename Hook>
void Driver::Invoke(const VisitorCapabilities &capabilities,
                    const char *hook_name, const AnalysisRoot *root,
                    Hook &&hook) {
  try {
    hook();
  } catch (const VisitorError &) {
    throw;
  } catch (const std::exception &error) {
    throw VisitorError(capabilities.visitor->Name(), hook_name,
                       root != nullptr ? root->QualifiedName() : std::string{},
                       error.what());
  }
}

RunResult Driver::Run(const RunConfiguration &config) {
  try {
    return Execute(config);
  } catch (const VisitorError &) {
    state_ = DriverState::kFinished;
    throw;
  }
}

RunResult Driver::Execute(const RunConfiguration &config) {
  aggregator_ = StatisticsAggregator{};
  run_state_ = RunState{};
  run_state_.debug_limit = config.debug_limit;

  RunResult result;
  const auto run_start = std::chrono::steady_clock::now();

  state_ = DriverState::kDiscovering;
  const auto discovery = discoverer_.Discover(config.paths);
  result.discovery_errors = discovery.errors;
  aggregator_.RecordDiscovered(discovery.Total());
  aggregator_.RecordRootsSkipped(discovery.errors.size());
  logger_->Log(LogLevel::kInfo, "driver.start",
               {{"roots", std::to_string(discovery.Total())},
                {"discovery_errors", std::to_string(discovery.errors.size())},
                {"visitors", std::to_string(visitors_.size())}});
  if (on_discovered_) {
    on_discovered_(discovery);
  }
  if (config.debug_limit) {
    logger_->Log(LogLevel::kInfo, "driver.limit",
                 {{"roots", std::to_string(*config.debug_limit)}});
  }

  if (discovery.roots.empty()) {
    logger_->Log(LogLevel::kError, "driver.no_roots",
                 {{"inputs", std::to_string(config.paths.size())}});
    result.outcome = RunOutcome::kNoRoots;
    Finish();
    result.statistics = aggregator_.Statistics();
    return result;
  }

  const auto total = discovery.Total();
  for (std::size_t i = 0; i < total; ++i) {
    const auto &root = discovery.roots[i];
    state_ = DriverState::kPreRoot;
    if (run_state_.LimitReached()) {
      aggregator_.RecordRootsSkipped(total - i);
      result.outcome = RunOutcome::kLimitReached;
      logger_->Log(LogLevel::kInfo, "driver.limit.reached",
                   {{"processed", std::to_string(run_state_.processed_roots)},
                    {"remaining", std::to_string(total - i)}});
      break;
    }

    std::unique_ptr<AnalysisContext> context;
    if (!EnterRoot(root, config, total, context)) {
      continue;
    }

    state_ = DriverState::kAnalyzing;
    const auto root_start = std::chrono::steady_clock::now();
    AnalyzeRoot(*context, config);
    context.reset();

    state_ = DriverState::kPostRoot;
    const auto control = LeaveRoot(root);
    aggregator_.RecordRootProcessed();
    logger_->Log(
        LogLevel::kInfo, "driver.root.complete",
        {{"root", root.QualifiedName()},
         {"duration_ms",
          std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - root_start)
                             .count())}});
    if (control == AnalysisControl::kStop) {
      aggregator_.RecordRootsSkipped(total - i - 1);
      result.outcome = RunOutcome::kStopped;
      logger_->Log(LogLevel::kInfo, "driver.stopped",
                   {{"root", root.QualifiedName()},
                    {"remaining", std::to_string(total - i - 1)}});
      break;
    }
    ++run_state_.processed_roots;
  }

  Finish();
  result.statistics = aggregator_.Statistics();
  logger_->Log(
      LogLevel::kInfo, "driver.complete",
      {{"duration_ms",
        std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - run_start)
                           .count())},
       {"processed", std::to_string(result.statistics.roots_processed)},
       {"findings", std::to_string(result.statistics.findings_reported)}});
  return result;
}

bool Driver::EnterRoot(const AnalysisRoot &root, const RunConfiguration &config,
                       std::size_t total,
                       std::unique_ptr<AnalysisContext> &context) {
  logger_->Log(LogLevel::kInfo, "driver.root.start",
               {{"root", root.path.string()},
                {"index", std::to_string(root.index)}});

  if (preparer_ && !config.force_skip_install) {
    try {
      preparer_->Prepare(root, config);
    } catch (const std::exception &error) {
      logger_->Log(LogLevel::kWarn, "driver.prepare.failed",
                   {{"root", root.path.string()}, {"error", error.what()}});
    }
  }

  try {
    context = engine_->Open(root, config);
  } catch (const AnalysisError &error) {
    logger_->Log(LogLevel::kError, "driver.root.skipped",
                 {{"root", root.path.string()}, {"error", error.what()}});
    aggregator_.RecordRootsSkipped();
    return false;
  }
  if (!context) {
    logger_->Log(LogLevel::kError, "driver.root.skipped",
                 {{"root", root.path.string()}, {"error", "no context"}});
    aggregator_.RecordRootsSkipped();
    return false;
  }

  const PreAnalysisContext pre_context{root, root.sub_root, root.index + 1,
                                       total};
  for (const auto &visitor : visitors_) {
    if (visitor.pre_analysis == nullptr) {
      continue;
    }
    Invoke(visitor, "PreAnalysis", &root,
           [&] { visitor.pre_analysis->PreAnalysis(pre_context); });
  }
  return true;
}

void Driver::AnalyzeRoot(AnalysisContext &context,
                         const RunConfiguration &config) {
  AnalysisPass pass{context.Root()};
  auto files = context.Files();
  while (auto file = files->Next()) {
    ++pass.file_index;
    if (file->Failed()) {
      logger_->Log(LogLevel::kWarn, "driver.file.failed",
                   {{"file", file->path},
                    {"index", std::to_string(pass.file_index)},
                    {"error", *file->failure}});
      aggregator_.RecordFileFailed();
      pass.failed_files.push_back(file->path);
      continue;
    }
    AnalyzeFile(pass, *file, config);
  }

  logger_->Log(LogLevel::kDebug, "driver.root.files",
               {{"root", pass.root.QualifiedName()},
                {"files", std::to_string(pass.file_index)},
                {"failed", std::to_string(pass.failed_files.size())}});
}

void Driver::AnalyzeFile(AnalysisPass &pass, const FileResult &file,
                         const RunConfiguration &config) {
  aggregator_.RecordFileAnalyzed();
  const auto *root = &pass.root;

  for (const auto &visitor : visitors_) {
    if (visitor.file_context == nullptr) {
      continue;
    }
    Invoke(visitor, "SetFilePath", root,
           [&] { visitor.file_context->SetFilePath(file.path); });
    Invoke(visitor, "SetLineInfo", root,
           [&] { visitor.file_context->SetLineInfo(file.line_info); });
  }

  if (config.resolve_units && file.unit) {
    // The unit may call back from C code; failures are carried out of the
    // traversal instead of being thrown through it.
    std::optional<VisitorError> failure;
    file.unit->Traverse([&](const SyntaxNode &node) {
      if (failure) {
        return;
      }
      for (const auto &visitor : visitors_) {
        if (!visitor.WantsNode(node.kind)) {
          continue;
        }
        try {
          Invoke(visitor, "VisitNode", root,
                 [&] { visitor.node_visitor->VisitNode(node); });
        } catch (const VisitorError &error) {
          failure = error;
          return;
        }
      }
    });
    if (failure) {
      throw *failure;
    }
  }

  if (config.show_errors) {
    for (const auto &visitor : visitors_) {
      if (visitor.error_reporter == nullptr) {
        continue;
      }
      Invoke(visitor, "ReportErrors", root, [&] {
        aggregator_.RecordFindings(visitor.error_reporter->ReportErrors(file));
      });
    }
  }
}

AnalysisControl Driver::LeaveRoot(const AnalysisRoot &root) {
  auto control = AnalysisControl::kContinue;
  for (const auto &visitor : visitors_) {
    if (visitor.post_analysis == nullptr) {
      continue;
    }
    Invoke(visitor, "PostAnalysis", &root, [&] {
      if (visitor.post_analysis->PostAnalysis(root) ==
          AnalysisControl::kStop) {
        control = AnalysisControl::kStop;
      }
    });
  }
  return control;
}

void Driver::Finish() {
  state_ = DriverState::kFinished;
  for (const auto &visitor : visitors_) {
    if (visitor.run_finished == nullptr) {
      continue;
    }
    Invoke(visitor, "OnRunFinished", nullptr,
           [&] { visitor.run_finished->OnRunFinished(); });
  }
}

} // namespace surveyor
