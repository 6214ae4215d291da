#pragma once

#include <surveyor/models.h>

#include <cstddef>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

namespace surveyor {

// Base of every visitor. A visitor opts into lifecycle hooks by also
// deriving from any subset of the callback interfaces below.
class Visitor {
public:
  virtual ~Visitor() = default;
  virtual std::string Name() const { return "visitor"; }
};

struct PreAnalysisContext {
  const AnalysisRoot &root;
  bool sub_root = false;
  // 1-based position of the root in this run, and the discovered total.
  std::size_t progress = 0;
  std::size_t total = 0;
};

enum class AnalysisControl { kContinue, kStop };

class PreAnalysisCallback {
public:
  virtual ~PreAnalysisCallback() = default;
  virtual void PreAnalysis(const PreAnalysisContext &context) = 0;
};

class FileContextCallback {
public:
  virtual ~FileContextCallback() = default;
  virtual void SetFilePath(const std::string &path) = 0;
  virtual void SetLineInfo(std::shared_ptr<const LineInfo> line_info) = 0;
};

class NodeVisitor {
public:
  virtual ~NodeVisitor() = default;
  // Node kinds of interest. Empty means every kind.
  virtual std::set<std::string> NodeKinds() const { return {}; }
  virtual void VisitNode(const SyntaxNode &node) = 0;
};

class ErrorReporter {
public:
  virtual ~ErrorReporter() = default;
  // Returns the number of findings the visitor kept after its own filter.
  virtual std::size_t ReportErrors(const FileResult &result) = 0;
};

class PostAnalysisCallback {
public:
  virtual ~PostAnalysisCallback() = default;
  virtual AnalysisControl PostAnalysis(const AnalysisRoot &root) = 0;
};

class RunFinishedCallback {
public:
  virtual ~RunFinishedCallback() = default;
  virtual void OnRunFinished() = 0;
};

struct VisitorCapabilities {
  std::shared_ptr<Visitor> visitor;
  PreAnalysisCallback *pre_analysis = nullptr;
  FileContextCallback *file_context = nullptr;
  NodeVisitor *node_visitor = nullptr;
  std::set<std::string> node_kinds;
  ErrorReporter *error_reporter = nullptr;
  PostAnalysisCallback *post_analysis = nullptr;
  RunFinishedCallback *run_finished = nullptr;

  bool WantsNode(const std::string &kind) const {
    return node_visitor != nullptr &&
           (node_kinds.empty() || node_kinds.count(kind) > 0);
  }
};

VisitorCapabilities ProbeCapabilities(std::shared_ptr<Visitor> visitor);

// Raised when a visitor hook fails. Aborts the run.
class VisitorError : public std::runtime_error {
public:
  VisitorError(std::string visitor, std::string hook, std::string root,
               const std::string &cause);

  const std::string &VisitorName() const { return visitor_; }
  const std::string &Hook() const { return hook_; }
  const std::string &RootName() const { return root_; }

private:
  std::string visitor_;
  std::string hook_;
  std::string root_;
};

} // namespace surveyor
