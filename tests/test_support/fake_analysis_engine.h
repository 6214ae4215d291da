#ifndef SURVEYOR_TEST_SUPPORT_FAKE_ANALYSIS_ENGINE_H
#define SURVEYOR_TEST_SUPPORT_FAKE_ANALYSIS_ENGINE_H

#include <surveyor/interfaces.h>
#include <surveyor/models.h>
#include <surveyor/visitors.h>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace surveyor {
namespace test {

class FakeSyntaxUnit : public SyntaxUnit {
public:
  explicit FakeSyntaxUnit(std::vector<SyntaxNode> nodes)
      : nodes_(std::move(nodes)) {}

  void Traverse(const std::function<void(const SyntaxNode &)> &visit)
      const override {
    for (const auto &node : nodes_) {
      visit(node);
    }
  }

private:
  std::vector<SyntaxNode> nodes_;
};

inline FileResult MakeFile(const std::string &path,
                           std::vector<DiagnosticRecord> diagnostics = {}) {
  FileResult file;
  file.path = path;
  file.line_info =
      std::make_shared<const LineInfo>(LineInfo::FromContent("a\nb\nc\n"));
  for (auto &diagnostic : diagnostics) {
    diagnostic.file = path;
  }
  file.diagnostics = std::move(diagnostics);
  return file;
}

inline FileResult MakeFailedFile(const std::string &path,
                                 const std::string &reason) {
  FileResult file;
  file.path = path;
  file.failure = reason;
  return file;
}

inline DiagnosticRecord MakeDiagnostic(Severity severity, unsigned line,
                                       unsigned column, std::string message) {
  DiagnosticRecord record;
  record.severity = severity;
  record.line = line;
  record.column = column;
  record.message = std::move(message);
  return record;
}

// What the fake engine serves, keyed by root directory name. Shared with
// the test so it can inspect the calls after the driver took ownership.
struct FakeProjects {
  std::map<std::string, std::vector<FileResult>> files;
  std::set<std::string> unopenable;
  std::vector<std::string> opened;
  std::vector<std::string> prepared;
};

class FakeAnalysisEngine : public AnalysisEngine {
public:
  explicit FakeAnalysisEngine(std::shared_ptr<FakeProjects> projects)
      : projects_(std::move(projects)) {}

  std::unique_ptr<AnalysisContext>
  Open(const AnalysisRoot &root, const RunConfiguration &) override {
    const auto name = root.Name();
    if (projects_->unopenable.count(name) > 0) {
      throw AnalysisError("cannot open " + name);
    }
    projects_->opened.push_back(name);
    return std::make_unique<Context>(root, projects_->files[name]);
  }

private:
  class Stream : public FileResultStream {
  public:
    explicit Stream(std::vector<FileResult> files) : files_(std::move(files)) {}
    std::optional<FileResult> Next() override {
      if (next_ >= files_.size()) {
        return std::nullopt;
      }
      return files_[next_++];
    }

  private:
    std::vector<FileResult> files_;
    std::size_t next_ = 0;
  };

  class Context : public AnalysisContext {
  public:
    Context(AnalysisRoot root, std::vector<FileResult> files)
        : root_(std::move(root)), files_(std::move(files)) {}
    const AnalysisRoot &Root() const override { return root_; }
    std::unique_ptr<FileResultStream> Files() override {
      return std::make_unique<Stream>(files_);
    }

  private:
    AnalysisRoot root_;
    std::vector<FileResult> files_;
  };

  std::shared_ptr<FakeProjects> projects_;
};

class RecordingPreparer : public ProjectPreparer {
public:
  explicit RecordingPreparer(std::shared_ptr<FakeProjects> projects)
      : projects_(std::move(projects)) {}

  void Prepare(const AnalysisRoot &root, const RunConfiguration &) override {
    projects_->prepared.push_back(root.Name());
  }

private:
  std::shared_ptr<FakeProjects> projects_;
};

// Implements every hook and appends "<name>:<hook>:<detail>" to a shared
// journal so tests can assert on the exact dispatch order.
class RecordingVisitor : public Visitor,
                         public PreAnalysisCallback,
                         public FileContextCallback,
                         public NodeVisitor,
                         public ErrorReporter,
                         public PostAnalysisCallback,
                         public RunFinishedCallback {
public:
  RecordingVisitor(std::string name,
                   std::shared_ptr<std::vector<std::string>> journal)
      : name_(std::move(name)), journal_(std::move(journal)) {}

  std::string Name() const override { return name_; }

  void PreAnalysis(const PreAnalysisContext &context) override {
    Record("pre", context.root.QualifiedName());
    progress.emplace_back(context.progress, context.total);
    MaybeFail("PreAnalysis");
  }

  void SetFilePath(const std::string &path) override {
    Record("file", path);
    MaybeFail("SetFilePath");
  }

  void SetLineInfo(std::shared_ptr<const LineInfo> line_info) override {
    Record("lines", line_info ? "set" : "none");
  }

  std::set<std::string> NodeKinds() const override { return kinds; }

  void VisitNode(const SyntaxNode &node) override {
    Record("node", node.spelling);
    MaybeFail("VisitNode");
  }

  std::size_t ReportErrors(const FileResult &result) override {
    Record("errors", result.path);
    MaybeFail("ReportErrors");
    return result.diagnostics.size();
  }

  AnalysisControl PostAnalysis(const AnalysisRoot &root) override {
    Record("post", root.QualifiedName());
    MaybeFail("PostAnalysis");
    ++roots_done_;
    if (stop_after && roots_done_ >= *stop_after) {
      return AnalysisControl::kStop;
    }
    return AnalysisControl::kContinue;
  }

  void OnRunFinished() override {
    Record("finished", "");
    MaybeFail("OnRunFinished");
  }

  std::set<std::string> kinds;
  std::optional<std::size_t> stop_after;
  std::string fail_in;
  std::vector<std::pair<std::size_t, std::size_t>> progress;

private:
  void Record(const std::string &hook, const std::string &detail) {
    journal_->push_back(name_ + ":" + hook + ":" + detail);
  }

  void MaybeFail(const std::string &hook) {
    if (fail_in == hook) {
      throw std::runtime_error(name_ + " failed in " + hook);
    }
  }

  std::string name_;
  std::shared_ptr<std::vector<std::string>> journal_;
  std::size_t roots_done_ = 0;
};

} // namespace test
} // namespace surveyor

#endif // SURVEYOR_TEST_SUPPORT_FAKE_ANALYSIS_ENGINE_H
