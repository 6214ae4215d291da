#pragma once

#include <surveyor/models.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace surveyor {

class AnalysisError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Single-pass sequence of per-file results. Not restartable.
class FileResultStream {
public:
  virtual ~FileResultStream() = default;
  virtual std::optional<FileResult> Next() = 0;
};

// Handle bound to one AnalysisRoot for the duration of its pass.
class AnalysisContext {
public:
  virtual ~AnalysisContext() = default;
  virtual const AnalysisRoot &Root() const = 0;
  virtual std::unique_ptr<FileResultStream> Files() = 0;
};

class AnalysisEngine {
public:
  virtual ~AnalysisEngine() = default;
  virtual std::unique_ptr<AnalysisContext>
  Open(const AnalysisRoot &root, const RunConfiguration &config) = 0;
};

// Brings a root into an analyzable state (the dependency/install step).
class ProjectPreparer {
public:
  virtual ~ProjectPreparer() = default;
  virtual void Prepare(const AnalysisRoot &root,
                       const RunConfiguration &config) = 0;
};

} // namespace surveyor
