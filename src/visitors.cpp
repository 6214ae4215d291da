#include <surveyor/visitors.h>

#include <stdexcept>
#include <utility>

namespace surveyor {

VisitorCapabilities ProbeCapabilities(std::shared_ptr<Visitor> visitor) {
  if (!visitor) {
    throw std::invalid_argument("Visitor cannot be null");
  }

  VisitorCapabilities capabilities;
  auto *raw = visitor.get();
  capabilities.pre_analysis = dynamic_cast<PreAnalysisCallback *>(raw);
  capabilities.file_context = dynamic_cast<FileContextCallback *>(raw);
  capabilities.node_visitor = dynamic_cast<NodeVisitor *>(raw);
  capabilities.error_reporter = dynamic_cast<ErrorReporter *>(raw);
  capabilities.post_analysis = dynamic_cast<PostAnalysisCallback *>(raw);
  capabilities.run_finished = dynamic_cast<RunFinishedCallback *>(raw);
  if (capabilities.node_visitor != nullptr) {
    capabilities.node_kinds = capabilities.node_visitor->NodeKinds();
  }
  capabilities.visitor = std::move(visitor);
  return capabilities;
}

VisitorError::VisitorError(std::string visitor, std::string hook,
                           std::string root, const std::string &cause)
    : std::runtime_error("Visitor '" + visitor + "' failed in " + hook +
                         (root.empty() ? std::string{} : " for '" + root + "'") +
                         ": " + cause),
      visitor_(std::move(visitor)), hook_(std::move(hook)),
      root_(std::move(root)) {}

} // namespace surveyor
