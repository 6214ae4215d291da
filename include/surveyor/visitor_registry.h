#pragma once

#include <surveyor/visitors.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace surveyor {

// Settings handed to visitor factories.
struct VisitorOptions {
  std::ostream *out = nullptr;
  std::filesystem::path display_base;
  std::set<std::string> identifiers;
  std::optional<std::size_t> stop_after;
};

class VisitorRegistry {
public:
  using VisitorFactory =
      std::function<std::shared_ptr<Visitor>(const VisitorOptions &)>;

  void RegisterVisitor(const std::string &name, VisitorFactory factory,
                       bool set_as_default = false);

  std::shared_ptr<Visitor> CreateVisitor(const std::string &name,
                                         const VisitorOptions &options) const;

  std::vector<std::string> VisitorNames() const;
  const std::string &DefaultVisitorName() const { return default_name_; }
  bool Contains(const std::string &name) const {
    return factories_.count(name) > 0;
  }

private:
  std::string JoinNames() const;

  std::unordered_map<std::string, VisitorFactory> factories_;
  std::string default_name_;
};

VisitorRegistry MakeVisitorRegistryWithDefaults();
const VisitorRegistry &GlobalVisitorRegistry();

} // namespace surveyor
