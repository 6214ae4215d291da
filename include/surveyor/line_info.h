#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace surveyor {

struct CharacterLocation {
  unsigned line = 0;
  unsigned column = 0;
};

// Line-start offset table for one file. Lines and columns are 1-based.
class LineInfo {
public:
  explicit LineInfo(std::vector<std::size_t> line_starts);

  static LineInfo FromContent(const std::string &content);

  CharacterLocation Location(std::size_t offset) const;
  std::size_t LineCount() const { return line_starts_.size(); }
  const std::vector<std::size_t> &LineStarts() const { return line_starts_; }

private:
  std::vector<std::size_t> line_starts_;
};

} // namespace surveyor
