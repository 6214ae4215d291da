#include <surveyor/line_info.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace surveyor {

LineInfo::LineInfo(std::vector<std::size_t> line_starts)
    : line_starts_(std::move(line_starts)) {
  if (line_starts_.empty() || line_starts_.front() != 0) {
    throw std::invalid_argument("Line starts must begin at offset 0");
  }
  if (!std::is_sorted(line_starts_.begin(), line_starts_.end())) {
    throw std::invalid_argument("Line starts must be sorted");
  }
}

LineInfo LineInfo::FromContent(const std::string &content) {
  std::vector<std::size_t> starts{0};
  for (std::size_t i = 0; i < content.size(); ++i) {
    if (content[i] == '\r') {
      if (i + 1 < content.size() && content[i + 1] == '\n') {
        ++i;
      }
      starts.push_back(i + 1);
      continue;
    }
    if (content[i] == '\n') {
      starts.push_back(i + 1);
    }
  }
  return LineInfo(std::move(starts));
}

CharacterLocation LineInfo::Location(std::size_t offset) const {
  const auto next =
      std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line_index =
      static_cast<std::size_t>(std::distance(line_starts_.begin(), next)) - 1;
  CharacterLocation location;
  location.line = static_cast<unsigned>(line_index + 1);
  location.column =
      static_cast<unsigned>(offset - line_starts_[line_index] + 1);
  return location;
}

} // namespace surveyor
