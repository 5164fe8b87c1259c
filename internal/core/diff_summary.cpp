#include "diff_summary.hpp"

#include <algorithm>
#include <cstdint>

namespace codereview::core {

std::vector<std::string_view> SplitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  if (text.empty()) {
    return lines;
  }

  std::size_t start = 0;
  while (start <= text.size()) {
    const auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      // no trailing empty line for a terminating newline
      if (start < text.size()) {
        lines.push_back(text.substr(start));
      }
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

model::DiffSummary SummarizeDiff(std::string_view original, std::string_view fixed) {
  const auto a = SplitLines(original);
  const auto b = SplitLines(fixed);

  std::size_t prefix = 0;
  while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
    ++prefix;
  }

  std::size_t suffix = 0;
  while (suffix < a.size() - prefix && suffix < b.size() - prefix && a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
    ++suffix;
  }

  const std::size_t n = a.size() - prefix - suffix;
  const std::size_t m = b.size() - prefix - suffix;

  // two-row LCS table over the differing middle section
  std::vector<uint32_t> prev(m + 1, 0);
  std::vector<uint32_t> curr(m + 1, 0);
  for (std::size_t i = 1; i <= n; ++i) {
    const auto& line = a[prefix + i - 1];
    for (std::size_t j = 1; j <= m; ++j) {
      if (line == b[prefix + j - 1]) {
        curr[j] = prev[j - 1] + 1;
      } else {
        curr[j] = std::max(prev[j], curr[j - 1]);
      }
    }
    std::swap(prev, curr);
  }

  const std::size_t common = prev[m];

  model::DiffSummary summary;
  summary.lines_unchanged = prefix + suffix + common;
  summary.lines_removed   = n - common;
  summary.lines_added     = m - common;
  return summary;
}

} // namespace codereview::core
