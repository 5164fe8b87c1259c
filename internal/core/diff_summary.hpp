#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/task.hpp"

namespace codereview::core {

std::vector<std::string_view> SplitLines(std::string_view text);

/*
  Line-level diff counts between two versions of a source, based on the
  longest common subsequence of lines. Common leading and trailing lines
  are matched before the quadratic pass.
*/
model::DiffSummary SummarizeDiff(std::string_view original, std::string_view fixed);

} // namespace codereview::core
