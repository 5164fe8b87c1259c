#pragma once

#include <string>

namespace codereview::util {

// Random RFC4122 v4 id in canonical 8-4-4-4-12 form. Used for task ids and
// generated subscriber client ids.
std::string GenerateId();

} // namespace codereview::util
