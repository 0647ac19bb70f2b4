#pragma once

#include <optional>
#include <string>

namespace krecon {

// Unified diff between two renderings of one resource, headed
// LIVE/<label> and MERGED/<label>. std::nullopt when they are identical.
// Runs diff(1); throws CommandFailed when it cannot be run or reports trouble.
std::optional<std::string> unifiedDiff(const std::string &label,
                                       const std::string &live,
                                       const std::string &merged);

// Histogram of a unified diff, as printed by diffstat(1).
std::string diffstat(const std::string &diffText);

} // namespace krecon
