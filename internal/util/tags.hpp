#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace jobsrv::util {

/*
  Capability tags.

  Stored comma-joined in a single column, so a tag is a non-empty string
  without ',' or whitespace.
*/

inline bool IsValidTag(std::string_view tag) {
  if (tag.empty()) return false;
  return std::none_of(tag.begin(), tag.end(), [](char c) { return c == ',' || c == ' ' || c == '\t' || c == '\n' || c == '\r'; });
}

inline std::string JoinTags(const std::vector<std::string>& tags) {
  std::string out;
  for (const auto& tag : tags) {
    if (!out.empty()) out += ',';
    out += tag;
  }
  return out;
}

inline std::vector<std::string> SplitTags(std::string_view joined) {
  std::vector<std::string> out;
  size_t                   start = 0;
  while (start < joined.size()) {
    auto end = joined.find(',', start);
    if (end == std::string_view::npos) end = joined.size();
    if (end > start) out.emplace_back(joined.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

// Every required tag is offered.
inline bool ContainsAll(const std::vector<std::string>& offered, const std::vector<std::string>& required) {
  return std::all_of(required.begin(), required.end(),
                     [&](const std::string& tag) { return std::find(offered.begin(), offered.end(), tag) != offered.end(); });
}

} // namespace jobsrv::util
