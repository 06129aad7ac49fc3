#include "rewrite/Edit.hpp"

#include <algorithm>

namespace refsafe {

bool applyEdits(std::string& content, std::vector<Edit> edits, std::string* error) {
  // apply from highest offset → lowest to keep offsets valid
  std::sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b) {
    return a.offset > b.offset;
  });

  std::string out = content;
  size_t limit = out.size();
  bool first = true;
  for (const auto& e : edits) {
    if (size_t(e.offset) + e.length > limit) {
      if (error) *error = first ? "out-of-range edit" : "overlapping edits";
      return false;
    }
    first = false;
    out.replace(e.offset, e.length, e.replacement);
    limit = e.offset;
  }
  content = std::move(out);
  return true;
}

} // namespace refsafe
