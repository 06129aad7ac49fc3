#pragma once
#include <string>
#include <vector>

namespace refsafe {

// One textual span to replace. Offsets/lengths are byte-based in the original
// content.
struct Edit {
  unsigned    offset = 0;
  unsigned    length = 0;
  std::string replacement;
};

// Applies `edits` to `content`, highest offset first so earlier offsets stay
// valid. Fails (leaving `content` untouched) on out-of-range or overlapping
// edits.
bool applyEdits(std::string& content, std::vector<Edit> edits, std::string* error);

} // namespace refsafe
