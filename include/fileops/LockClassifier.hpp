#pragma once
#include <system_error>

namespace refsafe {

enum class LockStatus { Locked, Fatal };

// Decides whether a failed file operation hit transient lock contention
// (another process, an editor, a virus scanner holding the file) or a real
// failure. Platform error semantics live here and nowhere else.
//
// Permission errors count as contention only while the target is writable;
// against a read-only target they are genuine.
LockStatus classify(std::error_code ec, bool targetWritable = true);

inline bool isLocked(std::error_code ec, bool targetWritable = true) {
  return classify(ec, targetWritable) == LockStatus::Locked;
}

} // namespace refsafe
