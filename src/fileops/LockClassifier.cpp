#include "fileops/LockClassifier.hpp"

#include <cerrno>

namespace refsafe {

#ifdef _WIN32
static constexpr int kErrorSharingViolation = 32;
static constexpr int kErrorLockViolation = 33;
#endif

LockStatus classify(std::error_code ec, bool targetWritable) {
  if (!ec) return LockStatus::Fatal;

#ifdef _WIN32
  if (ec.category() == std::system_category()) {
    switch (ec.value()) {
    case kErrorSharingViolation:
    case kErrorLockViolation:
      return LockStatus::Locked;
    default:
      break;
    }
  }
#endif

  const auto cond = ec.default_error_condition();
  if (cond.category() != std::generic_category()) return LockStatus::Fatal;

  switch (cond.value()) {
  case EACCES:
  case EPERM:
    return targetWritable ? LockStatus::Locked : LockStatus::Fatal;
  case EBUSY:
#ifdef ETXTBSY
  case ETXTBSY:
#endif
  case EAGAIN:
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
  case EWOULDBLOCK:
#endif
    return LockStatus::Locked;
  default:
    return LockStatus::Fatal;
  }
}

} // namespace refsafe
