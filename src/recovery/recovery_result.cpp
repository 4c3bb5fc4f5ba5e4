// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "recovery/recovery_result.hpp"
#include <sstream>

namespace weave {
namespace recovery {

std::string StatusToString(RecoveryStatus status) {
  switch (status) {
  case RecoveryStatus::RECOVERED:
    return "recovered";
  case RecoveryStatus::ALREADY_SYNCED:
    return "already-synced";
  case RecoveryStatus::ABORTED:
    return "aborted";
  }
  return "unknown";
}

std::string ReasonToString(AbortReason reason) {
  switch (reason) {
  case AbortReason::NONE:
    return "none";
  case AbortReason::MISSING_BLOCK:
    return "missing-block";
  case AbortReason::MALFORMED_BLOCK:
    return "malformed-block";
  case AbortReason::VALIDATION_REJECTED:
    return "validation-rejected";
  case AbortReason::STORAGE_FAILURE:
    return "storage-failure";
  case AbortReason::CANCELLED:
    return "cancelled";
  case AbortReason::PENDING_EXHAUSTED:
    return "pending-exhausted";
  case AbortReason::INTERNAL_ERROR:
    return "internal-error";
  }
  return "unknown";
}

std::string RecoveryResult::ToString() const {
  std::stringstream s;
  s << "RecoveryResult(status=" << StatusToString(status);
  if (status == RecoveryStatus::ABORTED) {
    s << ", reason=" << ReasonToString(reason);
    if (!detail.empty()) {
      s << " (" << detail << ")";
    }
  }
  s << ", target=" << target_hash.ToString().substr(0, 16)
    << ", height=" << target_height
    << ", steps=" << steps_completed
    << ", elapsed=" << elapsed.count() << "ms)";
  return s.str();
}

} // namespace recovery
} // namespace weave
