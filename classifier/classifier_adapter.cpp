#include "classifier/classifier_adapter.h"

namespace promptguard {

const char* UnavailableReasonName(UnavailableReason reason) {
  switch (reason) {
    case UnavailableReason::kTimeout:
      return "timeout";
    case UnavailableReason::kUnreachable:
      return "unreachable";
    case UnavailableReason::kHttpStatus:
      return "http_status";
    case UnavailableReason::kMalformedResponse:
      return "malformed_response";
    case UnavailableReason::kCancelled:
      return "cancelled";
  }
  return "unreachable";
}

}  // namespace promptguard
