#include "tokensale/errors/sale_error.hpp"

namespace tokensale {

const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:            return "Validation";
    case ErrorKind::Authorization:         return "Authorization";
    case ErrorKind::State:                 return "State";
    case ErrorKind::InsufficientAllowance: return "InsufficientAllowance";
    case ErrorKind::CapacityExceeded:      return "CapacityExceeded";
    case ErrorKind::Oracle:                return "Oracle";
    case ErrorKind::TransferFailure:       return "TransferFailure";
    case ErrorKind::NotFound:              return "NotFound";
    case ErrorKind::Reentrancy:            return "Reentrancy";
  }
  return "Unknown";
}

}  // namespace tokensale
