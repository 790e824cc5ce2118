// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/error.hpp"

namespace tangle {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::MissingParameter:
    return "MissingParameter";
  case ErrorKind::InvalidParameter:
    return "InvalidParameter";
  case ErrorKind::NodePoolEmpty:
    return "NodePoolEmpty";
  case ErrorKind::ProofOfWorkFailed:
    return "ProofOfWorkFailed";
  case ErrorKind::TransactionError:
    return "TransactionError";
  case ErrorKind::NoNeedPromoteOrReattach:
    return "NoNeedPromoteOrReattach";
  case ErrorKind::NetworkError:
    return "NetworkError";
  case ErrorKind::MissingPayload:
    return "MissingPayload";
  case ErrorKind::ResponseError:
    return "ResponseError";
  case ErrorKind::InvalidResponse:
    return "InvalidResponse";
  case ErrorKind::NotEnoughBalance:
    return "NotEnoughBalance";
  }
  return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(ErrorKindName(kind)) + ": " + detail), kind_(kind), detail_(detail) {}

}  // namespace tangle
