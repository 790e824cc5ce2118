// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stdexcept>
#include <string>

namespace tangle {

enum class ErrorKind {
  MissingParameter,         // a required argument or option is absent
  InvalidParameter,         // an argument is present but malformed
  NodePoolEmpty,            // no healthy node to talk to
  ProofOfWorkFailed,        // nonce search could not run or found nothing
  TransactionError,         // a message could not be built
  NoNeedPromoteOrReattach,  // retry requested for a message that needs neither
  NetworkError,             // connect, read, write or timeout failure
  MissingPayload,           // reattach of a message without payload
  ResponseError,            // node answered with an unexpected HTTP status
  InvalidResponse,          // node answered with a body we cannot decode
  NotEnoughBalance,         // transfer inputs do not cover the outputs
};

// Stable name used in log lines and CLI output
const char* ErrorKindName(ErrorKind kind);

/**
 * Error - exception type for every failure the client reports.
 *
 * what() returns "<KindName>: <detail>".
 */
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& detail);

  ErrorKind kind() const { return kind_; }
  const std::string& detail() const { return detail_; }

private:
  ErrorKind kind_;
  std::string detail_;
};

}  // namespace tangle
