#pragma once

#include <stdexcept>
#include <string>

namespace cktap {

// Length or shape mismatch detected before any signature operation.
class FramingError : public std::invalid_argument {
 public:
  explicit FramingError(const std::string& what) : std::invalid_argument(what) {}
};

// Caller supplied a value outside the operation's contract.
class InvalidInputError : public std::invalid_argument {
 public:
  explicit InvalidInputError(const std::string& what) : std::invalid_argument(what) {}
};

// Operation invoked against a card in an incompatible mode
// (TAPSIGNER-only call on a SATSCARD or the reverse).
class WrongDeviceTypeError : public std::invalid_argument {
 public:
  explicit WrongDeviceTypeError(const std::string& what) : std::invalid_argument(what) {}
};

class PathRangeError : public std::invalid_argument {
 public:
  explicit PathRangeError(const std::string& what) : std::invalid_argument(what) {}
};

class MalformedPathError : public std::invalid_argument {
 public:
  explicit MalformedPathError(const std::string& what) : std::invalid_argument(what) {}
};

// Base of every outcome where the card itself must be rejected. Hosts catch
// this to show a "device rejected" warning instead of a generic error.
class DeviceRejectedError : public std::runtime_error {
 public:
  explicit DeviceRejectedError(const std::string& what) : std::runtime_error(what) {}
};

class BadAuthSignatureError : public DeviceRejectedError {
 public:
  explicit BadAuthSignatureError(const std::string& what) : DeviceRejectedError(what) {}
};

class ProofOfPossessionError : public DeviceRejectedError {
 public:
  explicit ProofOfPossessionError(const std::string& what) : DeviceRejectedError(what) {}
};

class ChainTooShortError : public DeviceRejectedError {
 public:
  explicit ChainTooShortError(const std::string& what) : DeviceRejectedError(what) {}
};

class CounterfeitDeviceError : public DeviceRejectedError {
 public:
  explicit CounterfeitDeviceError(const std::string& what) : DeviceRejectedError(what) {}
};

class SignatureRecoveryError : public std::runtime_error {
 public:
  explicit SignatureRecoveryError(const std::string& what) : std::runtime_error(what) {}
};

// Random source produced degenerate output on every attempt.
class EntropyError : public std::runtime_error {
 public:
  explicit EntropyError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace cktap
