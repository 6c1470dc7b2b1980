#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Error taxonomy shared by the enrollment, matching, registry and
 * transfer layers.
 *
 * Callers map these values to exit codes or HTTP statuses; the core never
 * produces user-facing text beyond the exception message.
 */
enum class IdentityErrorCode {
  DimensionMismatch,
  InvalidValue,
  InsufficientSamples,
  DuplicateIdentity,
  UnknownIdentity,
  ExtractionFailed,
  InvalidIdentity,
  MalformedRecord,
  StorageFailure
};

/**
 * @brief Stable name of an error code (e.g. "DuplicateIdentity")
 */
const char *identityErrorName(IdentityErrorCode code);

/**
 * @brief Exception raised by registry, enrollment, matching and transfer
 * operations
 */
class IdentityException : public std::runtime_error {
public:
  IdentityException(IdentityErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  IdentityErrorCode code() const noexcept { return code_; }

private:
  IdentityErrorCode code_;
};
