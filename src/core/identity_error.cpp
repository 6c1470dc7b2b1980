#include "core/identity_error.h"

const char *identityErrorName(IdentityErrorCode code) {
  switch (code) {
  case IdentityErrorCode::DimensionMismatch:
    return "DimensionMismatch";
  case IdentityErrorCode::InvalidValue:
    return "InvalidValue";
  case IdentityErrorCode::InsufficientSamples:
    return "InsufficientSamples";
  case IdentityErrorCode::DuplicateIdentity:
    return "DuplicateIdentity";
  case IdentityErrorCode::UnknownIdentity:
    return "UnknownIdentity";
  case IdentityErrorCode::ExtractionFailed:
    return "ExtractionFailed";
  case IdentityErrorCode::InvalidIdentity:
    return "InvalidIdentity";
  case IdentityErrorCode::MalformedRecord:
    return "MalformedRecord";
  case IdentityErrorCode::StorageFailure:
    return "StorageFailure";
  }
  return "Unknown";
}
