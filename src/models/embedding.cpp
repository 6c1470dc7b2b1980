#include "models/embedding.h"
#include <cmath>
#include <cstring>
#include <limits>

bool Embedding::validate(size_t expectedDimension, IdentityErrorCode &code,
                         std::string &error) const {
  if (values.size() != expectedDimension) {
    code = IdentityErrorCode::DimensionMismatch;
    error = "Embedding has " + std::to_string(values.size()) +
            " components, expected " + std::to_string(expectedDimension);
    return false;
  }

  for (size_t i = 0; i < values.size(); ++i) {
    if (!std::isfinite(values[i])) {
      code = IdentityErrorCode::InvalidValue;
      error = "Embedding component " + std::to_string(i) + " is not finite";
      return false;
    }
  }

  return true;
}

bool Embedding::operator==(const Embedding &other) const {
  // Bitwise comparison: round trips must reproduce the exact float values
  if (values.size() != other.values.size()) {
    return false;
  }
  if (!values.empty() &&
      std::memcmp(values.data(), other.values.data(),
                  values.size() * sizeof(float)) != 0) {
    return false;
  }
  return capturedAt == other.capturedAt && provenance == other.provenance;
}

bool toComponent(double value, float &out) {
  if (!std::isfinite(value) ||
      std::fabs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
    return false;
  }
  out = static_cast<float>(value);
  return true;
}

Embedding makeEmbedding(std::vector<float> values, size_t expectedDimension,
                        Timestamp capturedAt, std::string provenance) {
  Embedding embedding;
  embedding.values = std::move(values);
  embedding.capturedAt = capturedAt;
  embedding.provenance = std::move(provenance);

  IdentityErrorCode code;
  std::string error;
  if (!embedding.validate(expectedDimension, code, error)) {
    throw IdentityException(code, error);
  }
  return embedding;
}
