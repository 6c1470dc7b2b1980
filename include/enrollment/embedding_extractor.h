#pragma once

#include <cstddef>
#include <vector>

/**
 * @brief Embedding Extractor Interface
 *
 * Turns one raw visual sample (encoded image bytes) into a fixed-length
 * feature vector. The engine never inspects pixels itself.
 */
class IEmbeddingExtractor {
public:
  virtual ~IEmbeddingExtractor() = default;

  /**
   * @brief Extract a feature vector
   * @param rawSample Encoded sample bytes
   * @return Feature vector of dimension() components
   * @throws IdentityException (ExtractionFailed) if no usable face is found
   */
  virtual std::vector<float>
  extract(const std::vector<unsigned char> &rawSample) = 0;

  /**
   * @brief Output dimension of the extractor
   */
  virtual size_t dimension() const = 0;
};
