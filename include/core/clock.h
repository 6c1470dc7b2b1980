#pragma once

#include <chrono>

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Clock Interface
 *
 * Injected wherever a timestamp is stamped onto a record so that enrollment
 * and match bookkeeping stay deterministic under test.
 */
class IClock {
public:
  virtual ~IClock() = default;

  /**
   * @brief Current wall-clock time
   */
  virtual Timestamp now() const = 0;
};

/**
 * @brief Production clock backed by std::chrono::system_clock
 */
class SystemClock : public IClock {
public:
  Timestamp now() const override { return std::chrono::system_clock::now(); }
};
