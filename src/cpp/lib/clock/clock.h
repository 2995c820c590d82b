#ifndef CLOCK_H
#define CLOCK_H

#include <cstdint>

/**
 * Source of wall-clock time for the generators.
 *
 * Generators never call std::chrono directly so that tests can freeze,
 * advance or rewind time.
 */
class Clock {
 public:
  virtual ~Clock() = default;

  // Milliseconds since the Unix epoch
  virtual int64_t current_time_millis() = 0;
};

class SystemClock : public Clock {
 public:
  int64_t current_time_millis() override;
};

#endif  // CLOCK_H
