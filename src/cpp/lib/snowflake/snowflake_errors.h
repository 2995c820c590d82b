#ifndef SNOWFLAKE_ERRORS_H
#define SNOWFLAKE_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * Base class for every error raised by the Snowflake generator.
 */
class SnowflakeError : public std::runtime_error {
 public:
  explicit SnowflakeError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * Thrown at construction (or while loading configuration) when a data
 * center ID, machine ID or epoch is unusable.
 */
class InvalidConfiguration : public SnowflakeError {
 public:
  explicit InvalidConfiguration(const std::string& message)
      : SnowflakeError(message) {}
};

/**
 * Thrown by next_id() when the wall clock reads earlier than the timestamp
 * of the last issued ID. The generator state is left untouched.
 */
class ClockRegressed : public SnowflakeError {
 public:
  ClockRegressed(int64_t last_timestamp, int64_t current_timestamp)
      : SnowflakeError("Clock moved backwards. Refusing to generate id for " +
                       std::to_string(last_timestamp - current_timestamp) +
                       " milliseconds"),
        last_timestamp_(last_timestamp),
        current_timestamp_(current_timestamp) {}

  int64_t last_timestamp() const { return last_timestamp_; }
  int64_t current_timestamp() const { return current_timestamp_; }

 private:
  int64_t last_timestamp_;
  int64_t current_timestamp_;
};

#endif  // SNOWFLAKE_ERRORS_H
