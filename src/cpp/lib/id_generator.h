#ifndef ID_GENERATOR_H
#define ID_GENERATOR_H

#include <cstdint>
#include <string>

// ---------------------------------------------------------
// Snowflake Layout Parameters
// ---------------------------------------------------------
// Layout: [1 bit unused] - [41 bits time] - [5 bits data center]
//         - [5 bits machine] - [12 bits seq]
const int64_t DEFAULT_EPOCH = 1725148800000LL;  // Sep 1, 2024

const uint64_t TIMESTAMP_BITS = 41;
const uint64_t DATA_CENTER_ID_BITS = 5;
const uint64_t MACHINE_ID_BITS = 5;
const uint64_t SEQUENCE_BITS = 12;

// Max values for bitwise operations
const uint64_t MAX_TIMESTAMP_DELTA =
    (static_cast<uint64_t>(1) << TIMESTAMP_BITS) - 1;
const uint64_t MAX_DATA_CENTER_ID =
    (static_cast<uint64_t>(1) << DATA_CENTER_ID_BITS) - 1;
const uint64_t MAX_MACHINE_ID =
    (static_cast<uint64_t>(1) << MACHINE_ID_BITS) - 1;
const uint64_t SEQUENCE_MASK = (static_cast<uint64_t>(1) << SEQUENCE_BITS) - 1;

// Bit shifts for packing the 64-bit ID
const uint64_t MACHINE_ID_SHIFT = SEQUENCE_BITS;
const uint64_t DATA_CENTER_ID_SHIFT = SEQUENCE_BITS + MACHINE_ID_BITS;
const uint64_t TIMESTAMP_SHIFT =
    SEQUENCE_BITS + MACHINE_ID_BITS + DATA_CENTER_ID_BITS;

/**
 * Base interface for all ID generators.
 */
class IdGenerator {
 public:
  virtual ~IdGenerator() = default;

  // Returns the ID as a raw 64-bit integer
  virtual uint64_t next_id() = 0;

  // Returns the ID as a formatted string (used for IPC)
  virtual std::string next_id_string() { return std::to_string(next_id()); }
};

#endif  // ID_GENERATOR_H
