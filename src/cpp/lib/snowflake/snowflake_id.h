#ifndef SNOWFLAKE_ID_H
#define SNOWFLAKE_ID_H

#include <cstdint>
#include <string>

#include "../id_generator.h"

// Fields unpacked from a 64-bit Snowflake ID
struct SnowflakeFields {
  uint64_t timestamp_delta;  // milliseconds since the generator's epoch
  uint64_t data_center_id;
  uint64_t machine_id;
  uint64_t sequence;
};

/**
 * Packs the four fields into a Snowflake ID. Each field is masked to its
 * width, so the sign bit is always zero.
 */
uint64_t encode_id(uint64_t timestamp_delta, uint64_t data_center_id,
                   uint64_t machine_id, uint64_t sequence);

SnowflakeFields decode_id(uint64_t id);

// Base-2 rendering without leading zeros ("0" for zero)
std::string to_binary_string(uint64_t id);

#endif  // SNOWFLAKE_ID_H
