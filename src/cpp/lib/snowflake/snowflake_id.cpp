#include "snowflake_id.h"

#include <algorithm>

using namespace std;

uint64_t encode_id(uint64_t timestamp_delta, uint64_t data_center_id,
                   uint64_t machine_id, uint64_t sequence) {
  return ((timestamp_delta & MAX_TIMESTAMP_DELTA) << TIMESTAMP_SHIFT) |
         ((data_center_id & MAX_DATA_CENTER_ID) << DATA_CENTER_ID_SHIFT) |
         ((machine_id & MAX_MACHINE_ID) << MACHINE_ID_SHIFT) |
         (sequence & SEQUENCE_MASK);
}

SnowflakeFields decode_id(uint64_t id) {
  SnowflakeFields fields;
  fields.timestamp_delta = (id >> TIMESTAMP_SHIFT) & MAX_TIMESTAMP_DELTA;
  fields.data_center_id = (id >> DATA_CENTER_ID_SHIFT) & MAX_DATA_CENTER_ID;
  fields.machine_id = (id >> MACHINE_ID_SHIFT) & MAX_MACHINE_ID;
  fields.sequence = id & SEQUENCE_MASK;
  return fields;
}

string to_binary_string(uint64_t id) {
  if (id == 0) {
    return "0";
  }

  string bits;
  while (id != 0) {
    bits.push_back((id & 1) ? '1' : '0');
    id >>= 1;
  }
  reverse(bits.begin(), bits.end());
  return bits;
}
