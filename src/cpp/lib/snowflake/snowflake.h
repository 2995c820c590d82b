#ifndef SNOWFLAKE_H
#define SNOWFLAKE_H

#include <atomic>
#include <cstdint>
#include <memory>

#include "../clock/clock.h"
#include "../id_generator.h"

/**
 * Lock-free Snowflake ID generator.
 *
 * Layout: [1 bit unused] - [41 bits time] - [5 bits data center]
 *         - [5 bits machine] - [12 bits seq]
 *
 * All threads share one generator. The last timestamp and sequence live in a
 * single atomic word and advance only through compare-and-swap, so every
 * successful call commits a distinct (timestamp, sequence) pair.
 *
 * Throws InvalidConfiguration from the constructors and ClockRegressed from
 * next_id().
 */
class Snowflake : public IdGenerator {
 private:
  uint64_t data_center_id;
  uint64_t machine_id;
  int64_t epoch;
  std::shared_ptr<Clock> clock;

  // Upper bits hold (last timestamp + 1), lower SEQUENCE_BITS the sequence.
  // Zero is the "no ID issued yet" state (last timestamp -1).
  std::atomic<uint64_t> state{0};

  static uint64_t pack_state(int64_t timestamp, uint64_t sequence);
  static int64_t unpack_timestamp(uint64_t packed);

  int64_t wait_for_next_millis(int64_t last_ts);

 public:
  Snowflake(int data_center_id, int machine_id);
  Snowflake(int data_center_id, int machine_id, int64_t epoch);
  Snowflake(int data_center_id, int machine_id, int64_t epoch,
            std::shared_ptr<Clock> clock);

  uint64_t next_id() override;

  uint64_t get_data_center_id() const { return data_center_id; }
  uint64_t get_machine_id() const { return machine_id; }
  int64_t get_epoch() const { return epoch; }
};

#endif  // SNOWFLAKE_H
