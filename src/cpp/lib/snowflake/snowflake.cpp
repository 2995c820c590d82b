#include "snowflake.h"

#include <string>
#include <thread>
#include <utility>

#include "snowflake_errors.h"
#include "snowflake_id.h"

using namespace std;

Snowflake::Snowflake(int data_center_id, int machine_id)
    : Snowflake(data_center_id, machine_id, DEFAULT_EPOCH) {}

Snowflake::Snowflake(int data_center_id, int machine_id, int64_t epoch)
    : Snowflake(data_center_id, machine_id, epoch, make_shared<SystemClock>()) {
}

Snowflake::Snowflake(int data_center_id, int machine_id, int64_t epoch,
                     shared_ptr<Clock> clock)
    : epoch(epoch), clock(move(clock)) {
  if (!this->clock) {
    throw InvalidConfiguration("Clock must not be null");
  }

  if (epoch < 0) {
    throw InvalidConfiguration("Epoch (" + to_string(epoch) +
                               ") must not be negative");
  }

  if (epoch > this->clock->current_time_millis()) {
    throw InvalidConfiguration("Epoch (" + to_string(epoch) +
                               ") cannot be in the future");
  }

  if (data_center_id < 0 ||
      static_cast<uint64_t>(data_center_id) > MAX_DATA_CENTER_ID) {
    throw InvalidConfiguration("Data Center ID (" + to_string(data_center_id) +
                               ") must be between 0 and " +
                               to_string(MAX_DATA_CENTER_ID));
  }

  if (machine_id < 0 || static_cast<uint64_t>(machine_id) > MAX_MACHINE_ID) {
    throw InvalidConfiguration("Machine ID (" + to_string(machine_id) +
                               ") must be between 0 and " +
                               to_string(MAX_MACHINE_ID));
  }

  this->data_center_id = static_cast<uint64_t>(data_center_id);
  this->machine_id = static_cast<uint64_t>(machine_id);
}

uint64_t Snowflake::pack_state(int64_t timestamp, uint64_t sequence) {
  return (static_cast<uint64_t>(timestamp + 1) << SEQUENCE_BITS) |
         (sequence & SEQUENCE_MASK);
}

int64_t Snowflake::unpack_timestamp(uint64_t packed) {
  return static_cast<int64_t>(packed >> SEQUENCE_BITS) - 1;
}

/**
 * Spin-waits until the clock advances past the given timestamp.
 * Throws ClockRegressed if the clock moves backwards while waiting.
 */
int64_t Snowflake::wait_for_next_millis(int64_t last_ts) {
  int64_t timestamp = clock->current_time_millis();
  while (timestamp <= last_ts) {
    if (timestamp < last_ts) {
      throw ClockRegressed(last_ts, timestamp);
    }
    this_thread::yield();
    timestamp = clock->current_time_millis();
  }
  return timestamp;
}

uint64_t Snowflake::next_id() {
  uint64_t current_state = state.load(memory_order_acquire);

  // Lock-free Compare-And-Swap (CAS) loop
  while (true) {
    int64_t last_ts = unpack_timestamp(current_state);
    uint64_t seq = current_state & SEQUENCE_MASK;

    int64_t timestamp = clock->current_time_millis();

    // Handle clock moving backwards (fail-fast, state untouched)
    if (timestamp < last_ts) {
      throw ClockRegressed(last_ts, timestamp);
    }

    // Before the first ID the sentinel cannot catch a clock behind the epoch
    if (timestamp < epoch) {
      throw ClockRegressed(epoch, timestamp);
    }

    if (timestamp == last_ts) {
      // Same millisecond: take the next sequence number
      seq = (seq + 1) & SEQUENCE_MASK;
      // If sequence overflows (> 4095), wait for the next millisecond
      if (seq == 0) {
        timestamp = wait_for_next_millis(last_ts);
      }
    } else {
      // New millisecond: restart the sequence
      seq = 0;
    }

    uint64_t next_state = pack_state(timestamp, seq);

    // On failure current_state is refreshed with the winner's state
    if (state.compare_exchange_strong(current_state, next_state,
                                      memory_order_acq_rel,
                                      memory_order_acquire)) {
      return encode_id(static_cast<uint64_t>(timestamp - epoch),
                       data_center_id, machine_id, seq);
    }

    // Another thread won the race; back off briefly and retry
    this_thread::yield();
  }
}
