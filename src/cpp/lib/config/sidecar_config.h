#ifndef SIDECAR_CONFIG_H
#define SIDECAR_CONFIG_H

#include <cstdint>

// ---------------------------------------------------------
// Environment-driven settings for the sidecar
// ---------------------------------------------------------
//   DATA_CENTER_ID   [0, 31]        default 0
//   MACHINE_ID       [0, 31]        default derived from the IPv4 address
//   SNOWFLAKE_EPOCH  ms since 1970  default DEFAULT_EPOCH
//   SIDECAR_PORT     [1, 65535]     default 8080
//
// The client reads SIDECAR_PORT and APP_THREADS ([1, 1024], default 5)
// through get_env_int directly.
struct SidecarConfig {
  int data_center_id;
  int machine_id;
  int64_t epoch;
  int port;
};

/**
 * Reads an integer environment variable.
 *
 * Returns default_value when the variable is unset or empty. Throws
 * InvalidConfiguration when the value is not a whole decimal integer or lies
 * outside [min_value, max_value].
 */
int64_t get_env_int(const char* name, int64_t default_value, int64_t min_value,
                    int64_t max_value);

SidecarConfig load_sidecar_config();

#endif  // SIDECAR_CONFIG_H
