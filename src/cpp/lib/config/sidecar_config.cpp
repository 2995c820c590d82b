#include "sidecar_config.h"

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

#include "../id_generator.h"
#include "../network_util.h"
#include "../snowflake/snowflake_errors.h"

using namespace std;

int64_t get_env_int(const char* name, int64_t default_value, int64_t min_value,
                    int64_t max_value) {
  const char* raw = getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return default_value;
  }

  errno = 0;
  char* end = nullptr;
  long long value = strtoll(raw, &end, 10);
  if (errno == ERANGE || end == raw || *end != '\0') {
    throw InvalidConfiguration(string(name) + " (" + raw +
                               ") is not a valid integer");
  }

  if (value < min_value || value > max_value) {
    throw InvalidConfiguration(string(name) + " (" + raw +
                               ") must be between " + to_string(min_value) +
                               " and " + to_string(max_value));
  }

  return value;
}

SidecarConfig load_sidecar_config() {
  SidecarConfig config;

  config.data_center_id = static_cast<int>(
      get_env_int("DATA_CENTER_ID", 0, 0, MAX_DATA_CENTER_ID));

  const char* machine_env = getenv("MACHINE_ID");
  if (machine_env != nullptr && *machine_env != '\0') {
    config.machine_id =
        static_cast<int>(get_env_int("MACHINE_ID", 0, 0, MAX_MACHINE_ID));
  } else {
    // Not assigned externally: fall back to the low bits of the IPv4 address
    config.machine_id = static_cast<int>(get_machine_id_from_ip());
  }

  config.epoch = get_env_int("SNOWFLAKE_EPOCH", DEFAULT_EPOCH, 0,
                             numeric_limits<int64_t>::max());
  config.port = static_cast<int>(get_env_int("SIDECAR_PORT", 8080, 1, 65535));

  return config;
}
