#include <cstdlib>
#include <iostream>

#include "lib/snowflake/snowflake.h"
#include "lib/snowflake/snowflake_errors.h"
#include "lib/snowflake/snowflake_id.h"

using namespace std;

int main() {
  try {
    Snowflake generator(1, 19);  // data center 1, machine 19
    uint64_t id = generator.next_id();

    cout << "Generated Snowflake ID: " << id << endl;
    cout << "In Binary Form: " << to_binary_string(id) << endl;
  } catch (const SnowflakeError& e) {
    cerr << e.what() << endl;
    return EXIT_FAILURE;
  }

  return 0;
}
