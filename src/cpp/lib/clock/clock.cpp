#include "clock.h"

#include <chrono>

using namespace std;

int64_t SystemClock::current_time_millis() {
  return chrono::duration_cast<chrono::milliseconds>(
             chrono::system_clock::now().time_since_epoch())
      .count();
}
