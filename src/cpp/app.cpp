#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "lib/config/sidecar_config.h"
#include "lib/snowflake/snowflake_errors.h"
#include "lib/snowflake/snowflake_id.h"

using namespace std;

// Mutex to prevent interleaved console output from multiple threads
mutex cout_mutex;

void request_id(int thread_id, int port) {
  // Continuously request IDs from the Snowflake sidecar
  while (true) {
    int sock = 0;
    struct sockaddr_in serv_addr;

    // 1. Create a TCP socket
    if ((sock = socket(AF_INET, SOCK_STREAM, 0)) < 0) {
      lock_guard<mutex> lock(cout_mutex);
      cerr << "[Thread " << thread_id << "] Socket creation error" << endl;
      this_thread::sleep_for(chrono::seconds(1));
      continue;
    }

    // 2. Configure the server address (localhost for sidecar IPC)
    memset(&serv_addr, 0, sizeof(serv_addr));
    serv_addr.sin_family = AF_INET;
    serv_addr.sin_port = htons(port);

    // 3. Convert IPv4 address from text to binary form
    if (inet_pton(AF_INET, "127.0.0.1", &serv_addr.sin_addr) <= 0) {
      lock_guard<mutex> lock(cout_mutex);
      cerr << "[Thread " << thread_id
           << "] Invalid address / Address not supported" << endl;
      close(sock);
      this_thread::sleep_for(chrono::seconds(1));
      continue;
    }

    // 4. Attempt to connect to the sidecar
    if (connect(sock, (struct sockaddr*)&serv_addr, sizeof(serv_addr)) < 0) {
      lock_guard<mutex> lock(cout_mutex);
      cerr << "[Thread " << thread_id << "] Connection Failed. Retrying..."
           << endl;
      close(sock);
      this_thread::sleep_for(chrono::seconds(1));
      continue;
    }

    // 5. Read the decimal ID from the socket
    char buffer[32] = {0};
    ssize_t valread = read(sock, buffer, sizeof(buffer) - 1);

    {
      lock_guard<mutex> lock(cout_mutex);
      if (valread > 0) {
        uint64_t id = strtoull(buffer, nullptr, 10);
        SnowflakeFields fields = decode_id(id);
        cout << "[Thread " << thread_id << "] Received ID: " << id
             << " (time +" << fields.timestamp_delta << "ms, data center "
             << fields.data_center_id << ", machine " << fields.machine_id
             << ", seq " << fields.sequence << ")" << endl;
      } else {
        // The sidecar closes without a reply when the clock regressed
        cerr << "[Thread " << thread_id << "] Failed to read ID" << endl;
      }
    }

    // 6. Close the socket and wait before the next request
    close(sock);
    this_thread::sleep_for(chrono::milliseconds(500));  // Request every 500ms
  }
}

int main() {
  int port = 0;
  int num_threads = 0;

  try {
    port = static_cast<int>(get_env_int("SIDECAR_PORT", 8080, 1, 65535));
    num_threads = static_cast<int>(get_env_int("APP_THREADS", 5, 1, 1024));
  } catch (const InvalidConfiguration& e) {
    cerr << "Invalid configuration: " << e.what() << endl;
    exit(EXIT_FAILURE);
  }

  cout << "App container starting with " << num_threads
       << " concurrent threads..." << endl;

  vector<thread> threads;

  // Spawn multiple threads to simulate concurrent requests
  for (int i = 0; i < num_threads; ++i) {
    threads.emplace_back(request_id, i + 1, port);
  }

  // Join threads (will run indefinitely)
  for (auto& t : threads) {
    t.join();
  }

  return 0;
}
