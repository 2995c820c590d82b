#include "lib/id_generator.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>

#include "lib/config/sidecar_config.h"
#include "lib/sidecar/sidecar.h"
#include "lib/snowflake/snowflake.h"
#include "lib/snowflake/snowflake_errors.h"

using namespace std;

int main() {
  int server_fd, new_socket;
  struct sockaddr_in address;
  int addrlen = sizeof(address);

  // ---------------------------------------------------------
  // 1. Load Configuration & Build Generator
  // ---------------------------------------------------------
  SidecarConfig config;
  unique_ptr<IdGenerator> generator;

  try {
    config = load_sidecar_config();
    cout << "Initializing Snowflake generator (data center "
         << config.data_center_id << ", machine " << config.machine_id
         << ", epoch " << config.epoch << ")..." << endl;
    generator = make_unique<Snowflake>(config.data_center_id,
                                       config.machine_id, config.epoch);
  } catch (const InvalidConfiguration& e) {
    cerr << "Invalid configuration: " << e.what() << endl;
    exit(EXIT_FAILURE);
  }

  // ---------------------------------------------------------
  // 2. Setup TCP Server Socket
  // ---------------------------------------------------------
  if ((server_fd = open_listener(config.port)) < 0) {
    exit(EXIT_FAILURE);
  }

  cout << "Sidecar listening on port " << config.port << "..." << endl;

  // ---------------------------------------------------------
  // 3. Main Server Loop
  // ---------------------------------------------------------
  while (true) {
    if ((new_socket = accept(server_fd, (struct sockaddr*)&address,
                             (socklen_t*)&addrlen)) < 0) {
      perror("Accept failed");
      continue;
    }

    serve_connection(new_socket, *generator);
  }

  return 0;
}
