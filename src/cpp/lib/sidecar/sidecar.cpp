#include "sidecar.h"

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

#include "../snowflake/snowflake_errors.h"

using namespace std;

bool serve_connection(int fd, IdGenerator& generator) {
  bool served = false;

  try {
    // One decimal ID per connection (stateless IPC)
    string id_str = generator.next_id_string();

    size_t sent = 0;
    while (sent < id_str.length()) {
      // MSG_NOSIGNAL: a client that hung up must not kill the sidecar
      ssize_t n = send(fd, id_str.c_str() + sent, id_str.length() - sent,
                       MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        perror("Send failed");
        break;
      }
      sent += static_cast<size_t>(n);
    }
    served = sent == id_str.length();
  } catch (const ClockRegressed& e) {
    // Drop the request; the generator recovers once the clock does
    cerr << e.what() << endl;
  }

  close(fd);
  return served;
}

int open_listener(int port) {
  int server_fd;
  struct sockaddr_in address;
  int opt = 1;

  if ((server_fd = socket(AF_INET, SOCK_STREAM, 0)) < 0) {
    perror("Socket creation failed");
    return -1;
  }

  // Allow reuse of address and port to prevent "Address already in use" errors
  if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt))) {
    perror("setsockopt(SO_REUSEADDR) failed");
    close(server_fd);
    return -1;
  }
  if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt))) {
    perror("setsockopt(SO_REUSEPORT) failed");
    close(server_fd);
    return -1;
  }

  memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = INADDR_ANY;
  address.sin_port = htons(port);

  if (bind(server_fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
    perror("Bind failed");
    close(server_fd);
    return -1;
  }

  if (listen(server_fd, SOMAXCONN) < 0) {
    perror("Listen failed");
    close(server_fd);
    return -1;
  }

  return server_fd;
}
