#ifndef NETWORK_UTIL_H
#define NETWORK_UTIL_H

#include <arpa/inet.h>
#include <ifaddrs.h>

#include <cstdint>
#include <cstring>
#include <iostream>

#include "id_generator.h"

/**
 * Derives a Machine ID from the container's IPv4 address.
 *
 * This function iterates through the network interfaces, finds the first
 * non-loopback IPv4 address, and extracts the required number of bits
 * using the provided bitmask.
 *
 * @param mask The bitmask to apply to the IP address (e.g., MAX_MACHINE_ID)
 * @return The derived ID, or 1 if no suitable interface is found.
 */
inline uint64_t get_machine_id_from_ip(uint64_t mask = MAX_MACHINE_ID) {
  struct ifaddrs* interfaces = nullptr;
  uint64_t machine_id = 1 & mask;  // Default fallback ID

  if (getifaddrs(&interfaces) == 0) {
    for (struct ifaddrs* addr = interfaces; addr != nullptr;
         addr = addr->ifa_next) {
      if (addr->ifa_addr == nullptr || addr->ifa_addr->sa_family != AF_INET) {
        continue;
      }
      // Skip the loopback interface
      if (strcmp(addr->ifa_name, "lo") == 0) {
        continue;
      }
      struct sockaddr_in* in_addr = (struct sockaddr_in*)addr->ifa_addr;
      uint32_t ip = ntohl(in_addr->sin_addr.s_addr);
      machine_id = ip & mask;
      std::cout << "Derived Machine ID " << machine_id
                << " from IP interface " << addr->ifa_name << std::endl;
      break;
    }
  }

  if (interfaces != nullptr) {
    freeifaddrs(interfaces);
  }

  return machine_id;
}

#endif  // NETWORK_UTIL_H
