#ifndef SIDECAR_H
#define SIDECAR_H

#include "../id_generator.h"

/**
 * Handles one accepted sidecar connection end to end.
 *
 * Writes a single ID as ASCII decimal and closes the socket. When the
 * generator reports a clock regression the error is logged to stderr and the
 * socket is closed without a reply, so the peer reads EOF.
 *
 * @return true if an ID was written in full.
 */
bool serve_connection(int fd, IdGenerator& generator);

/**
 * Opens a TCP socket listening on all interfaces at `port`, with
 * SO_REUSEADDR and SO_REUSEPORT enabled.
 *
 * @return the listening descriptor, or -1 after logging the failing call.
 */
int open_listener(int port);

#endif  // SIDECAR_H
