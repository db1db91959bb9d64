#pragma once

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>

typedef int socket_t;
#define CLOSE_SOCKET(s) close(s)
#define IS_VALID_SOCKET(s) ((s) >= 0)
#ifndef INVALID_SOCKET
#define INVALID_SOCKET (-1)
#endif

#ifdef MSG_NOSIGNAL
    #define SM_SEND_FLAGS MSG_NOSIGNAL
#else
    #define SM_SEND_FLAGS 0
#endif

inline bool set_nonblocking(socket_t fd, bool enable = true) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

inline void set_nodelay(socket_t fd) {
    int flag = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
}
