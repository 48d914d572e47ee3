#pragma once
#include <cstring>
#include <string>

// Socket portability layer for the telemetry network code.

#ifdef _WIN32
#ifndef _WINSOCKAPI_
#define _WINSOCKAPI_
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif

// winsock2 must precede windows.h
#include <winsock2.h>
#include <ws2tcpip.h>
#include <windows.h>

#pragma comment(lib, "ws2_32.lib")
typedef SOCKET socket_t;
#define INVALID_SOCKET_HANDLE INVALID_SOCKET
#define CLOSE_SOCKET closesocket

inline int last_socket_error() {
    return WSAGetLastError();
}

// Read errors that mean "no datagram yet" rather than a fault.
inline bool is_transient_socket_error(int code) {
    return code == WSAEWOULDBLOCK || code == WSAETIMEDOUT || code == WSAEINTR;
}

inline std::string socket_error_string(int code) {
    return "WSA error " + std::to_string(code);
}
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>

typedef int socket_t;
#define INVALID_SOCKET_HANDLE (-1)
#define CLOSE_SOCKET close

inline int last_socket_error() {
    return errno;
}

inline bool is_transient_socket_error(int code) {
    return code == EAGAIN || code == EWOULDBLOCK || code == EINTR;
}

inline std::string socket_error_string(int code) {
    return std::string(std::strerror(code));
}
#endif
