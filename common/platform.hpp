#pragma once

// ============================================================
// platform.hpp -- Socket/OS portability layer for swiftcp
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>
#include <stdexcept>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <winsock2.h>
#  include <ws2tcpip.h>
#  include <windows.h>
#  pragma comment(lib, "ws2_32.lib")

   using socket_t = SOCKET;
#  define SWIFTCP_INVALID_SOCKET INVALID_SOCKET
#  define SWIFTCP_SOCKET_ERROR   SOCKET_ERROR
#  define SWIFTCP_CLOSE_SOCKET(s) closesocket(s)
#  define SWIFTCP_SHUT_BOTH      SD_BOTH
#  define SWIFTCP_SEND_FLAGS     0

   inline int last_socket_error() { return WSAGetLastError(); }
   inline bool interrupted(int err) { return err == WSAEINTR; }
   inline std::string socket_error_str(int err) {
       char buf[256] = {0};
       FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                      nullptr, err, 0, buf, sizeof(buf), nullptr);
       std::string s = buf;
       while (!s.empty() && (s.back() == '\r' || s.back() == '\n')) s.pop_back();
       return s + " (err=" + std::to_string(err) + ")";
   }

#else // POSIX
#  include <sys/types.h>
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <arpa/inet.h>
#  include <unistd.h>
#  include <errno.h>
#  include <cstring>
#  include <netdb.h>
#  include <csignal>

   using socket_t = int;
#  define SWIFTCP_INVALID_SOCKET (-1)
#  define SWIFTCP_SOCKET_ERROR   (-1)
#  define SWIFTCP_CLOSE_SOCKET(s) ::close(s)
#  define SWIFTCP_SHUT_BOTH      SHUT_RDWR
   // Writing to a reset peer must surface as EPIPE, not kill the process
#  define SWIFTCP_SEND_FLAGS     MSG_NOSIGNAL

   inline int last_socket_error() { return errno; }
   inline bool interrupted(int err) { return err == EINTR; }
   inline std::string socket_error_str(int err) {
       return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
   }
#endif

namespace platform {

inline void init() {
#ifdef _WIN32
    WSADATA wsa;
    int rc = WSAStartup(MAKEWORD(2, 2), &wsa);
    if (rc != 0) {
        throw std::runtime_error("WSAStartup failed: " + std::to_string(rc));
    }
#else
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

inline void cleanup() {
#ifdef _WIN32
    WSACleanup();
#endif
}

// RAII guard for process-wide socket setup
struct Guard {
    Guard()  { init(); }
    ~Guard() { cleanup(); }
};

} // namespace platform

using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
