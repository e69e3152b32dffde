// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <climits>
#include <stdexcept>
#include <string>

// SO_SNDBUF / SO_RCVBUF: room for a few payload chunks in flight
static constexpr int SOCKET_BUF_SIZE = 4 * 1024 * 1024;

Endpoint parse_endpoint(const std::string& text, bool allow_port_zero) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        throw std::invalid_argument("Expected host:port, got '" + text + "'");
    }
    std::string port_str = text.substr(colon + 1);
    for (char c : port_str) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid port in '" + text + "'");
        }
    }
    if (port_str.size() > 5) {
        throw std::invalid_argument("Invalid port in '" + text + "'");
    }
    int port = std::stoi(port_str);
    if (!(utils::validate_port(port) || (allow_port_zero && port == 0))) {
        throw std::invalid_argument("Port out of range in '" + text + "'");
    }
    Endpoint ep;
    ep.host = text.substr(0, colon);
    ep.port = (u16)port;
    return ep;
}

// Resolve an IPv4 literal or host name
static in_addr resolve_ipv4(const std::string& host) {
    in_addr out{};
    if (inet_pton(AF_INET, host.c_str(), &out) == 1) {
        return out;
    }
    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res) {
        throw TransferError(ErrorKind::CONNECTION,
            "Cannot resolve host '" + host + "': " + gai_strerror(rc));
    }
    out = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return out;
}

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == SWIFTCP_INVALID_SOCKET) {
        throw TransferError(ErrorKind::CONNECTION,
            "socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != SWIFTCP_INVALID_SOCKET) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = SWIFTCP_INVALID_SOCKET;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = SWIFTCP_INVALID_SOCKET;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&on), sizeof(on));
}

void TcpSocket::tune() {
    int nodelay   = 1;
    int keepalive = 1;
    int sndbuf    = SOCKET_BUF_SIZE;
    int rcvbuf    = SOCKET_BUF_SIZE;
    // Small header writes go out at once. Segment boundaries are still not
    // preserved: the receiver may see the name and size in one read.
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  reinterpret_cast<const char*>(&nodelay),   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, reinterpret_cast<const char*>(&keepalive), sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    reinterpret_cast<const char*>(&sndbuf),    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    reinterpret_cast<const char*>(&rcvbuf),    sizeof(rcvbuf));
}

void TcpSocket::connect(const std::string& host, u16 port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    addr.sin_addr   = resolve_ipv4(host);

    tune();
    for (;;) {
        if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) != SWIFTCP_SOCKET_ERROR) break;
        int err = last_socket_error();
        if (interrupted(err)) continue;
        throw TransferError(ErrorKind::CONNECTION,
            "connect(" + host + ":" + std::to_string(port) + ") failed: " +
            socket_error_str(err));
    }
}

void TcpSocket::bind_and_listen(const std::string& host, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else {
        addr.sin_addr = resolve_ipv4(host);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SWIFTCP_SOCKET_ERROR) {
        throw TransferError(ErrorKind::CONNECTION,
            "bind(" + host + ":" + std::to_string(port) + ") failed: " +
            socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SWIFTCP_SOCKET_ERROR) {
        throw TransferError(ErrorKind::CONNECTION,
            "listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    for (;;) {
        socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
        if (client != SWIFTCP_INVALID_SOCKET) {
            return TcpSocket(client);
        }
        int err = last_socket_error();
        if (interrupted(err)) continue;
        throw TransferError(ErrorKind::CONNECTION,
            "accept() failed: " + socket_error_str(err));
    }
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        size_t want = std::min(remaining, (size_t)INT_MAX);
        auto sent = ::send(fd_, p, (int)want, SWIFTCP_SEND_FLAGS);
        if (sent < 0) {
            int err = last_socket_error();
            if (interrupted(err)) continue;
            throw TransferError(ErrorKind::CONNECTION,
                "send() failed: " + socket_error_str(err));
        }
        if (sent == 0) {
            throw TransferError(ErrorKind::CONNECTION, "Connection closed during send");
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

size_t TcpSocket::recv_some(void* buf, size_t len) {
    if (len == 0) return 0;
    size_t want = std::min(len, (size_t)INT_MAX);
    for (;;) {
        auto received = ::recv(fd_, static_cast<char*>(buf), (int)want, 0);
        if (received >= 0) return static_cast<size_t>(received);
        int err = last_socket_error();
        if (interrupted(err)) continue;
        throw TransferError(ErrorKind::CONNECTION,
            "recv() failed: " + socket_error_str(err));
    }
}

void TcpSocket::close() {
    if (fd_ != SWIFTCP_INVALID_SOCKET) {
        shutdown();
        SWIFTCP_CLOSE_SOCKET(fd_);
        fd_ = SWIFTCP_INVALID_SOCKET;
    }
}

void TcpSocket::shutdown() {
    if (fd_ != SWIFTCP_INVALID_SOCKET) {
        ::shutdown(fd_, SWIFTCP_SHUT_BOTH);
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) return 0;
    return ntohs(local.sin_port);
}
