#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "stream.hpp"
#include <string>

// host:port pair as given on the command line
struct Endpoint {
    std::string host;
    u16         port{0};

    std::string str() const { return host + ":" + std::to_string(port); }
};

// Parse "host:port". Throws std::invalid_argument on malformed input.
// 'allow_port_zero' is for listeners that want an ephemeral port.
Endpoint parse_endpoint(const std::string& text, bool allow_port_zero = false);

class TcpSocket : public ByteStream {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket() override;

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: resolve 'host' (IPv4) and connect
    void connect(const std::string& host, u16 port);
    void connect(const Endpoint& ep) { connect(ep.host, ep.port); }

    // Server: bind + listen
    void bind_and_listen(const std::string& host, u16 port, int backlog = 128);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws TransferError(CONNECTION)
    void send_all(const void* buf, size_t len);

    // Single recv(); returns 0 on orderly close
    size_t recv_some(void* buf, size_t len);

    // ByteStream
    size_t read_some(void* buf, size_t len) override { return recv_some(buf, len); }
    void write_all(const void* buf, size_t len) override { send_all(buf, len); }
    std::string peer_name() const override { return peer_addr(); }
    void close() override;

    // Stops traffic but keeps the handle. A thread blocked in accept() or
    // recv() on this socket returns. Does not modify the socket, so it may
    // run while another thread is inside one of those calls.
    void shutdown();

    // TCP_NODELAY, keepalive and large socket buffers
    void tune();


    std::string peer_addr() const;

    // Port actually bound (useful after binding port 0)
    u16 local_port() const;

private:
    socket_t fd_{SWIFTCP_INVALID_SOCKET};

    void apply_socket_opts();
};
