#pragma once

// ============================================================
// connector.hpp -- Opens the per-file connection for the sender
// ============================================================

#include "socket.hpp"
#include "stream.hpp"
#include <memory>

class Connector {
public:
    virtual ~Connector() = default;

    // A fresh connection per call; throws TransferError(CONNECTION)
    virtual std::unique_ptr<ByteStream> connect(const Endpoint& ep) = 0;
};

class TcpConnector : public Connector {
public:
    std::unique_ptr<ByteStream> connect(const Endpoint& ep) override {
        auto sock = std::make_unique<TcpSocket>();
        sock->connect(ep);
        return sock;
    }
};
