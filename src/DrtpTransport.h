#pragma once

#include "drtp_protocol.h"

#include <chrono>
#include <cstdint>
#include <netinet/in.h>
#include <optional>
#include <string>

enum class RecvStatus {
    Ok,
    Timeout,
    Error,   // unrecoverable transport fault
};

// Unreliable datagram link between exactly two peers.
class DatagramTransport {
public:
    virtual ~DatagramTransport() = default;

    // Sends one datagram to the peer. False on a transport fault.
    virtual bool send(const Bytes& datagram) = 0;

    // Blocks for the next datagram. With no timeout, waits indefinitely.
    virtual RecvStatus recv(Bytes& out, std::optional<std::chrono::milliseconds> timeout) = 0;
};

// UDP socket. A client socket is connected to the server so ICMP errors
// (port unreachable) surface as RecvStatus::Error. A server socket learns its
// peer from the first datagram it receives.
class UdpTransport : public DatagramTransport {
public:
    UdpTransport() = default;
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    bool init_server(const std::string& ip, uint16_t port);
    bool init_client(const std::string& ip, uint16_t port);

    bool send(const Bytes& datagram) override;
    RecvStatus recv(Bytes& out, std::optional<std::chrono::milliseconds> timeout) override;

    bool has_peer() const { return have_peer; }

    // Port the socket is bound to; resolves port 0 binds. 0 on error.
    uint16_t local_port() const;
    std::string peer_string() const;

    void close();

private:
    bool resolve(const std::string& ip, uint16_t port, sockaddr_in& out);

private:
    int fd = -1;
    bool connected = false;
    bool have_peer = false;
    sockaddr_in peer{};
};
