#pragma once

#include "ArqReceiver.h"
#include "DrtpConfig.h"
#include "DrtpTransport.h"
#include "drtp_connection.h"
#include "drtp_stream.h"

#include <memory>

// Receiving end of one transfer, independent of the socket: feed it every
// datagram from the client and it answers through the link.
class ServerSession {
public:
    ServerSession(const DrtpConfig& cfg, ByteSink& sink);

    ServerSession(const ServerSession&) = delete;
    ServerSession& operator=(const ServerSession&) = delete;

    // False on a transport or sink error.
    bool on_datagram(const Bytes& datagram, DatagramTransport& link);

    // True once the FIN has been answered.
    bool finished() const { return done; }

    const DrtpConnection& connection() const { return conn; }
    const ArqReceiver& receiver() const { return *rx; }

private:
    bool on_data(const DrtpPacket& pkt, DatagramTransport& link);

private:
    ByteSink& sink;
    DrtpConnection conn;
    std::unique_ptr<ArqReceiver> rx;
    bool done = false;
};

class DrtpServer {
public:
    explicit DrtpServer(const DrtpConfig& cfg);

    DrtpServer(const DrtpServer&) = delete;
    DrtpServer& operator=(const DrtpServer&) = delete;

    bool init();
    bool run();

private:
    DrtpConfig A;
    UdpTransport link;
    FileSink out;
};
