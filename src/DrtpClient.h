#pragma once

#include "ArqSender.h"
#include "DrtpConfig.h"
#include "DrtpTransport.h"
#include "drtp_connection.h"
#include "drtp_stream.h"

#include <memory>

// Sending end of one transfer over any datagram link.
class ClientSession {
public:
    explicit ClientSession(const DrtpConfig& cfg);

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    bool open(DatagramTransport& link);
    bool transfer(DatagramTransport& link, ByteSource& src);
    bool close(DatagramTransport& link);

    const DrtpConnection& connection() const { return conn; }
    const ArqSender& sender() const { return *tx; }

    // Re-sends of the FIN before the client closes without the final ACK.
    static constexpr int kFinRetries = 10;

private:
    const DrtpConfig& A;
    DrtpConnection conn;
    std::unique_ptr<ArqSender> tx;
};

class DrtpClient {
public:
    explicit DrtpClient(const DrtpConfig& cfg);

    DrtpClient(const DrtpClient&) = delete;
    DrtpClient& operator=(const DrtpClient&) = delete;

    bool init();
    bool run();

private:
    void report(double elapsed_s) const;

private:
    DrtpConfig A;
    UdpTransport link;
    FileSource src;
};
