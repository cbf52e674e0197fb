#include "DrtpServer.h"

#include "drtp_handshake.h"

#include <iostream>

ServerSession::ServerSession(const DrtpConfig& cfg, ByteSink& sink_)
    : sink(sink_), rx(make_receiver(cfg)) {}

bool ServerSession::on_datagram(const Bytes& datagram, DatagramTransport& link) {
    if (done) return true;

    auto pkt = drtp_decode(datagram);
    if (!pkt) {
        std::cerr << "Dropping malformed datagram (" << datagram.size() << " bytes)\n";
        return true;
    }

    if (pkt->syn()) return server_on_syn(conn, link);

    if (pkt->fin()) {
        if (!server_on_fin(conn, link)) return false;
        done = true;
        const auto& s = rx->stats();
        std::cerr << "Transfer complete: " << s.delivered << " packets, " << s.bytes
                  << " bytes (" << s.duplicates << " duplicates, " << s.dropped << " dropped)\n";
        return true;
    }

    if (pkt->is_ack()) {
        server_on_ack(conn, *pkt);
        return true;
    }

    return on_data(*pkt, link);
}

bool ServerSession::on_data(const DrtpPacket& pkt, DatagramTransport& link) {
    if (conn.state == ConnState::CLOSED) {
        std::cerr << "DATA seq=" << pkt.seq << " before SYN -> ignoring\n";
        return true;
    }
    if (conn.state == ConnState::SYN_RECEIVED) {
        // Handshake ACK was lost; data proves the client saw our SYN-ACK.
        conn.state = ConnState::ESTABLISHED;
        std::cerr << "DATA before handshake ACK -> connection established\n";
    }

    std::optional<uint32_t> ack;
    if (!rx->on_data(conn, pkt, sink, ack)) return false;
    if (!ack) return true;
    return link.send(server_make_ack(conn, *ack));
}

DrtpServer::DrtpServer(const DrtpConfig& cfg) : A(cfg) {}

bool DrtpServer::init() {
    if (!out.open(A.filename)) return false;
    if (!link.init_server(A.ip, A.port)) return false;

    std::cerr << "Server ready: reliability=" << to_string(A.strategy())
              << (A.fault != FaultMode::None ? std::string(" test=") + to_string(A.fault) : std::string())
              << " -> " << A.filename << "\n";
    return true;
}

bool DrtpServer::run() {
    ServerSession session(A, out);
    bool connected = false;

    Bytes buf;
    while (!session.finished()) {
        RecvStatus rs = link.recv(buf, std::nullopt);
        if (rs == RecvStatus::Timeout) continue;
        if (rs == RecvStatus::Error) {
            std::cerr << "ConnectionError\n";
            return false;
        }

        if (!connected) {
            connected = true;
            std::cerr << "Connected (" << link.peer_string() << ")\n";
        }

        if (!session.on_datagram(buf, link)) {
            std::cerr << "ConnectionError\n";
            return false;
        }
    }

    out.close();
    link.close();
    std::cout << "Wrote " << out.bytes_written() << " bytes to " << A.filename << "\n";
    return true;
}
