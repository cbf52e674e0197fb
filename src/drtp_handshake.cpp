#include "drtp_handshake.h"

#include "drtp_timer.h"

#include <iostream>

bool client_open(DrtpConnection& conn, DatagramTransport& link) {
    Bytes syn = drtp_encode(/*seq*/0, /*ack*/0, FLG_SYN, /*wnd*/0);
    if (!link.send(syn)) {
        std::cerr << "Handshake failed while sending SYN\n";
        return false;
    }
    conn.state = ConnState::SYN_SENT;
    std::cerr << "SYN sent\n";

    Bytes buf;
    while (true) {
        RecvStatus st = link.recv(buf, std::nullopt);
        if (st == RecvStatus::Error) {
            std::cerr << "Handshake failed while waiting for SYN-ACK\n";
            return false;
        }
        if (st == RecvStatus::Timeout) continue;

        auto pkt = drtp_decode(buf);
        if (!pkt) {
            std::cerr << "Dropping malformed datagram (" << buf.size() << " bytes)\n";
            continue;
        }
        if (!pkt->syn_ack()) {
            std::cerr << "Ignoring " << drtp_flags_to_string(pkt->flags)
                      << " while in " << to_string(conn.state) << "\n";
            continue;
        }

        std::cerr << "Received SYN-ACK (window=" << pkt->window << ")\n";
        conn.peer_window = pkt->window;
        conn.ack = pkt->ack;
        break;
    }

    Bytes ack = drtp_encode(/*seq*/1, /*ack*/1, FLG_ACK, /*wnd*/0);
    if (!link.send(ack)) {
        std::cerr << "Handshake failed while sending ACK\n";
        return false;
    }
    conn.seq = 1;
    conn.state = ConnState::ESTABLISHED;
    std::cerr << "Connection established\n";
    return true;
}

bool client_close(DrtpConnection& conn, DatagramTransport& link,
                  std::chrono::milliseconds fin_timeout, int max_retries) {
    Bytes fin = drtp_encode(/*seq*/0, /*ack*/0, FLG_FIN, /*wnd*/0);
    const uint32_t final_ack = conn.seq + 1;

    std::cerr << "Sending FIN\n";
    if (!link.send(fin)) return false;
    conn.state = ConnState::FIN_WAIT;

    RetransmitTimer timer(fin_timeout);
    timer.arm();
    int retries = 0;

    Bytes buf;
    while (true) {
        RecvStatus st = link.recv(buf, timer.remaining());
        if (st == RecvStatus::Error) return false;

        if (st == RecvStatus::Timeout || timer.expired()) {
            if (retries >= max_retries) {
                // The server answers one FIN only; every byte was already ACKed.
                std::cerr << "Warning: no final ACK after " << retries
                          << " FIN retries, closing anyway\n";
                conn.ack = final_ack;
                conn.state = ConnState::CLOSED;
                return true;
            }
            ++retries;
            std::cerr << "  timeout waiting final ACK -> resend FIN (try " << (retries + 1) << ")\n";
            if (!link.send(fin)) return false;
            timer.arm();
            if (st == RecvStatus::Timeout) continue;
        }

        auto pkt = drtp_decode(buf);
        if (!pkt) continue;
        // Late data ACKs can still be in flight; only the FIN's ACK closes.
        if (pkt->is_ack() && pkt->ack == final_ack) break;
    }

    conn.ack = final_ack;
    conn.state = ConnState::CLOSED;
    std::cerr << "Final ACK received, closing the connection!\n";
    return true;
}

bool server_on_syn(DrtpConnection& conn, DatagramTransport& link) {
    if (conn.state == ConnState::CLOSED) {
        std::cerr << "SYN received!\n";
        conn.ack = 1;
        conn.state = ConnState::SYN_RECEIVED;
    } else {
        std::cerr << "Duplicate SYN in " << to_string(conn.state) << " -> re-send SYN-ACK\n";
    }

    Bytes syn_ack = drtp_encode(/*seq*/0, /*ack*/1, FLG_SYN | FLG_ACK, kDrtpAdvertisedWindow);
    return link.send(syn_ack);
}

void server_on_ack(DrtpConnection& conn, const DrtpPacket& pkt) {
    if (conn.seq == 0) conn.seq = pkt.ack;
    if (conn.state == ConnState::SYN_RECEIVED) {
        conn.state = ConnState::ESTABLISHED;
        std::cerr << "ACK received! Connection established\n";
    }
}

bool server_on_fin(DrtpConnection& conn, DatagramTransport& link) {
    std::cerr << "FIN received, sending last ACK!\n";
    conn.state = ConnState::CLOSING;
    conn.ack += 1;
    if (!link.send(server_make_ack(conn, conn.ack))) return false;
    conn.state = ConnState::CLOSED;
    return true;
}

Bytes server_make_ack(const DrtpConnection& conn, uint32_t ack_no) {
    return drtp_encode(conn.seq, ack_no, FLG_ACK, kDrtpAdvertisedWindow);
}
