#include "ArqSender.h"

#include <iostream>

size_t AckTable::unacked() const {
    size_t n = 0;
    for (auto& e : entries) {
        if (!e.acked) ++n;
    }
    return n;
}

bool AckTable::mark(uint32_t ack) {
    if (ack <= start_seq) return false;
    size_t idx = (size_t)(ack - 1 - start_seq);
    if (idx >= entries.size()) return false;
    entries[idx].acked = true;
    return true;
}

size_t AckTable::slide() {
    size_t n = 0;
    while (!entries.empty() && entries.front().acked) {
        entries.pop_front();
        ++start_seq;
        ++n;
    }
    return n;
}

ArqSender::ArqSender(const DrtpConfig& cfg) : A(cfg) {}

Bytes ArqSender::frame(uint32_t seq, const Bytes& chunk) {
    ++st.data_packets;
    st.bytes += chunk.size();
    return drtp_encode(seq, /*ack*/1, /*flags*/0, /*wnd*/0, chunk);
}

bool ArqSender::next_chunk(ByteSource& src, Bytes& chunk) {
    if (!src.read(kDrtpMaxPayload, chunk)) {
        std::cerr << "Failed to read from source\n";
        return false;
    }
    return true;
}

bool ArqSender::xmit(DatagramTransport& link, const Bytes& pkt) {
    uint32_t seq = drtp_peek_seq(pkt);
    if (!link.send(pkt)) return false;

    ++st.transmissions;
    if (sent_any && seq <= highest_sent) {
        ++st.retransmissions;
    } else {
        highest_sent = seq;
        sent_any = true;
    }
    return true;
}

bool ArqSender::should_skip(uint32_t seq) {
    if (A.fault != FaultMode::SkipSeq || skipped || seq != A.skip_seq) return false;
    skipped = true;
    std::cerr << "Skipping packet with seq=" << seq << "\n";
    return true;
}

RecvStatus ArqSender::await_ack(DatagramTransport& link, const RetransmitTimer& timer, DrtpPacket& out) {
    Bytes buf;
    while (true) {
        if (timer.expired()) return RecvStatus::Timeout;

        RecvStatus rs = link.recv(buf, timer.remaining());
        if (rs != RecvStatus::Ok) return rs;

        auto pkt = drtp_decode(buf);
        if (!pkt) {
            std::cerr << "Dropping malformed datagram (" << buf.size() << " bytes)\n";
            continue;
        }
        if (!pkt->is_ack()) continue;

        out = std::move(*pkt);
        return RecvStatus::Ok;
    }
}

bool StopAndWaitSender::run(DrtpConnection& conn, DatagramTransport& link, ByteSource& src) {
    RetransmitTimer timer(std::chrono::milliseconds(A.data_timeout_ms));
    uint32_t seq = conn.seq;

    Bytes chunk;
    if (!next_chunk(src, chunk)) return false;
    Bytes pkt = frame(seq, chunk);

    while (!chunk.empty()) {
        if (!should_skip(seq) && !xmit(link, pkt)) return false;

        timer.arm();
        DrtpPacket ack;
        RecvStatus rs = await_ack(link, timer, ack);
        if (rs == RecvStatus::Error) return false;
        if (rs == RecvStatus::Timeout) {
            ++st.timeouts;
            std::cerr << "Resending packet! seq=" << seq << "\n";
            continue;
        }

        // Anything but ack == seq + 1 means resend the same packet now.
        if (ack.ack != seq + 1) continue;

        conn.ack = ack.ack;
        if (!next_chunk(src, chunk)) return false;
        ++seq;
        conn.seq = seq;
        if (!chunk.empty()) pkt = frame(seq, chunk);
    }
    return true;
}

bool GoBackNSender::run(DrtpConnection& conn, DatagramTransport& link, ByteSource& src) {
    RetransmitTimer timer(std::chrono::milliseconds(A.data_timeout_ms));
    SendWindow window;
    window.next_seq = conn.seq;

    Bytes chunk;
    if (!next_chunk(src, chunk)) return false;

    while (!chunk.empty() || !window.packets.empty()) {
        while (!chunk.empty() && window.packets.size() < A.window_size) {
            window.packets.push_back(frame(window.next_seq, chunk));
            ++window.next_seq;
            if (!next_chunk(src, chunk)) return false;
        }
        conn.seq = window.next_seq;

        for (auto& p : window.packets) {
            if (should_skip(drtp_peek_seq(p))) continue;
            if (!xmit(link, p)) return false;
        }

        timer.arm();
        const size_t in_flight = window.packets.size();
        for (size_t i = 0; i < in_flight; ++i) {
            DrtpPacket ack;
            RecvStatus rs = await_ack(link, timer, ack);
            if (rs == RecvStatus::Error) return false;
            if (rs == RecvStatus::Timeout) {
                ++st.timeouts;
                std::cerr << "Resending packet! window base=" << window.base()
                          << " size=" << window.packets.size() << "\n";
                break;
            }

            if (!window.packets.empty() && ack.ack == window.expected_ack()) {
                window.packets.pop_front();
                conn.ack = ack.ack;
            }
        }
    }
    return true;
}

bool SelectiveRepeatSender::run(DrtpConnection& conn, DatagramTransport& link, ByteSource& src) {
    RetransmitTimer timer(std::chrono::milliseconds(A.data_timeout_ms));
    AckTable table;
    table.start_seq = conn.seq;
    table.end_seq = conn.seq;

    Bytes chunk;
    if (!next_chunk(src, chunk)) return false;

    while (!chunk.empty() || !table.entries.empty()) {
        while (!chunk.empty() && table.entries.size() < A.window_size) {
            table.entries.push_back({frame(table.end_seq, chunk), false});
            ++table.end_seq;
            if (!next_chunk(src, chunk)) return false;
        }
        conn.seq = table.end_seq;

        for (auto& e : table.entries) {
            if (e.acked) continue;
            if (should_skip(drtp_peek_seq(e.packet))) continue;
            if (!xmit(link, e.packet)) return false;
        }

        timer.arm();
        while (table.unacked() > 0) {
            DrtpPacket ack;
            RecvStatus rs = await_ack(link, timer, ack);
            if (rs == RecvStatus::Error) return false;
            if (rs == RecvStatus::Timeout) {
                ++st.timeouts;
                std::cerr << "Timeout: " << table.unacked() << " unacked in window starting at "
                          << table.start_seq << " -> resend those\n";
                break;
            }

            if (!table.accepts(ack.ack)) continue;
            if (!table.mark(ack.ack)) {
                std::cerr << "ACK " << ack.ack << " passes window test but has no slot (end="
                          << table.end_seq << ")\n";
            }
        }

        if (table.slide() > 0) conn.ack = table.start_seq;
    }
    return true;
}

std::unique_ptr<ArqSender> make_sender(const DrtpConfig& cfg) {
    switch (cfg.strategy()) {
        case Reliability::StopAndWait: return std::make_unique<StopAndWaitSender>(cfg);
        case Reliability::GoBackN: return std::make_unique<GoBackNSender>(cfg);
        case Reliability::SelectiveRepeat: return std::make_unique<SelectiveRepeatSender>(cfg);
    }
    return nullptr;
}
