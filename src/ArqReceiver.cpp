#include "ArqReceiver.h"

#include <iostream>

ArqReceiver::ArqReceiver(const DrtpConfig& cfg) : A(cfg) {}

bool ArqReceiver::withhold_ack(const DrtpConnection& conn) {
    if (A.fault != FaultMode::SkipAck || skipped || conn.ack != A.skip_ack_at) return false;
    skipped = true;
    std::cerr << "Skipping ACK (expected seq=" << conn.ack << ")\n";
    return true;
}

bool ArqReceiver::deliver(DrtpConnection& conn, const Bytes& payload, ByteSink& sink) {
    if (!sink.write(payload)) return false;
    std::cerr << "DATA seq=" << conn.ack << " len=" << payload.size() << " delivered\n";
    ++st.delivered;
    st.bytes += payload.size();
    ++conn.ack;
    return true;
}

bool InOrderReceiver::on_data(DrtpConnection& conn, const DrtpPacket& pkt, ByteSink& sink,
                              std::optional<uint32_t>& ack_out) {
    ack_out.reset();

    if (pkt.seq == conn.ack) {
        if (withhold_ack(conn)) {
            // Not consumed either: the sender's timeout brings it back.
            ++st.dropped;
            return true;
        }
        if (!deliver(conn, pkt.payload, sink)) return false;
        ack_out = conn.ack;
        return true;
    }

    if (pkt.seq < conn.ack) {
        // Already delivered; its ACK was lost. Repeat it, write nothing.
        ++st.duplicates;
        ack_out = pkt.seq + 1;
        std::cerr << "Duplicate DATA seq=" << pkt.seq << " -> re-ACK\n";
        return true;
    }

    ++st.dropped;
    std::cerr << "Out-of-order DATA seq=" << pkt.seq
              << " (expected " << conn.ack << ") -> ignoring (no ACK)\n";
    return true;
}

SelectiveRepeatReceiver::SelectiveRepeatReceiver(const DrtpConfig& cfg)
    : ArqReceiver(cfg), buffer(cfg.window_size) {}

size_t SelectiveRepeatReceiver::pending() const {
    size_t n = 0;
    for (auto& slot : buffer) {
        if (slot) ++n;
    }
    return n;
}

bool SelectiveRepeatReceiver::on_data(DrtpConnection& conn, const DrtpPacket& pkt, ByteSink& sink,
                                      std::optional<uint32_t>& ack_out) {
    ack_out.reset();
    const uint32_t expected = conn.ack;

    if (pkt.seq < expected) {
        ++st.duplicates;
        ack_out = pkt.seq + 1;
        std::cerr << "Duplicate DATA seq=" << pkt.seq << " -> re-ACK\n";
        return true;
    }
    if (pkt.seq - expected >= buffer.size()) {
        ++st.dropped;
        std::cerr << "DATA seq=" << pkt.seq << " outside window [" << expected << ", "
                  << expected + buffer.size() << ") -> ignoring\n";
        return true;
    }

    auto& slot = buffer[pkt.seq - expected];
    if (!slot && pkt.seq != expected) ++st.buffered;
    slot = pkt.payload;

    if (withhold_ack(conn)) {
        ++st.dropped;
        return true;
    }
    ack_out = pkt.seq + 1;

    while (!buffer.empty() && buffer.front()) {
        Bytes payload = std::move(*buffer.front());
        buffer.pop_front();
        buffer.emplace_back();
        if (!deliver(conn, payload, sink)) return false;
    }
    return true;
}

std::unique_ptr<ArqReceiver> make_receiver(const DrtpConfig& cfg) {
    switch (cfg.strategy()) {
        case Reliability::StopAndWait: return std::make_unique<StopAndWaitReceiver>(cfg);
        case Reliability::GoBackN: return std::make_unique<GoBackNReceiver>(cfg);
        case Reliability::SelectiveRepeat: return std::make_unique<SelectiveRepeatReceiver>(cfg);
    }
    return nullptr;
}
