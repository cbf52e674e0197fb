#pragma once

#include "DrtpConfig.h"
#include "DrtpTransport.h"
#include "drtp_connection.h"
#include "drtp_protocol.h"
#include "drtp_stream.h"
#include "drtp_timer.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>

struct SenderStats {
    uint64_t bytes = 0;           // payload bytes taken from the source
    uint32_t data_packets = 0;    // distinct data packets framed
    uint32_t transmissions = 0;   // datagrams put on the wire
    uint32_t retransmissions = 0; // transmissions of an already-sent seq
    uint32_t timeouts = 0;        // expired wait-for-ACK cycles
};

// Go-Back-N window: in-flight packets, oldest first.
struct SendWindow {
    std::deque<Bytes> packets;
    uint32_t next_seq = 1;        // seq the next framed packet gets

    uint32_t base() const { return next_seq - (uint32_t)packets.size(); }

    // The cumulative ACK that releases the oldest packet.
    uint32_t expected_ack() const { return next_seq + 1 - (uint32_t)packets.size(); }
};

// Selective-Repeat send table: (packet, acked) slots for
// [start_seq, end_seq), indexed by seq - start_seq.
struct AckTable {
    struct Entry {
        Bytes packet;
        bool acked = false;
    };

    std::deque<Entry> entries;
    uint32_t start_seq = 1;       // seq of entries.front()
    uint32_t end_seq = 1;         // next seq to assign

    size_t unacked() const;

    // Observed acceptance test: start_seq < ack <= end_seq + 1. The upper
    // bound admits ack == end_seq + 1, which has no slot.
    bool accepts(uint32_t ack) const { return ack > start_seq && ack <= end_seq + 1; }

    // Marks the entry for seq ack - 1. False when that seq has no slot.
    bool mark(uint32_t ack);

    // Drops the run of acked entries at the head. Returns how many.
    size_t slide();
};

// One ARQ strategy's sending half. run() frames the whole source into data
// packets starting at conn.seq and returns once every packet is acknowledged.
class ArqSender {
public:
    explicit ArqSender(const DrtpConfig& cfg);
    virtual ~ArqSender() = default;

    ArqSender(const ArqSender&) = delete;
    ArqSender& operator=(const ArqSender&) = delete;

    virtual Reliability kind() const = 0;

    // False on a transport or source error. Timeouts never fail the run.
    virtual bool run(DrtpConnection& conn, DatagramTransport& link, ByteSource& src) = 0;

    const SenderStats& stats() const { return st; }

protected:
    Bytes frame(uint32_t seq, const Bytes& chunk);
    bool next_chunk(ByteSource& src, Bytes& chunk);
    bool xmit(DatagramTransport& link, const Bytes& pkt);

    // skip_seq hook: true exactly once, for the configured seq.
    bool should_skip(uint32_t seq);

    // Waits within the current timer cycle for the next well-formed ACK.
    // Malformed and non-ACK datagrams are dropped.
    RecvStatus await_ack(DatagramTransport& link, const RetransmitTimer& timer, DrtpPacket& out);

protected:
    const DrtpConfig& A;
    SenderStats st;

private:
    bool skipped = false;
    bool sent_any = false;
    uint32_t highest_sent = 0;
};

class StopAndWaitSender : public ArqSender {
public:
    using ArqSender::ArqSender;
    Reliability kind() const override { return Reliability::StopAndWait; }
    bool run(DrtpConnection& conn, DatagramTransport& link, ByteSource& src) override;
};

class GoBackNSender : public ArqSender {
public:
    using ArqSender::ArqSender;
    Reliability kind() const override { return Reliability::GoBackN; }
    bool run(DrtpConnection& conn, DatagramTransport& link, ByteSource& src) override;
};

class SelectiveRepeatSender : public ArqSender {
public:
    using ArqSender::ArqSender;
    Reliability kind() const override { return Reliability::SelectiveRepeat; }
    bool run(DrtpConnection& conn, DatagramTransport& link, ByteSource& src) override;
};

std::unique_ptr<ArqSender> make_sender(const DrtpConfig& cfg);
