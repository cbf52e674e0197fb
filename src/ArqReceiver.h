#pragma once

#include "DrtpConfig.h"
#include "drtp_connection.h"
#include "drtp_protocol.h"
#include "drtp_stream.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>

struct ReceiverStats {
    uint32_t delivered = 0;       // packets written to the sink
    uint64_t bytes = 0;           // payload bytes written
    uint32_t buffered = 0;        // packets stored ahead of the expected seq
    uint32_t duplicates = 0;      // packets below the expected seq, re-ACKed
    uint32_t dropped = 0;         // out-of-window packets and withheld ACKs
};

// One ARQ strategy's receiving half. conn.ack is the next expected seq.
class ArqReceiver {
public:
    explicit ArqReceiver(const DrtpConfig& cfg);
    virtual ~ArqReceiver() = default;

    ArqReceiver(const ArqReceiver&) = delete;
    ArqReceiver& operator=(const ArqReceiver&) = delete;

    virtual Reliability kind() const = 0;

    // Handles one data packet. ack_out is set to the ack number to send back,
    // or left empty when no ACK goes out. False if the sink fails.
    virtual bool on_data(DrtpConnection& conn, const DrtpPacket& pkt, ByteSink& sink,
                         std::optional<uint32_t>& ack_out) = 0;

    const ReceiverStats& stats() const { return st; }

protected:
    // skip_ack hook: true exactly once, when the expected seq reaches the
    // configured point.
    bool withhold_ack(const DrtpConnection& conn);

    bool deliver(DrtpConnection& conn, const Bytes& payload, ByteSink& sink);

protected:
    const DrtpConfig& A;
    ReceiverStats st;

private:
    bool skipped = false;
};

// Accepts only the next expected seq; shared by Stop-and-Wait and Go-Back-N.
class InOrderReceiver : public ArqReceiver {
public:
    explicit InOrderReceiver(const DrtpConfig& cfg) : ArqReceiver(cfg) {}
    bool on_data(DrtpConnection& conn, const DrtpPacket& pkt, ByteSink& sink,
                 std::optional<uint32_t>& ack_out) override;
};

class StopAndWaitReceiver : public InOrderReceiver {
public:
    using InOrderReceiver::InOrderReceiver;
    Reliability kind() const override { return Reliability::StopAndWait; }
};

class GoBackNReceiver : public InOrderReceiver {
public:
    using InOrderReceiver::InOrderReceiver;
    Reliability kind() const override { return Reliability::GoBackN; }
};

// Window-sized reassembly buffer; slot i holds seq expected + i.
class SelectiveRepeatReceiver : public ArqReceiver {
public:
    explicit SelectiveRepeatReceiver(const DrtpConfig& cfg);
    Reliability kind() const override { return Reliability::SelectiveRepeat; }
    bool on_data(DrtpConnection& conn, const DrtpPacket& pkt, ByteSink& sink,
                 std::optional<uint32_t>& ack_out) override;

    // Packets currently held out of order.
    size_t pending() const;

private:
    std::deque<std::optional<Bytes>> buffer;
};

std::unique_ptr<ArqReceiver> make_receiver(const DrtpConfig& cfg);
