#pragma once

#include "drtp_protocol.h"

#include <cstdint>

enum class ConnState {
    CLOSED,
    SYN_SENT,       // client: SYN out, waiting for SYN-ACK
    SYN_RECEIVED,   // server: SYN-ACK out, waiting for ACK or data
    ESTABLISHED,
    FIN_WAIT,       // client: FIN out, waiting for the final ACK
    CLOSING,        // server: FIN seen, final ACK going out
};

const char* to_string(ConnState s);

// Per-role connection state. Only the handshake and ARQ engines of the owning
// role touch it.
struct DrtpConnection {
    ConnState state = ConnState::CLOSED;
    uint32_t seq = 0;            // client: next data seq to frame; server: seq stamped on ACKs
    uint32_t ack = 0;            // client: last ack number accepted; server: next expected seq
    uint16_t peer_window = 0;    // window advertised by the peer (informational)

    bool established() const { return state == ConnState::ESTABLISHED; }
};
